// engine/include/backfill/text/Utf8.hpp
#pragma once
#include <cstdint>
#include <string_view>
#include <vector>


namespace backfill::text {

    // Strict UTF-8 validator.
    // Returns false and sets bad_off when an invalid byte sequence is found.
    bool validate_utf8_strict(std::string_view s, uint32_t& bad_off);

    // Decodes one code point at i and advances i. Invalid sequences yield U+FFFD and advance one byte.
    bool utf8_decode_one(std::string_view s, uint32_t& i, uint32_t& cp);

    std::vector<uint32_t> decode_utf8(std::string_view s);

} // namespace backfill::text
