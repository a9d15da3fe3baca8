// engine/include/backfill/text/Signature.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>


namespace backfill::text {

    /// @brief CRLF and lone CR become LF.
    std::string normalize_newlines(std::string_view s);

    /// @brief Removes Ren'Py text tags (`{w}`, `{color=#f00}`, `{/i}`...); `{{` collapses to `{`.
    std::string strip_text_tags(std::string_view s);

    /// @brief strip tags, fold whitespace, trim, ASCII lower-case.
    std::string normalize_for_signature(std::string_view s);

    uint64_t fnv1a64(std::string_view s);

    /// @brief `sig:v2:` + 12 hex digits; equal for texts differing only in tags, spacing or case.
    std::string semantic_signature(std::string_view s);

} // namespace backfill::text
