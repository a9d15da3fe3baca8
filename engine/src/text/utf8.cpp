// engine/src/text/utf8.cpp
#include <backfill/text/Utf8.hpp>


namespace backfill::text {

    bool validate_utf8_strict(std::string_view s, uint32_t& bad_off) {
        const auto is_cont = [](unsigned char b) -> bool {
            return (b & 0xC0) == 0x80;
        };

        size_t i = 0;
        while (i < s.size()) {
            const unsigned char b0 = static_cast<unsigned char>(s[i]);

            if (b0 < 0x80) {
                i += 1;
                continue;
            }

            // 2-byte: C2..DF
            if (b0 >= 0xC2 && b0 <= 0xDF) {
                if (i + 1 >= s.size() || !is_cont(static_cast<unsigned char>(s[i + 1]))) break;
                i += 2;
                continue;
            }

            // 3-byte: E0..EF, no overlong, no surrogates
            if (b0 >= 0xE0 && b0 <= 0xEF) {
                if (i + 2 >= s.size()) break;
                const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
                const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
                if (!is_cont(b1) || !is_cont(b2)) break;
                if (b0 == 0xE0 && b1 < 0xA0) break;
                if (b0 == 0xED && b1 >= 0xA0) break;
                i += 3;
                continue;
            }

            // 4-byte: F0..F4, <= U+10FFFF
            if (b0 >= 0xF0 && b0 <= 0xF4) {
                if (i + 3 >= s.size()) break;
                const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
                const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
                const unsigned char b3 = static_cast<unsigned char>(s[i + 3]);
                if (!is_cont(b1) || !is_cont(b2) || !is_cont(b3)) break;
                if (b0 == 0xF0 && b1 < 0x90) break;
                if (b0 == 0xF4 && b1 > 0x8F) break;
                i += 4;
                continue;
            }

            break;
        }

        if (i < s.size()) {
            bad_off = static_cast<uint32_t>(i);
            return false;
        }
        return true;
    }

    bool utf8_decode_one(std::string_view s, uint32_t& i, uint32_t& cp) {
        if (i >= s.size()) return false;
        unsigned char c0 = static_cast<unsigned char>(s[i]);

        if (c0 < 0x80) {
            cp = c0;
            i += 1;
            return true;
        }

        auto cont = [&](uint32_t idx) -> bool {
            if (idx >= s.size()) return false;
            unsigned char cc = static_cast<unsigned char>(s[idx]);
            return (cc & 0xC0) == 0x80;
        };

        if ((c0 & 0xE0) == 0xC0) {
            if (!cont(i + 1)) { cp = 0xFFFD; i += 1; return false; }
            unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            cp = ((c0 & 0x1F) << 6) | (c1 & 0x3F);
            i += 2;
            return true;
        }

        if ((c0 & 0xF0) == 0xE0) {
            if (!cont(i + 1) || !cont(i + 2)) { cp = 0xFFFD; i += 1; return false; }
            unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
            cp = ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
            i += 3;
            return true;
        }

        if ((c0 & 0xF8) == 0xF0) {
            if (!cont(i + 1) || !cont(i + 2) || !cont(i + 3)) { cp = 0xFFFD; i += 1; return false; }
            unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
            unsigned char c3 = static_cast<unsigned char>(s[i + 3]);
            cp = ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
            i += 4;
            return true;
        }

        cp = 0xFFFD;
        i += 1;
        return false;
    }

    std::vector<uint32_t> decode_utf8(std::string_view s) {
        std::vector<uint32_t> out;
        out.reserve(s.size());

        uint32_t i = 0;
        while (i < s.size()) {
            uint32_t cp = 0;
            utf8_decode_one(s, i, cp);
            out.push_back(cp);
        }
        return out;
    }

} // namespace backfill::text
