// engine/src/text/signature.cpp
#include <backfill/text/Signature.hpp>
#include <backfill/text/Placeholder.hpp>

#include <cctype>


namespace backfill::text {

    namespace {

        bool is_ws(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        bool is_ident_start(char c) {
            return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
        }

        bool is_ident_cont(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        // `{name}` / `{name=...}` starting at i; returns end (one past '}') or 0.
        size_t match_open_tag(std::string_view s, size_t i, std::string_view& name) {
            size_t j = i + 1;
            if (j >= s.size() || !is_ident_start(s[j])) return 0;
            const size_t b = j;
            while (j < s.size() && is_ident_cont(s[j])) ++j;
            name = s.substr(b, j - b);

            if (j < s.size() && s[j] == '=') {
                while (j < s.size() && s[j] != '}') ++j;
            }
            if (j >= s.size() || s[j] != '}') return 0;
            return j + 1;
        }

        // `{/name}`
        size_t match_close_tag(std::string_view s, size_t i, std::string_view& name) {
            if (i + 1 >= s.size() || s[i + 1] != '/') return 0;
            size_t j = i + 2;
            if (j >= s.size() || !is_ident_start(s[j])) return 0;
            const size_t b = j;
            while (j < s.size() && is_ident_cont(s[j])) ++j;
            name = s.substr(b, j - b);
            if (j >= s.size() || s[j] != '}') return 0;
            return j + 1;
        }

    } // namespace

    std::string normalize_newlines(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\r') {
                out.push_back('\n');
                if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
                continue;
            }
            out.push_back(s[i]);
        }
        return out;
    }

    std::string strip_text_tags(std::string_view s) {
        std::string out;
        out.reserve(s.size());

        size_t i = 0;
        while (i < s.size()) {
            const char c = s[i];
            if (c == '{') {
                if (i + 1 < s.size() && s[i + 1] == '{') {
                    out.push_back('{');
                    i += 2;
                    continue;
                }

                std::string_view name;
                size_t e = match_open_tag(s, i, name);
                if (e != 0 && (is_renpy_single_tag(name) || is_renpy_paired_tag(name))) {
                    i = e;
                    continue;
                }
                e = match_close_tag(s, i, name);
                if (e != 0 && is_renpy_paired_tag(name)) {
                    i = e;
                    continue;
                }
            }
            out.push_back(c);
            ++i;
        }
        return out;
    }

    std::string normalize_for_signature(std::string_view s) {
        const std::string stripped = strip_text_tags(s);

        std::string out;
        out.reserve(stripped.size());
        bool pending_space = false;
        for (char c : stripped) {
            if (is_ws(c)) {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space) {
                out.push_back(' ');
                pending_space = false;
            }
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return out;
    }

    uint64_t fnv1a64(std::string_view s) {
        uint64_t h = 1469598103934665603ULL;
        for (unsigned char c : s) {
            h ^= c;
            h *= 1099511628211ULL;
        }
        return h;
    }

    std::string semantic_signature(std::string_view s) {
        static constexpr char k_hex[] = "0123456789abcdef";

        const uint64_t h = fnv1a64(normalize_for_signature(s));
        std::string out = "sig:v2:";
        // top 48 bits, most significant nibble first
        for (int shift = 60; shift >= 16; shift -= 4) {
            out.push_back(k_hex[(h >> shift) & 0xF]);
        }
        return out;
    }

} // namespace backfill::text
