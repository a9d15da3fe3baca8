// engine/src/patch/replacer.cpp
#include <backfill/patch/Replacer.hpp>


namespace backfill::patch {

    namespace {

        // an open literal has no closing quote for the backslash to swallow
        void finish_backslash(std::string& out, bool dangling, bool terminated) {
            if (dangling && terminated) out.push_back('\\');
        }

    } // namespace

    std::string escape_for_quote(std::string_view s, char q, bool terminated) {
        std::string out;
        out.reserve(s.size() + 8);

        size_t i = 0;
        bool dangling = false;
        while (i < s.size()) {
            const char c = s[i];
            if (c == '\n') {
                out += "\\n";
                ++i;
                continue;
            }
            if (c == '\r' && i + 1 < s.size() && s[i + 1] == '\n') {
                out += "\\r";
                ++i;
                continue;
            }
            if (c == '\\') {
                out.push_back(c);
                if (i + 1 < s.size() && (s[i + 1] == '\n' || s[i + 1] == '\r')) {
                    // backslash before a raw line break stays a literal backslash
                    out.push_back('\\');
                    i += 1;
                } else if (i + 1 < s.size()) {
                    out.push_back(s[i + 1]);
                    i += 2;
                } else {
                    dangling = true;
                    i += 1;
                }
                continue;
            }
            if (c == q) out.push_back('\\');
            out.push_back(c);
            ++i;
        }

        finish_backslash(out, dangling, terminated);
        return out;
    }

    std::string sanitize_triple(std::string_view s, char q, bool terminated) {
        std::string out;
        out.reserve(s.size() + 8);

        size_t i = 0;
        size_t run = 0;          // unescaped q seen in a row
        size_t tail_begin = 0;   // out offset where the current unescaped run starts
        bool dangling = false;
        while (i < s.size()) {
            const char c = s[i];
            if (c == '\\') {
                run = 0;
                out.push_back(c);
                if (i + 1 < s.size()) {
                    out.push_back(s[i + 1]);
                    i += 2;
                } else {
                    dangling = true;
                    i += 1;
                }
                continue;
            }
            if (c == q) {
                if (run == 0) tail_begin = out.size();
                ++run;
                if (run == 3) {
                    out.push_back('\\');
                    run = 0;
                }
                out.push_back(c);
                ++i;
                continue;
            }
            run = 0;
            out.push_back(c);
            ++i;
        }

        if (run > 0 && !dangling && terminated) {
            // unescaped q right before the closing delimiter
            std::string tail;
            for (size_t k = tail_begin; k < out.size(); ++k) {
                tail.push_back('\\');
                tail.push_back(out[k]);
            }
            out.replace(tail_begin, std::string::npos, tail);
        }

        finish_backslash(out, dangling, terminated);
        return out;
    }

    std::string quote_safe(std::string_view translated, QuoteStyle quote, bool terminated) {
        if (is_triple(quote)) return sanitize_triple(translated, quote_char(quote), terminated);
        return escape_for_quote(translated, quote_char(quote), terminated);
    }

    std::string splice(std::string_view text, const Token& tok, std::string_view body) {
        std::string out;
        out.reserve(text.size() - tok.inner.size() + body.size());
        out.append(text.substr(0, tok.inner.lo));
        out.append(body);
        out.append(text.substr(tok.inner.hi));
        return out;
    }

} // namespace backfill::patch
