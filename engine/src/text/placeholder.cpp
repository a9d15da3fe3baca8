// engine/src/text/placeholder.cpp
#include <backfill/text/Placeholder.hpp>

#include <cctype>


namespace backfill::text {

    namespace {

        bool is_digit(char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        bool is_ident_start(char c) {
            return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
        }

        bool is_ident_cont(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        size_t skip_ident(std::string_view s, size_t i) {
            if (i >= s.size() || !is_ident_start(s[i])) return std::string_view::npos;
            ++i;
            while (i < s.size() && is_ident_cont(s[i])) ++i;
            return i;
        }

        size_t skip_digits(std::string_view s, size_t i) {
            while (i < s.size() && is_digit(s[i])) ++i;
            return i;
        }

        // [name]
        size_t match_square(std::string_view s, size_t i) {
            if (s[i] != '[') return 0;
            const size_t e = skip_ident(s, i + 1);
            if (e == std::string_view::npos || e >= s.size() || s[e] != ']') return 0;
            return e + 1 - i;
        }

        // %s %d %02d %(name)s %.2f ...
        size_t match_percent(std::string_view s, size_t i) {
            if (s[i] != '%') return 0;
            size_t j = i + 1;

            if (j < s.size() && s[j] == '(') {
                size_t k = j + 1;
                while (k < s.size() && s[k] != ')') ++k;
                if (k >= s.size() || k == j + 1) return 0;
                j = k + 1;
            }

            if (j < s.size() && (s[j] == '+' || s[j] == '#' || s[j] == '0' || s[j] == '-' || s[j] == ' ')) ++j;
            j = skip_digits(s, j);

            if (j < s.size() && s[j] == '.') {
                const size_t k = skip_digits(s, j + 1);
                if (k > j + 1) j = k;
            }

            if (j >= s.size()) return 0;
            constexpr std::string_view conv = "sdifeEgGxXo";
            if (conv.find(s[j]) == std::string_view::npos) return 0;
            return j + 1 - i;
        }

        // {0} {0:.2f} {name} {name!r:>8}
        size_t match_brace(std::string_view s, size_t i, bool named) {
            if (s[i] != '{') return 0;
            size_t j = i + 1;

            if (named) {
                const size_t e = skip_ident(s, j);
                if (e == std::string_view::npos) return 0;
                const std::string_view name = s.substr(j, e - j);
                if (is_renpy_single_tag(name) || is_renpy_paired_tag(name)) return 0;
                j = e;
            } else {
                const size_t e = skip_digits(s, j);
                if (e == j) return 0;
                j = e;
            }

            if (j + 1 < s.size() && s[j] == '!' &&
                (s[j + 1] == 'r' || s[j + 1] == 's' || s[j + 1] == 'a')) {
                j += 2;
            }

            if (j < s.size() && s[j] == ':') {
                size_t k = j + 1;
                while (k < s.size() && s[k] != '{' && s[k] != '}') ++k;
                if (k == j + 1) return 0;
                j = k;
            }

            if (j >= s.size() || s[j] != '}') return 0;
            return j + 1 - i;
        }

        bool is_escaped_brace(std::string_view s, size_t a, size_t b) {
            const bool left = a > 0 && s[a - 1] == '{';
            const bool right = b < s.size() && s[b] == '}';
            return left || right;
        }

        template <typename Matcher>
        void collect(std::string_view s, Matcher m, bool brace, std::vector<std::string>& out) {
            size_t i = 0;
            while (i < s.size()) {
                const size_t n = m(s, i);
                if (n == 0) {
                    ++i;
                    continue;
                }
                if (!(brace && is_escaped_brace(s, i, i + n))) {
                    out.emplace_back(s.substr(i, n));
                }
                i += n;
            }
        }

    } // namespace

    bool is_renpy_single_tag(std::string_view name) {
        return name == "w" || name == "nw" || name == "p" || name == "fast" || name == "k";
    }

    bool is_renpy_paired_tag(std::string_view name) {
        return name == "i" || name == "b" || name == "u" || name == "color" ||
               name == "a" || name == "size" || name == "font" || name == "alpha";
    }

    std::vector<std::string> placeholders(std::string_view s) {
        std::vector<std::string> out;
        collect(s, match_square, false, out);
        collect(s, match_percent, false, out);
        collect(s, [](std::string_view x, size_t i) { return match_brace(x, i, false); }, true, out);
        collect(s, [](std::string_view x, size_t i) { return match_brace(x, i, true); }, true, out);
        return out;
    }

    std::set<std::string> placeholder_set(std::string_view s) {
        const auto v = placeholders(s);
        return std::set<std::string>(v.begin(), v.end());
    }

    bool placeholders_match(std::string_view original, std::string_view translated) {
        return placeholder_set(original) == placeholder_set(translated);
    }

    std::string render_placeholder_set(const std::set<std::string>& set) {
        std::string out = "[";
        bool first = true;
        for (const auto& p : set) {
            if (!first) out += ", ";
            first = false;
            out += '\'';
            out += p;
            out += '\'';
        }
        out += ']';
        return out;
    }

} // namespace backfill::text
