// tools/backfillc/src/config/TomlLite.cpp
#include <backfillc/config/TomlLite.hpp>
#include <backfillc/os/File.hpp>

#include <cctype>
#include <charconv>


namespace backfillc::config::toml_lite {

    namespace {

        bool is_key_char(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
        }

        /// @brief Line-oriented cursor over one config document.
        /// @details Every `read_*` leaves `pos_` after what it consumed and sets `err_` on failure.
        class Reader {
        public:
            Reader(std::string_view text, std::string_view origin)
                : text_(text), origin_(origin) {}

            bool run(FlatMap& out, std::vector<std::string>& warnings, std::string& err) {
                while (!eof()) {
                    ++line_;
                    skip_inline_space();
                    if (at_line_end()) {
                        if (!finish_line()) return fail(err);
                        continue;
                    }

                    if (peek() == '[') {
                        if (!read_header()) return fail(err);
                    } else {
                        std::string key;
                        Value value;
                        if (!read_pair(key, value)) return fail(err);

                        const std::string fq = section_.empty() ? key : section_ + "." + key;
                        if (out.contains(fq)) {
                            warnings.push_back(where() + "duplicate key '" + fq + "', later value wins");
                        }
                        out[fq] = std::move(value);
                    }
                    if (!finish_line()) return fail(err);
                }
                return true;
            }

        private:
            bool eof() const { return pos_ >= text_.size(); }
            char peek() const { return eof() ? '\0' : text_[pos_]; }

            bool at_line_end() const {
                const char c = peek();
                return eof() || c == '\n' || c == '\r' || c == '#';
            }

            void skip_inline_space() {
                while (!eof() && (peek() == ' ' || peek() == '\t')) ++pos_;
            }

            std::string where() const {
                return std::string(origin_) + ":" + std::to_string(line_) + ": ";
            }

            bool error(std::string msg) {
                err_ = where() + std::move(msg);
                return false;
            }

            bool fail(std::string& err) {
                err = err_;
                return false;
            }

            // trailing blanks, an optional comment, then the line break
            bool finish_line() {
                skip_inline_space();
                if (peek() == '#') {
                    while (!eof() && peek() != '\n') ++pos_;
                }
                if (peek() == '\r') ++pos_;
                if (eof()) return true;
                if (peek() != '\n') return error("unexpected text after value");
                ++pos_;
                return true;
            }

            bool read_key(std::string& out) {
                const size_t start = pos_;
                while (!eof() && is_key_char(peek())) ++pos_;
                out.assign(text_.substr(start, pos_ - start));
                return !out.empty();
            }

            bool read_header() {
                ++pos_; // '['
                skip_inline_space();
                std::string name;
                if (!read_key(name)) return error("invalid section name");
                skip_inline_space();
                if (peek() != ']') return error("invalid section header");
                ++pos_;
                section_ = std::move(name);
                return true;
            }

            bool read_pair(std::string& key, Value& value) {
                if (!read_key(key)) return error("invalid key");
                skip_inline_space();
                if (peek() != '=') return error("expected '='");
                ++pos_;
                skip_inline_space();
                return read_value(value);
            }

            bool read_value(Value& out) {
                const char c = peek();
                if (c == '"') {
                    std::string s;
                    if (!read_string(s)) return false;
                    out = std::move(s);
                    return true;
                }
                if (c == '[') {
                    std::vector<std::string> items;
                    if (!read_string_array(items)) return false;
                    out = std::move(items);
                    return true;
                }
                if (read_word("true")) {
                    out = true;
                    return true;
                }
                if (read_word("false")) {
                    out = false;
                    return true;
                }
                int64_t n = 0;
                if (read_integer(n)) {
                    out = n;
                    return true;
                }
                if (at_line_end()) return error("empty value");
                return error("unsupported value");
            }

            bool read_word(std::string_view w) {
                if (text_.substr(pos_, w.size()) != w) return false;
                const size_t end = pos_ + w.size();
                if (end < text_.size() && is_key_char(text_[end])) return false;
                pos_ = end;
                return true;
            }

            bool read_integer(int64_t& out) {
                size_t p = pos_;
                if (p < text_.size() && text_[p] == '+') ++p;
                const char* first = text_.data() + p;
                const char* last = text_.data() + text_.size();
                const auto [ptr, ec] = std::from_chars(first, last, out);
                if (ec != std::errc{} || ptr == first) return false;
                if (ptr != last && is_key_char(*ptr)) return false;
                pos_ = static_cast<size_t>(ptr - text_.data());
                return true;
            }

            bool read_string(std::string& out) {
                ++pos_; // opening quote
                while (!eof()) {
                    const char c = text_[pos_++];
                    if (c == '"') return true;
                    if (c == '\n') break;
                    if (c != '\\') {
                        out.push_back(c);
                        continue;
                    }
                    if (eof()) break;
                    const char e = text_[pos_++];
                    switch (e) {
                        case 'n': out.push_back('\n'); break;
                        case 'r': out.push_back('\r'); break;
                        case 't': out.push_back('\t'); break;
                        default: out.push_back(e); break;
                    }
                }
                return error("unterminated string");
            }

            // every setting that takes a list takes strings
            bool read_string_array(std::vector<std::string>& out) {
                ++pos_; // '['
                skip_inline_space();
                if (peek() == ']') {
                    ++pos_;
                    return true;
                }
                while (true) {
                    if (peek() != '"') return error("array items must be strings");
                    std::string item;
                    if (!read_string(item)) return false;
                    out.push_back(std::move(item));

                    skip_inline_space();
                    if (peek() == ',') {
                        ++pos_;
                        skip_inline_space();
                        if (peek() == ']') {
                            ++pos_;
                            return true;
                        }
                        continue;
                    }
                    if (peek() == ']') {
                        ++pos_;
                        return true;
                    }
                    return error("expected ',' or ']' in array");
                }
            }

            std::string_view text_;
            std::string_view origin_;
            size_t pos_ = 0;
            uint32_t line_ = 0;
            std::string section_{};
            std::string err_{};
        };

    } // namespace

    bool parse_text(std::string_view text,
                    std::string_view origin,
                    FlatMap& out,
                    std::vector<std::string>& warnings,
                    std::string& err) {
        out.clear();
        err.clear();
        Reader reader(text, origin);
        return reader.run(out, warnings, err);
    }

    bool parse_file(const std::filesystem::path& path,
                    FlatMap& out,
                    std::vector<std::string>& warnings,
                    std::string& err) {
        out.clear();
        err.clear();

        std::string text;
        if (!os::read_file(path, text, err)) return false;
        return parse_text(text, path.string(), out, warnings, err);
    }

} // namespace backfillc::config::toml_lite
