// tools/backfillc/src/records/Json.cpp
#include <backfillc/records/Json.hpp>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>


namespace backfillc::records {

    namespace {

        constexpr uint32_t k_max_depth = 64;

        void append_utf8(std::string& out, uint32_t cp) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
                return;
            }
            if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                return;
            }
            if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                return;
            }
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }

        int hex_value(char ch) {
            if (ch >= '0' && ch <= '9') return ch - '0';
            if (ch >= 'a' && ch <= 'f') return 10 + (ch - 'a');
            if (ch >= 'A' && ch <= 'F') return 10 + (ch - 'A');
            return -1;
        }

    } // namespace

    bool JsonParser::parse(JsonValue& out) {
        skip_ws_();
        if (!parse_value_(out)) return false;
        skip_ws_();
        if (pos_ != src_.size()) return fail_();
        return ok_;
    }

    bool JsonParser::parse_value_(JsonValue& out) {
        skip_ws_();
        if (pos_ >= src_.size()) return fail_();

        const char ch = src_[pos_];
        if (ch == 'n') return parse_null_(out);
        if (ch == 't' || ch == 'f') return parse_bool_(out);
        if (ch == '"') return parse_string_value_(out);
        if (ch == '[' || ch == '{') {
            if (++depth_ > k_max_depth) return fail_();
            const bool ok = (ch == '[') ? parse_array_(out) : parse_object_(out);
            --depth_;
            return ok;
        }
        if (ch == '-' || (ch >= '0' && ch <= '9')) return parse_number_(out);
        return fail_();
    }

    bool JsonParser::parse_null_(JsonValue& out) {
        if (!consume_literal_("null")) return false;
        out = JsonValue{};
        out.kind = JsonValue::Kind::kNull;
        return true;
    }

    bool JsonParser::parse_bool_(JsonValue& out) {
        if (src_.substr(pos_, 4) == "true") {
            pos_ += 4;
            out = JsonValue{};
            out.kind = JsonValue::Kind::kBool;
            out.bool_v = true;
            return true;
        }
        if (src_.substr(pos_, 5) == "false") {
            pos_ += 5;
            out = JsonValue{};
            out.kind = JsonValue::Kind::kBool;
            out.bool_v = false;
            return true;
        }
        return fail_();
    }

    bool JsonParser::parse_number_(JsonValue& out) {
        const size_t begin = pos_;
        if (src_[pos_] == '-') ++pos_;

        if (pos_ >= src_.size()) return fail_();
        if (src_[pos_] == '0') {
            ++pos_;
        } else {
            if (!std::isdigit(static_cast<unsigned char>(src_[pos_]))) return fail_();
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
        }

        if (pos_ < src_.size() && src_[pos_] == '.') {
            ++pos_;
            if (pos_ >= src_.size() || !std::isdigit(static_cast<unsigned char>(src_[pos_]))) return fail_();
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
        }

        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-')) ++pos_;
            if (pos_ >= src_.size() || !std::isdigit(static_cast<unsigned char>(src_[pos_]))) return fail_();
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
        }

        const std::string text(src_.substr(begin, pos_ - begin));
        char* endp = nullptr;
        const double v = std::strtod(text.c_str(), &endp);
        if (endp == text.c_str() || (endp != nullptr && *endp != '\0')) return fail_();

        out = JsonValue{};
        out.kind = JsonValue::Kind::kNumber;
        out.number_v = v;
        return true;
    }

    bool JsonParser::parse_string_value_(JsonValue& out) {
        std::string s;
        if (!parse_string_(s)) return false;
        out = JsonValue{};
        out.kind = JsonValue::Kind::kString;
        out.string_v = std::move(s);
        return true;
    }

    bool JsonParser::parse_hex4_(uint32_t& cp) {
        if (pos_ + 4 > src_.size()) return fail_();
        cp = 0;
        for (int i = 0; i < 4; ++i) {
            const int hv = hex_value(src_[pos_ + i]);
            if (hv < 0) return fail_();
            cp = (cp << 4) | static_cast<uint32_t>(hv);
        }
        pos_ += 4;
        return true;
    }

    bool JsonParser::parse_string_(std::string& out) {
        if (pos_ >= src_.size() || src_[pos_] != '"') return fail_();
        ++pos_;

        while (pos_ < src_.size()) {
            const char ch = src_[pos_++];
            if (ch == '"') return true;
            if (static_cast<unsigned char>(ch) < 0x20) return fail_();
            if (ch == '\\') {
                if (pos_ >= src_.size()) return fail_();
                const char esc = src_[pos_++];
                switch (esc) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        uint32_t cp = 0;
                        if (!parse_hex4_(cp)) return false;
                        // surrogate pair
                        if (cp >= 0xD800 && cp <= 0xDBFF) {
                            uint32_t lo = 0;
                            if (src_.substr(pos_, 2) != "\\u") return fail_();
                            pos_ += 2;
                            if (!parse_hex4_(lo)) return false;
                            if (lo < 0xDC00 || lo > 0xDFFF) return fail_();
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                            return fail_();
                        }
                        append_utf8(out, cp);
                        break;
                    }
                    default:
                        return fail_();
                }
                continue;
            }
            out.push_back(ch);
        }
        return fail_();
    }

    bool JsonParser::parse_array_(JsonValue& out) {
        if (pos_ >= src_.size() || src_[pos_] != '[') return fail_();
        ++pos_;

        out = JsonValue{};
        out.kind = JsonValue::Kind::kArray;

        skip_ws_();
        if (pos_ < src_.size() && src_[pos_] == ']') {
            ++pos_;
            return true;
        }

        while (pos_ < src_.size()) {
            JsonValue elem{};
            if (!parse_value_(elem)) return false;
            out.array_v.push_back(std::move(elem));

            skip_ws_();
            if (pos_ >= src_.size()) return fail_();
            if (src_[pos_] == ',') {
                ++pos_;
                skip_ws_();
                continue;
            }
            if (src_[pos_] == ']') {
                ++pos_;
                return true;
            }
            return fail_();
        }
        return fail_();
    }

    bool JsonParser::parse_object_(JsonValue& out) {
        if (pos_ >= src_.size() || src_[pos_] != '{') return fail_();
        ++pos_;

        out = JsonValue{};
        out.kind = JsonValue::Kind::kObject;

        skip_ws_();
        if (pos_ < src_.size() && src_[pos_] == '}') {
            ++pos_;
            return true;
        }

        while (pos_ < src_.size()) {
            std::string key;
            if (!parse_string_(key)) return false;

            skip_ws_();
            if (pos_ >= src_.size() || src_[pos_] != ':') return fail_();
            ++pos_;

            JsonValue val{};
            if (!parse_value_(val)) return false;
            // later duplicates win
            out.object_v.insert_or_assign(std::move(key), std::move(val));

            skip_ws_();
            if (pos_ >= src_.size()) return fail_();
            if (src_[pos_] == ',') {
                ++pos_;
                skip_ws_();
                continue;
            }
            if (src_[pos_] == '}') {
                ++pos_;
                return true;
            }
            return fail_();
        }
        return fail_();
    }

    bool JsonParser::consume_literal_(std::string_view lit) {
        if (src_.substr(pos_, lit.size()) != lit) return fail_();
        pos_ += lit.size();
        return true;
    }

    void JsonParser::skip_ws_() {
        while (pos_ < src_.size()) {
            const char ch = src_[pos_];
            if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') break;
            ++pos_;
        }
    }

    bool JsonParser::fail_() {
        ok_ = false;
        return false;
    }

    const JsonValue* obj_get(const JsonValue& obj, std::string_view key) {
        if (obj.kind != JsonValue::Kind::kObject) return nullptr;
        const auto it = obj.object_v.find(std::string(key));
        if (it == obj.object_v.end()) return nullptr;
        return &it->second;
    }

    std::optional<std::string_view> as_string(const JsonValue* v) {
        if (v == nullptr || v->kind != JsonValue::Kind::kString) return std::nullopt;
        return v->string_v;
    }

    std::optional<int64_t> as_i64(const JsonValue* v) {
        if (v == nullptr) return std::nullopt;
        if (v->kind == JsonValue::Kind::kNumber) {
            double ip = 0.0;
            if (std::modf(v->number_v, &ip) != 0.0) return std::nullopt;
            // [-2^63, 2^63): both bounds are exact doubles; NaN fails both
            constexpr double k_lo = -9223372036854775808.0;
            constexpr double k_hi = 9223372036854775808.0;
            if (!(ip >= k_lo && ip < k_hi)) return std::nullopt;
            return static_cast<int64_t>(ip);
        }
        if (v->kind == JsonValue::Kind::kString) {
            const std::string& s = v->string_v;
            const char* first = s.data() + ((!s.empty() && s[0] == '+') ? 1 : 0);
            const char* last = s.data() + s.size();
            if (first != last && first != s.data() && *first == '-') return std::nullopt;
            int64_t n = 0;
            const auto [ptr, ec] = std::from_chars(first, last, n);
            if (ec != std::errc{} || ptr != last || ptr == first) return std::nullopt;
            return n;
        }
        return std::nullopt;
    }

} // namespace backfillc::records
