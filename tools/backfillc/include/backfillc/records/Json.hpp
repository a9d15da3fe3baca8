// tools/backfillc/include/backfillc/records/Json.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace backfillc::records {

    struct JsonValue {
        enum class Kind : uint8_t {
            kNull,
            kBool,
            kNumber,
            kString,
            kArray,
            kObject,
        };

        Kind kind = Kind::kNull;
        bool bool_v = false;
        double number_v = 0.0;
        std::string string_v{};
        std::vector<JsonValue> array_v{};
        std::unordered_map<std::string, JsonValue> object_v{};
    };

    /// @brief Strict single-document JSON parser (one JSONL line at a time).
    class JsonParser {
    public:
        explicit JsonParser(std::string_view src) : src_(src) {}

        bool parse(JsonValue& out);

        // byte offset where parsing stopped (meaningful after a failure)
        size_t error_offset() const {  return pos_;  }

    private:
        bool parse_value_(JsonValue& out);
        bool parse_null_(JsonValue& out);
        bool parse_bool_(JsonValue& out);
        bool parse_number_(JsonValue& out);
        bool parse_string_value_(JsonValue& out);
        bool parse_string_(std::string& out);
        bool parse_hex4_(uint32_t& cp);
        bool parse_array_(JsonValue& out);
        bool parse_object_(JsonValue& out);

        bool consume_literal_(std::string_view lit);
        void skip_ws_();
        bool fail_();

        std::string_view src_{};
        size_t pos_ = 0;
        bool ok_ = true;
        uint32_t depth_ = 0;
    };

    const JsonValue* obj_get(const JsonValue& obj, std::string_view key);
    std::optional<std::string_view> as_string(const JsonValue* v);

    /// @brief Integral numbers, or strings holding a decimal integer.
    std::optional<int64_t> as_i64(const JsonValue* v);

} // namespace backfillc::records
