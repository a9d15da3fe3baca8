// tools/backfillc/src/records/Records.cpp
#include <backfillc/records/Records.hpp>
#include <backfillc/records/Json.hpp>
#include <backfillc/os/File.hpp>

#include <initializer_list>
#include <limits>
#include <optional>
#include <unordered_map>


namespace backfillc::records {

    using backfill::diag::Code;
    using backfill::diag::Severity;

    namespace {

        // line / idx hints wider than uint32 are dropped, not wrapped
        constexpr int64_t k_max_hint = std::numeric_limits<uint32_t>::max();

        bool is_blank(std::string_view s) {
            for (char c : s) {
                if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\f' && c != '\v') return false;
            }
            return true;
        }

        // string, or integral number rendered as decimal
        std::optional<std::string> as_text(const JsonValue* v) {
            if (const auto s = as_string(v)) return std::string(*s);
            if (v != nullptr && v->kind == JsonValue::Kind::kNumber) {
                if (const auto n = as_i64(v)) return std::to_string(*n);
            }
            return std::nullopt;
        }

        std::string record_id(const JsonValue& obj) {
            for (std::string_view key : {"id", "id_hash"}) {
                if (const auto t = as_text(obj_get(obj, key)); t && !t->empty()) return *t;
            }

            const auto file = as_text(obj_get(obj, "file"));
            const auto line = as_text(obj_get(obj, "line"));
            const auto idx = as_text(obj_get(obj, "idx"));
            if (file && line && idx) return *file + ":" + *line + ":" + *idx;
            return {};
        }

        std::optional<std::string> record_translation(const JsonValue& obj) {
            for (std::string_view key : k_translation_keys) {
                const auto s = as_string(obj_get(obj, key));
                if (s && !is_blank(*s)) return std::string(*s);
            }
            return std::nullopt;
        }

    } // namespace

    RecordSet parse_records(std::string_view text, std::string_view origin, backfill::diag::Bag& bag) {
        RecordSet out;
        std::unordered_map<std::string, size_t> by_id;

        // UTF-8 BOM
        if (text.substr(0, 3) == "\xEF\xBB\xBF") text.remove_prefix(3);

        std::vector<std::string_view> lines;
        size_t b = 0;
        while (b < text.size()) {
            size_t e = text.find('\n', b);
            if (e == std::string_view::npos) e = text.size();
            lines.push_back(text.substr(b, e - b));
            b = e + 1;
        }

        for (size_t i = 0; i < lines.size(); ++i) {
            const std::string_view line = lines[i];
            const uint32_t line_no = static_cast<uint32_t>(i + 1);
            if (is_blank(line)) continue;
            ++out.lines_read;

            JsonValue obj{};
            JsonParser parser(line);
            if (!parser.parse(obj) || obj.kind != JsonValue::Kind::kObject) {
                ++out.bad_json;
                bag.add(Severity::kWarning, Code::kBadJsonLine, std::string(origin), line_no,
                        "bad JSON line skipped (offset " + std::to_string(parser.error_offset()) + ")");
                continue;
            }

            Record rec;
            rec.unit.id = record_id(obj);
            if (rec.unit.id.empty()) {
                ++out.missing_id;
                bag.add(Severity::kWarning, Code::kRecordMissingId, std::string(origin), line_no,
                        "record without id skipped");
                continue;
            }

            auto zh = record_translation(obj);
            if (!zh) {
                ++out.missing_translation;
                continue;
            }
            rec.unit.translated_text = std::move(*zh);

            if (const auto en = as_string(obj_get(obj, "en"))) rec.unit.original_text = std::string(*en);
            if (const auto f = as_string(obj_get(obj, "file"))) rec.file = std::string(*f);
            if (const auto ln = as_i64(obj_get(obj, "line")); ln && *ln >= 1 && *ln <= k_max_hint) {
                rec.unit.line_hint = static_cast<uint32_t>(*ln);
            }
            if (const auto ix = as_i64(obj_get(obj, "idx")); ix && *ix >= 0 && *ix <= k_max_hint) {
                rec.unit.index_hint = static_cast<uint32_t>(*ix);
            }
            if (const auto a = as_string(obj_get(obj, "anchor_prev"))) rec.unit.anchor_prev = std::string(*a);
            if (const auto a = as_string(obj_get(obj, "anchor_next"))) rec.unit.anchor_next = std::string(*a);

            const auto it = by_id.find(rec.unit.id);
            if (it != by_id.end()) {
                out.records[it->second] = std::move(rec);
            } else {
                by_id.emplace(rec.unit.id, out.records.size());
                out.records.push_back(std::move(rec));
            }
        }

        if (out.missing_translation != 0) {
            bag.add(Severity::kWarning, Code::kRecordMissingTranslation, std::string(origin), 0,
                    std::to_string(out.missing_translation) + " record(s) without a translation skipped");
        }
        return out;
    }

    bool load_records(const std::filesystem::path& path, RecordSet& out, backfill::diag::Bag& bag) {
        std::string text;
        std::string err;
        if (!os::read_file(path, text, err)) {
            bag.add(Severity::kError, Code::kFileReadFailed, path.string(), 0, err);
            return false;
        }
        out = parse_records(text, path.string(), bag);
        return true;
    }

    bool belongs_to(const Record& r, std::string_view rel) {
        const std::string_view id = r.unit.id;
        if (id.size() > rel.size() && id.substr(0, rel.size()) == rel && id[rel.size()] == ':') return true;
        return r.file == rel;
    }

    std::vector<backfill::match::TranslationUnit> units_for_file(const RecordSet& set, std::string_view rel) {
        std::vector<backfill::match::TranslationUnit> out;
        for (const auto& r : set.records) {
            if (belongs_to(r, rel)) out.push_back(r.unit);
        }
        return out;
    }

} // namespace backfillc::records
