#include <backfillc/records/Json.hpp>
#include <backfillc/records/Records.hpp>
#include <backfillc/tl/StringsWriter.hpp>

#include <backfill/diag/DiagCode.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using backfill::diag::Code;
    namespace records = backfillc::records;
    namespace tl = backfillc::tl;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool test_json_parser_() {
        records::JsonValue v{};
        records::JsonParser p(R"({"s":"a\u00e9\ud83d\ude00","n":-12,"f":1.5,"b":true,"z":null,"a":[1,"x"]})");

        bool ok = true;
        ok &= require_(p.parse(v), "valid object parses");
        ok &= require_(records::as_string(records::obj_get(v, "s")) == std::string_view("a\xC3\xA9\xF0\x9F\x98\x80"),
                       "unicode escapes and surrogate pairs decode to UTF-8");
        ok &= require_(records::as_i64(records::obj_get(v, "n")) == -12, "integral number");
        ok &= require_(!records::as_i64(records::obj_get(v, "f")).has_value(), "fractional number is not an integer");
        ok &= require_(records::obj_get(v, "missing") == nullptr, "absent key");

        records::JsonValue bad{};
        records::JsonParser q(R"({"a":1,})");
        ok &= require_(!q.parse(bad), "trailing comma is rejected");

        records::JsonValue lone{};
        records::JsonParser r(R"({"a":"\udc00"})");
        ok &= require_(!r.parse(lone), "lone low surrogate is rejected");
        return ok;
    }

    static bool test_parse_records_fields_() {
        const std::string text =
            "\xEF\xBB\xBF"
            R"({"id":"game/a.rpy:3:0","en":"Hello","zh":"你好","file":"game/a.rpy","line":3,"idx":0,"anchor_prev":"label a:","anchor_next":"e \"x\""})" "\n"
            "\n"
            R"({"id_hash":"h1","en":"Bye","translation":"再见","line":"7"})" "\n";

        backfill::diag::Bag bag;
        const auto set = records::parse_records(text, "t.jsonl", bag);

        bool ok = true;
        ok &= require_(bag.diags().empty(), "no diagnostics for clean input");
        ok &= require_(set.lines_read == 2, "blank lines are not counted");
        ok &= require_(set.records.size() == 2, "two records");
        if (set.records.size() != 2) return false;

        const auto& a = set.records[0];
        ok &= require_(a.unit.id == "game/a.rpy:3:0", "id taken from id");
        ok &= require_(a.file == "game/a.rpy", "file field");
        ok &= require_(a.unit.original_text == "Hello" && a.unit.translated_text == "你好", "texts");
        ok &= require_(a.unit.line_hint == 3u && a.unit.index_hint == 0u, "hints");
        ok &= require_(a.unit.anchor_prev == "label a:" && a.unit.anchor_next == "e \"x\"", "anchors");

        const auto& b = set.records[1];
        ok &= require_(b.unit.id == "h1", "id_hash fallback");
        ok &= require_(b.unit.translated_text == "再见", "alternate translation key");
        ok &= require_(b.unit.line_hint == 7u, "numeric string line hint");
        ok &= require_(!b.unit.index_hint.has_value(), "absent index hint");
        return ok;
    }

    static bool test_parse_records_bad_lines_() {
        const std::string text =
            "not json\n"
            R"({"en":"no id","zh":"x"})" "\n"
            R"({"id":"k","en":"no translation","zh":"   "})" "\n"
            R"({"file":"f.rpy","line":1,"idx":2,"en":"composite","zh":"组合"})" "\n";

        backfill::diag::Bag bag;
        const auto set = records::parse_records(text, "t.jsonl", bag);

        bool ok = true;
        ok &= require_(set.bad_json == 1, "one bad JSON line");
        ok &= require_(set.missing_id == 1, "one record without id");
        ok &= require_(set.missing_translation == 1, "blank translation counts as missing");
        ok &= require_(set.records.size() == 1, "only the composite-id record survives");
        if (!set.records.empty()) {
            ok &= require_(set.records[0].unit.id == "f.rpy:1:2", "id composed from file:line:idx");
        }
        ok &= require_(bag.has_code(Code::kBadJsonLine), "bad JSON warning");
        ok &= require_(bag.has_code(Code::kRecordMissingId), "missing id warning");
        ok &= require_(bag.has_code(Code::kRecordMissingTranslation), "missing translation summary");
        ok &= require_(!bag.has_error(), "record problems are warnings only");
        if (!bag.diags().empty()) ok &= require_(bag.diags()[0].line == 1, "bad line number reported");
        return ok;
    }

    static bool test_out_of_range_numbers_() {
        records::JsonValue v{};
        records::JsonParser p(R"({"big":1e300,"neg":-1e300,"s":"99999999999999999999","ok":"+42","bad":"+-1"})");

        bool ok = true;
        ok &= require_(p.parse(v), "object parses");
        ok &= require_(!records::as_i64(records::obj_get(v, "big")).has_value(), "huge number is not an integer");
        ok &= require_(!records::as_i64(records::obj_get(v, "neg")).has_value(), "huge negative is not an integer");
        ok &= require_(!records::as_i64(records::obj_get(v, "s")).has_value(), "overflowing digit string is rejected");
        ok &= require_(records::as_i64(records::obj_get(v, "ok")) == 42, "leading plus is accepted");
        ok &= require_(!records::as_i64(records::obj_get(v, "bad")).has_value(), "double sign is rejected");

        const std::string text =
            R"({"id":"w","en":"a","zh":"b","line":4294967296,"idx":1e300})" "\n"
            R"({"id":"m","en":"a","zh":"b","line":4294967295,"idx":"4294967295"})" "\n";
        backfill::diag::Bag bag;
        const auto set = records::parse_records(text, "t.jsonl", bag);
        ok &= require_(set.records.size() == 2, "both records load");
        if (set.records.size() != 2) return false;
        ok &= require_(!set.records[0].unit.line_hint && !set.records[0].unit.index_hint, "hints past uint32 are dropped");
        ok &= require_(set.records[1].unit.line_hint == 4294967295u && set.records[1].unit.index_hint == 4294967295u,
                       "largest uint32 hint is kept");
        return ok;
    }

    static bool test_duplicate_id_replaces_() {
        const std::string text =
            R"({"id":"a","en":"x","zh":"first"})" "\n"
            R"({"id":"b","en":"y","zh":"other"})" "\n"
            R"({"id":"a","en":"x","zh":"second"})" "\n";

        backfill::diag::Bag bag;
        const auto set = records::parse_records(text, "t.jsonl", bag);

        bool ok = true;
        ok &= require_(set.records.size() == 2, "duplicate id does not add a record");
        if (set.records.size() == 2) {
            ok &= require_(set.records[0].unit.translated_text == "second", "later record wins in place");
            ok &= require_(set.records[1].unit.id == "b", "first-seen order kept");
        }
        return ok;
    }

    static bool test_records_for_file_() {
        records::RecordSet set;
        records::Record r1;
        r1.unit.id = "game/a.rpy:1:0";
        records::Record r2;
        r2.unit.id = "h2";
        r2.file = "game/a.rpy";
        records::Record r3;
        r3.unit.id = "game/a.rpyc:1:0";
        set.records = {r1, r2, r3};

        bool ok = true;
        ok &= require_(records::belongs_to(r1, "game/a.rpy"), "id prefix matches");
        ok &= require_(records::belongs_to(r2, "game/a.rpy"), "file field matches");
        ok &= require_(!records::belongs_to(r3, "game/a.rpy"), "prefix must end at ':'");
        ok &= require_(records::units_for_file(set, "game/a.rpy").size() == 2, "two units for the file");
        return ok;
    }

    static bool test_strings_writer_() {
        const std::vector<tl::StringsPair> pairs = {
            {"Hello", "你好", "1"},
            {"Say \"hi\"", "说\"嗨\"", "2"},
            {"Hello", "哈喽", "3"},
            {"   ", "blank", "4"},
            {"two\nlines", "两\n行", "5"},
        };

        const std::string out = tl::build_strings(pairs, "zh_CN");
        const std::string want =
            "translate zh_CN strings:\n"
            "\n"
            "    # CONFLICT for old: \"Hello\" -> [\"你好\", \"哈喽\"]\n"
            "    old \"Hello\"\n"
            "    new \"你好\"\n"
            "\n"
            "    old \"Say \\\"hi\\\"\"\n"
            "    new \"说\\\"嗨\\\"\"\n"
            "\n"
            "    old \"\"\"two\nlines\"\"\"\n"
            "    new \"\"\"两\n行\"\"\"\n";

        return require_(out == want, "strings block with dedup, conflict note and quoting");
    }

    static bool test_group_and_paths_() {
        records::RecordSet set;
        records::Record r1;
        r1.unit.id = "game/a.rpy:1:0";
        r1.unit.original_text = "x";
        records::Record r2;
        r2.unit.id = "orphan";
        r2.unit.original_text = "y";
        set.records = {r1, r2};

        const auto per_file = tl::group_pairs(set, true);
        const auto single = tl::group_pairs(set, false);

        bool ok = true;
        ok &= require_(per_file.size() == 1 && per_file.count("game/a.rpy") == 1, "grouped by id prefix");
        ok &= require_(single.size() == 1 && single.count("") == 1, "single group under the empty key");
        ok &= require_(tl::strings_path("out", "zh_CN", "game/a.txt") ==
                           std::filesystem::path("out") / "game" / "tl" / "zh_CN" / "game" / "a.rpy",
                       "per-file path keeps the directory and uses .rpy");
        ok &= require_(tl::strings_path("out", "ja", "") ==
                           std::filesystem::path("out") / "game" / "tl" / "ja" / "strings.rpy",
                       "single-file path");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"json_parser", test_json_parser_},
        {"parse_records_fields", test_parse_records_fields_},
        {"parse_records_bad_lines", test_parse_records_bad_lines_},
        {"out_of_range_numbers", test_out_of_range_numbers_},
        {"duplicate_id_replaces", test_duplicate_id_replaces_},
        {"records_for_file", test_records_for_file_},
        {"strings_writer", test_strings_writer_},
        {"group_and_paths", test_group_and_paths_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
