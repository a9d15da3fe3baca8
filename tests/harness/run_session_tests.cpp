#include <backfill/patch/FilePatch.hpp>
#include <backfill/report/Ledger.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

    using backfill::match::TranslationUnit;
    using backfill::report::Ledger;
    using backfill::report::Status;
    namespace patch = backfill::patch;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static TranslationUnit unit_(std::string id,
                                 std::string original,
                                 std::string translated,
                                 std::optional<uint32_t> line = std::nullopt,
                                 std::optional<uint32_t> idx = std::nullopt) {
        TranslationUnit u;
        u.id = std::move(id);
        u.original_text = std::move(original);
        u.translated_text = std::move(translated);
        u.line_hint = line;
        u.index_hint = idx;
        return u;
    }

    static bool test_scenario_line_hint_() {
        const std::string src =
            "label start:\n"
            "    speaker \"Hello, world!\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(src, "script.rpy",
                                           {unit_("a", "Hello, world!", "你好，世界！", 2, 0)}, ledger);

        bool ok = true;
        ok &= require_(res.text == "label start:\n    speaker \"你好，世界！\"\n", "dialogue line is translated in place");
        ok &= require_(ledger.size() == 1, "one row per unit");
        if (ledger.size() != 1) return false;
        const auto& row = ledger.rows()[0];
        ok &= require_(row.status == Status::kOk, "status OK");
        ok &= require_(row.method == "S1-line-idx", "method S1-line-idx");
        ok &= require_(row.message == "region=label", "message names the region");
        ok &= require_(row.file == "script.rpy", "file is recorded");
        return ok;
    }

    static bool test_scenario_anchors_pick_one_of_five_() {
        const std::string src =
            "label a:\n"
            "    e \"OK\"\n"
            "    e \"OK\"\n"
            "    n \"Before\"\n"
            "    e \"OK\"\n"
            "    n \"After\"\n"
            "    e \"OK\"\n"
            "    e \"OK\"\n";

        auto u = unit_("b", "OK", "好");
        u.anchor_prev = "n \"Before\"";
        u.anchor_next = "n \"After\"";

        Ledger ledger;
        const auto res = patch::patch_file(src, "f.rpy", {u}, ledger);

        const std::string want =
            "label a:\n"
            "    e \"OK\"\n"
            "    e \"OK\"\n"
            "    n \"Before\"\n"
            "    e \"好\"\n"
            "    n \"After\"\n"
            "    e \"OK\"\n"
            "    e \"OK\"\n";

        bool ok = true;
        ok &= require_(res.text == want, "only the bounded occurrence changes");
        ok &= require_(res.applied == 1, "one edit applied");
        ok &= require_(ledger.count(Status::kOk) == 1, "one OK row");
        return ok;
    }

    static bool test_scenario_triple_delimiter_in_translation_() {
        const std::string src =
            "label a:\n"
            "    e \"\"\"Old\n"
            "text\"\"\"\n"
            "    e \"next\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(src, "f.rpy", {unit_("c", "Old\ntext", "say \"\"\"hi\"\"\" ok")}, ledger);

        const std::string want =
            "label a:\n"
            "    e \"\"\"say \"\"\\\"hi\"\"\\\" ok\"\"\"\n"
            "    e \"next\"\n";

        bool ok = true;
        ok &= require_(res.text == want, "embedded triple delimiter is escaped");
        ok &= require_(ledger.count(Status::kOk) == 1, "row is OK");
        return ok;
    }

    static bool test_scenario_unique_without_hints_() {
        const std::string src =
            "label a:\n"
            "    e \"Alpha\"\n"
            "    e \"Beta\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(src, "f.rpy", {unit_("d", "Beta", "贝塔")}, ledger);

        bool ok = true;
        ok &= require_(res.text == "label a:\n    e \"Alpha\"\n    e \"贝塔\"\n", "unique literal translated");
        ok &= require_(ledger.size() == 1 && ledger.rows()[0].method == "S4-unique", "method S4-unique");
        return ok;
    }

    static bool test_scenario_protected_region_skip_() {
        const std::string src =
            "init python:\n"
            "    msg = \"Secret\"\n"
            "label a:\n"
            "    e \"Other\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(src, "f.rpy", {unit_("e", "Secret", "秘密")}, ledger);

        bool ok = true;
        ok &= require_(res.text == src, "protected literal is not touched");
        ok &= require_(!res.modified(), "file is not modified");
        if (!require_(ledger.size() == 1, "one row")) return false;
        const auto& row = ledger.rows()[0];
        ok &= require_(row.status == Status::kWarn, "status WARN");
        ok &= require_(row.method == "protected_region_skip", "method protected_region_skip");
        ok &= require_(row.message == "S4-unique", "message names the tier");
        ok &= require_(row.code == backfill::diag::Code::kProtectedRegionSkip, "code recorded");
        return ok;
    }

    static bool test_identity_translation_is_noop_() {
        const std::string src = "label a:\n    e \"Same\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(src, "f.rpy", {unit_("n", "Same", "Same", 2, 0)}, ledger);

        bool ok = true;
        ok &= require_(res.text == src, "text unchanged");
        ok &= require_(!res.modified(), "identity edit does not count as applied");
        if (!require_(ledger.size() == 1, "one row")) return false;
        ok &= require_(ledger.rows()[0].status == Status::kNoop, "status NOOP");
        ok &= require_(ledger.rows()[0].method == "unchanged", "method unchanged");
        ok &= require_(ledger.rows()[0].message == "region=label", "message names the region");
        return ok;
    }

    static bool test_no_double_apply_() {
        const std::string src = "label a:\n    e \"Once\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(
            src, "f.rpy", {unit_("x1", "Once", "一次"), unit_("x2", "Once", "再一次")}, ledger);

        bool ok = true;
        ok &= require_(res.text == "label a:\n    e \"一次\"\n", "first unit wins, second finds nothing");
        ok &= require_(res.applied == 1, "one edit applied");
        ok &= require_(ledger.count(Status::kOk) == 1, "one OK row");
        ok &= require_(ledger.count(Status::kFail) == 1, "one FAIL row");

        // a second pass over the patched text changes nothing
        Ledger again;
        const auto res2 = patch::patch_file(res.text, "f.rpy", {unit_("x1", "Once", "一次")}, again);
        ok &= require_(res2.text == res.text, "re-running is a no-op on text");
        ok &= require_(again.count(Status::kFail) == 1, "already-translated unit is reported as not found");
        return ok;
    }

    static bool test_stale_anchors_do_not_bound_the_search_() {
        TranslationUnit u = unit_("s", "OK", "好");
        u.anchor_prev = "stale prev";
        u.anchor_next = "stale next";

        bool ok = true;
        {
            const std::string src = "label s:\n    e \"OK\"\n    e \"OK\"\n    e \"OK\"\n";
            Ledger ledger;
            const auto res = patch::patch_file(src, "f.rpy", {u}, ledger);
            ok &= require_(res.text == src, "duplicates with unfound anchors stay untouched");
            ok &= require_(ledger.count(Status::kFail) == 1, "unfound anchors with duplicates is FAIL");
        }
        {
            const std::string src = "label s:\n    e \"OK\"\n    n \"Other\"\n";
            Ledger first;
            const auto res = patch::patch_file(src, "f.rpy", {u}, first);
            ok &= require_(res.text == "label s:\n    e \"好\"\n    n \"Other\"\n", "single copy still found");
            if (first.size() == 1) {
                ok &= require_(first.rows()[0].method == "S4-unique", "unfound anchors fall through to S4");
            }

            Ledger second;
            const auto res2 = patch::patch_file(res.text, "f.rpy", {u}, second);
            ok &= require_(res2.text == res.text, "second run changes nothing");
            ok &= require_(second.count(Status::kFail) == 1, "second run reports FAIL");
        }
        return ok;
    }

    static bool test_multiline_translation_keeps_line_literals_() {
        const std::string src = "label a:\n    e \"A\" \"B\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(
            src, "f.rpy", {unit_("1", "A", "x\ny", 2, 0), unit_("2", "B", "z", 2, 1)}, ledger);

        bool ok = true;
        ok &= require_(res.text == "label a:\n    e \"x\\ny\" \"z\"\n", "line break is written as an escape");
        ok &= require_(ledger.count(Status::kOk) == 2, "the later literal on the line is still found");
        return ok;
    }

    static bool test_unterminated_trailing_backslash_is_noop_() {
        const std::string src = "label a:\n    e \"abc\\\n";

        Ledger ledger;
        const auto res = patch::patch_file(src, "f.rpy", {unit_("u", "abc\\", "abc\\", 2, 0)}, ledger);

        bool ok = true;
        ok &= require_(res.text == src, "open literal is left byte-identical");
        if (!require_(ledger.size() == 1, "one row")) return false;
        ok &= require_(ledger.rows()[0].status == Status::kNoop, "identity on an open literal is NOOP");
        return ok;
    }

    static bool test_ambiguous_fails_without_edit_() {
        const std::string src = "label a:\n    e \"Yes\"\n    n \"Yes\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(src, "f.rpy", {unit_("y", "Yes", "是")}, ledger);

        bool ok = true;
        ok &= require_(res.text == src, "ambiguous unit leaves text unchanged");
        if (!require_(ledger.size() == 1, "one row")) return false;
        const auto& row = ledger.rows()[0];
        ok &= require_(row.status == Status::kFail, "status FAIL");
        ok &= require_(row.method == "not_found_or_ambiguous", "method not_found_or_ambiguous");
        ok &= require_(row.message.empty(), "empty message");
        return ok;
    }

    static bool test_placeholder_mismatch_is_warn_but_applied_() {
        const std::string src = "label a:\n    e \"Hi [name]\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(src, "f.rpy", {unit_("p", "Hi [name]", "你好")}, ledger);

        bool ok = true;
        ok &= require_(res.text == "label a:\n    e \"你好\"\n", "edit is still applied");
        if (!require_(ledger.size() == 1, "one row")) return false;
        const auto& row = ledger.rows()[0];
        ok &= require_(row.status == Status::kWarn, "status WARN");
        ok &= require_(row.method == "S4-unique", "method keeps the tier tag");
        ok &= require_(row.message == "placeholder_mismatch: ['[name]'] vs []; region=label", "mismatch message");
        return ok;
    }

    static bool test_malformed_units_() {
        const std::string src = "label a:\n    e \"Hi\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(
            src, "f.rpy", {unit_("", "Hi", "你好"), unit_("m2", "", "你好"), unit_("m3", "Hi", "")}, ledger);

        bool ok = true;
        ok &= require_(res.text == src, "malformed units never edit");
        ok &= require_(ledger.count(Status::kFail) == 3, "three FAIL rows");
        bool saw_id = false, saw_orig = false, saw_tr = false;
        for (const auto& r : ledger.rows()) {
            ok &= require_(r.method == "malformed_unit", "method malformed_unit");
            saw_id |= r.message == "missing id";
            saw_orig |= r.message == "missing original text";
            saw_tr |= r.message == "missing translated text";
        }
        ok &= require_(saw_id && saw_orig && saw_tr, "each missing field is named");
        return ok;
    }

    static bool test_edits_shift_later_offsets_() {
        const std::string src =
            "label a:\n"
            "    e \"A\" \"B\"\n"
            "    e \"C\"\n";

        Ledger ledger;
        const auto res = patch::patch_file(
            src, "f.rpy",
            {unit_("3", "C", "第三", 3, 0), unit_("1", "A", "很长很长的第一句", 2, 0), unit_("2", "B", "第二", 2, 1)},
            ledger);

        bool ok = true;
        ok &= require_(res.text == "label a:\n    e \"很长很长的第一句\" \"第二\"\n    e \"第三\"\n",
                       "every edit lands on its literal after earlier edits grew the text");
        ok &= require_(ledger.count(Status::kOk) == 3, "three OK rows");
        if (ledger.size() == 3) {
            ok &= require_(ledger.rows()[0].unit_id == "1" && ledger.rows()[2].unit_id == "3",
                           "rows follow line/index order");
        }
        return ok;
    }

    static bool test_sort_units_missing_hints_last_() {
        const std::vector<TranslationUnit> units = {
            unit_("z", "x", "y"),
            unit_("b", "x", "y", 5, 1),
            unit_("a", "x", "y", 5, 0),
            unit_("c", "x", "y", 2),
            unit_("a2", "x", "y"),
        };

        const auto order = patch::sort_units(units);

        bool ok = true;
        ok &= require_(order.size() == 5, "all units kept");
        if (order.size() != 5) return false;
        ok &= require_(order[0]->id == "c", "lowest line first");
        ok &= require_(order[1]->id == "a" && order[2]->id == "b", "same line ordered by index");
        ok &= require_(order[3]->id == "a2" && order[4]->id == "z", "unhinted units last, by id");
        return ok;
    }

    static bool test_tsv_report_() {
        Ledger ledger;
        backfill::report::MatchOutcome o;
        o.unit_id = "id\t1";
        o.file = "dir\\f.rpy";
        o.status = Status::kWarn;
        o.method = "S4-unique";
        o.message = "line1\nline2";
        ledger.add(o);

        const std::string tsv = backfill::report::render_tsv(ledger);
        return require_(tsv == "id\tfile\tstatus\tmethod\tmessage\n"
                               "id\\t1\tdir\\\\f.rpy\tWARN\tS4-unique\tline1\\nline2\n",
                        "header plus escaped row");
    }

    static bool test_ledger_append_keeps_order_() {
        Ledger a;
        Ledger b;
        backfill::report::MatchOutcome o;
        o.unit_id = "1";
        a.add(o);
        o.unit_id = "2";
        b.add(o);
        o.unit_id = "3";
        b.add(o);

        a.append(std::move(b));

        bool ok = true;
        ok &= require_(a.size() == 3, "rows moved");
        if (a.size() == 3) ok &= require_(a.rows()[2].unit_id == "3", "order preserved");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"scenario_line_hint", test_scenario_line_hint_},
        {"scenario_anchors_pick_one_of_five", test_scenario_anchors_pick_one_of_five_},
        {"scenario_triple_delimiter_in_translation", test_scenario_triple_delimiter_in_translation_},
        {"scenario_unique_without_hints", test_scenario_unique_without_hints_},
        {"scenario_protected_region_skip", test_scenario_protected_region_skip_},
        {"identity_translation_is_noop", test_identity_translation_is_noop_},
        {"no_double_apply", test_no_double_apply_},
        {"stale_anchors_do_not_bound_the_search", test_stale_anchors_do_not_bound_the_search_},
        {"multiline_translation_keeps_line_literals", test_multiline_translation_keeps_line_literals_},
        {"unterminated_trailing_backslash_is_noop", test_unterminated_trailing_backslash_is_noop_},
        {"ambiguous_fails_without_edit", test_ambiguous_fails_without_edit_},
        {"placeholder_mismatch_is_warn_but_applied", test_placeholder_mismatch_is_warn_but_applied_},
        {"malformed_units", test_malformed_units_},
        {"edits_shift_later_offsets", test_edits_shift_later_offsets_},
        {"sort_units_missing_hints_last", test_sort_units_missing_hints_last_},
        {"tsv_report", test_tsv_report_},
        {"ledger_append_keeps_order", test_ledger_append_keeps_order_},
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
