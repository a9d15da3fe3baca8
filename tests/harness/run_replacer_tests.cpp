#include <backfill/lex/Scanner.hpp>
#include <backfill/patch/Replacer.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace {

    using backfill::QuoteStyle;
    namespace patch = backfill::patch;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool test_escape_single_line_() {
        bool ok = true;
        ok &= require_(patch::escape_for_quote("say \"hi\"", '"') == "say \\\"hi\\\"", "bare double quotes are escaped");
        ok &= require_(patch::escape_for_quote("it's", '\'') == "it\\'s", "bare single quote is escaped");
        ok &= require_(patch::escape_for_quote("it's", '"') == "it's", "other quote kind is left alone");
        ok &= require_(patch::escape_for_quote("a \\\" b", '"') == "a \\\" b", "already escaped quote stays as-is");
        ok &= require_(patch::escape_for_quote("end\\", '"') == "end\\\\", "dangling backslash is doubled");
        ok &= require_(patch::escape_for_quote("\\n line", '"') == "\\n line", "escape sequences pass through");
        return ok;
    }

    static bool test_line_breaks_in_single_line_literal_() {
        bool ok = true;
        ok &= require_(patch::escape_for_quote("x\ny", '"') == "x\\ny", "newline becomes an escape");
        ok &= require_(patch::escape_for_quote("x\r\ny", '"') == "x\\r\\ny", "CRLF becomes two escapes");
        ok &= require_(patch::escape_for_quote("end\\\nnext", '"') == "end\\\\\\nnext",
                       "backslash before a line break is kept literal");
        ok &= require_(patch::quote_safe("x\ny", QuoteStyle::kTripleDouble) == "x\ny", "triple literal keeps raw newline");

        const std::string src = "e \"A\" \"B\"\n";
        const auto toks = backfill::scan_literals(src);
        if (!require_(toks.size() == 2, "two literals expected")) return false;
        const std::string out = patch::splice(src, toks[0], patch::quote_safe("x\ny", toks[0].quote));
        const auto again = backfill::scan_literals(out);
        ok &= require_(again.size() == 2 && again[0].terminated, "patched literal still closes on its line");
        if (again.size() == 2) {
            ok &= require_(out.substr(again[1].inner.lo, again[1].inner.size()) == "B", "following literal untouched");
        }
        return ok;
    }

    static bool test_open_literal_keeps_trailing_backslash_() {
        bool ok = true;
        ok &= require_(patch::escape_for_quote("abc\\", '"', false) == "abc\\", "open single literal is not doubled");
        ok &= require_(patch::sanitize_triple("abc\"", '"', false) == "abc\"", "open triple literal has no closing run");

        const std::string src = "e \"abc\\\n";
        const auto toks = backfill::scan_literals(src);
        if (!require_(toks.size() == 1 && !toks[0].terminated, "one open literal expected")) return false;
        const std::string out = patch::splice(src, toks[0], patch::quote_safe("abc\\", toks[0].quote, toks[0].terminated));
        ok &= require_(out == src, "identity body round-trips");
        return ok;
    }

    static bool test_sanitize_triple_() {
        bool ok = true;
        ok &= require_(patch::sanitize_triple("say \"\"\"hi\"\"\" ok", '"') == "say \"\"\\\"hi\"\"\\\" ok",
                       "every run of three delimiters is broken");
        ok &= require_(patch::sanitize_triple("he said \"x\"", '"') == "he said \"x\\\"",
                       "a delimiter right before the closing triple is escaped");
        ok &= require_(patch::sanitize_triple("a \"\" b", '"') == "a \"\" b", "two quotes inside are harmless");
        ok &= require_(patch::sanitize_triple("x \\\"\"\" y", '"') == "x \\\"\"\" y",
                       "escaped first quote already breaks the run");
        ok &= require_(patch::sanitize_triple("it's '''", '\'') == "it's ''\\'", "triple-single uses the single quote");
        return ok;
    }

    static bool test_quote_safe_identity_() {
        const std::string_view bodies[] = {
            "plain text",
            "a \\\" b",
            "tab\\tand\\nnewline",
            "{color=#f00}red{/color}",
        };

        bool ok = true;
        for (auto b : bodies) {
            ok &= require_(patch::quote_safe(b, QuoteStyle::kDouble) == b, "valid double body is unchanged");
            ok &= require_(patch::quote_safe(b, QuoteStyle::kTripleDouble) == b, "valid triple body is unchanged");
        }
        return ok;
    }

    static bool test_splice_only_touches_inner_() {
        const std::string src = "e \"old\" # tail\n";
        const auto toks = backfill::scan_literals(src);
        if (!require_(toks.size() == 1, "one literal expected")) return false;

        const std::string out = patch::splice(src, toks[0], "new text");
        return require_(out == "e \"new text\" # tail\n", "only the inner span changes");
    }

    static bool test_triple_result_rescans_to_same_boundaries_() {
        const std::string src = "e \"\"\"Old\"\"\" n \"after\"\n";
        const auto toks = backfill::scan_literals(src);
        if (!require_(toks.size() == 2, "two literals expected")) return false;

        const std::string body = patch::quote_safe("tricky \"\"\" and \"", toks[0].quote);
        const std::string out = patch::splice(src, toks[0], body);
        const auto again = backfill::scan_literals(out);

        bool ok = true;
        ok &= require_(again.size() == 2, "patched text still has exactly two literals");
        if (again.size() != 2) return false;
        ok &= require_(again[0].terminated, "triple literal still closes");
        ok &= require_(out.substr(again[0].inner.lo, again[0].inner.size()) == body, "triple inner is the sanitized body");
        ok &= require_(out.substr(again[1].inner.lo, again[1].inner.size()) == "after", "following literal untouched");
        return ok;
    }

    static bool test_single_result_rescans_to_same_boundaries_() {
        const std::string src = "e \"Old\" 'keep'\n";
        const auto toks = backfill::scan_literals(src);
        if (!require_(toks.size() == 2, "two literals expected")) return false;

        const std::string body = patch::quote_safe("x \"y\" z\\", toks[0].quote);
        const std::string out = patch::splice(src, toks[0], body);
        const auto again = backfill::scan_literals(out);

        bool ok = true;
        ok &= require_(again.size() == 2, "patched text still has exactly two literals");
        if (again.size() != 2) return false;
        ok &= require_(again[0].terminated, "double literal still closes");
        ok &= require_(out.substr(again[1].inner.lo, again[1].inner.size()) == "keep", "following literal untouched");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"escape_single_line", test_escape_single_line_},
        {"line_breaks_in_single_line_literal", test_line_breaks_in_single_line_literal_},
        {"open_literal_keeps_trailing_backslash", test_open_literal_keeps_trailing_backslash_},
        {"sanitize_triple", test_sanitize_triple_},
        {"quote_safe_identity", test_quote_safe_identity_},
        {"splice_only_touches_inner", test_splice_only_touches_inner_},
        {"triple_result_rescans_to_same_boundaries", test_triple_result_rescans_to_same_boundaries_},
        {"single_result_rescans_to_same_boundaries", test_single_result_rescans_to_same_boundaries_},
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
