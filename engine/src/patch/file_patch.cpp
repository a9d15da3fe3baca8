// engine/src/patch/file_patch.cpp
#include <backfill/patch/FilePatch.hpp>
#include <backfill/patch/Replacer.hpp>
#include <backfill/lex/Scanner.hpp>
#include <backfill/match/Resolver.hpp>
#include <backfill/region/RegionMap.hpp>
#include <backfill/text/Placeholder.hpp>

#include <algorithm>
#include <limits>


namespace backfill::patch {

    using report::MatchOutcome;
    using report::Status;

    namespace {

        constexpr uint32_t k_no_hint = std::numeric_limits<uint32_t>::max();

        std::string region_message(region::RegionKind k) {
            return "region=" + std::string(region::kind_name(k));
        }

        MatchOutcome make_row(const match::TranslationUnit& u, std::string_view file, Status st,
                              std::string method, region::RegionKind region, std::string message) {
            MatchOutcome o;
            o.unit_id = u.id;
            o.file = std::string(file);
            o.status = st;
            o.method = std::move(method);
            o.region = region;
            o.message = std::move(message);
            return o;
        }

    } // namespace

    std::vector<const match::TranslationUnit*> sort_units(const std::vector<match::TranslationUnit>& units) {
        std::vector<const match::TranslationUnit*> out;
        out.reserve(units.size());
        for (const auto& u : units) out.push_back(&u);

        std::stable_sort(out.begin(), out.end(), [](const match::TranslationUnit* a, const match::TranslationUnit* b) {
            const uint32_t la = a->line_hint.value_or(k_no_hint);
            const uint32_t lb = b->line_hint.value_or(k_no_hint);
            if (la != lb) return la < lb;
            const uint32_t ia = a->index_hint.value_or(k_no_hint);
            const uint32_t ib = b->index_hint.value_or(k_no_hint);
            if (ia != ib) return ia < ib;
            return a->id < b->id;
        });
        return out;
    }

    FileResult patch_file(std::string_view text,
                          std::string_view file,
                          const std::vector<match::TranslationUnit>& units,
                          report::Ledger& ledger) {
        FileResult res;
        res.text = std::string(text);

        for (const match::TranslationUnit* up : sort_units(units)) {
            const match::TranslationUnit& u = *up;

            if (!u.well_formed()) {
                auto row = make_row(u, file, Status::kFail, "malformed_unit", region::RegionKind::kRoot,
                                    u.id.empty() ? "missing id"
                                    : u.original_text.empty() ? "missing original text"
                                    : "missing translated text");
                row.code = diag::Code::kMalformedUnit;
                ledger.add(std::move(row));
                continue;
            }

            // offsets from a previous edit are stale: rescan every time
            const std::vector<Token> tokens = scan_literals(res.text);
            const region::RegionMap regions = region::RegionMap::classify(res.text);
            const match::Resolver resolver(res.text, tokens, regions);
            const match::Resolution r = resolver.resolve(u);

            if (r.kind == match::Resolution::Kind::kNotFound) {
                auto row = make_row(u, file, Status::kFail, "not_found_or_ambiguous", region::RegionKind::kRoot, "");
                row.code = diag::Code::kNotFoundOrAmbiguous;
                ledger.add(std::move(row));
                continue;
            }

            if (r.kind == match::Resolution::Kind::kProtectedSkip) {
                auto row = make_row(u, file, Status::kWarn, "protected_region_skip", r.region, r.method_tag());
                row.code = diag::Code::kProtectedRegionSkip;
                ledger.add(std::move(row));
                continue;
            }

            const Token& tok = tokens[r.token];
            std::string next = splice(res.text, tok, quote_safe(u.translated_text, tok.quote, tok.terminated));
            if (next == res.text) {
                ledger.add(make_row(u, file, Status::kNoop, "unchanged", r.region, region_message(r.region)));
                continue;
            }

            res.text = std::move(next);
            ++res.applied;

            const auto want = text::placeholder_set(u.original_text);
            const auto got = text::placeholder_set(u.translated_text);
            if (want != got) {
                auto row = make_row(u, file, Status::kWarn, r.method_tag(), r.region,
                                    "placeholder_mismatch: " + text::render_placeholder_set(want) + " vs " +
                                        text::render_placeholder_set(got) + "; " + region_message(r.region));
                row.code = diag::Code::kPlaceholderMismatch;
                ledger.add(std::move(row));
                continue;
            }

            ledger.add(make_row(u, file, Status::kOk, r.method_tag(), r.region, region_message(r.region)));
        }

        return res;
    }

} // namespace backfill::patch
