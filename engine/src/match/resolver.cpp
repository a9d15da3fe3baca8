// engine/src/match/resolver.cpp
#include <backfill/match/Resolver.hpp>
#include <backfill/text/Fuzzy.hpp>
#include <backfill/text/Signature.hpp>

#include <algorithm>
#include <cmath>


namespace backfill::match {

    using region::RegionKind;

    std::string_view tier_tag(Tier t) {
        switch (t) {
            case Tier::kNone: return "";
            case Tier::kLineIndex: return "S1-line-idx";
            case Tier::kLineExact: return "S1-line-exact";
            case Tier::kNearby: return "S2-nearby";
            case Tier::kAnchors: return "S3-anchors";
            case Tier::kAnchorsClosest: return "S3-anchors-closest";
            case Tier::kSemantic: return "S3.5-semantic";
            case Tier::kUnique: return "S4-unique";
            case Tier::kReplaceOnce: return "S5-replace-once";
            case Tier::kFuzzyNearby: return "S6-fuzzy-nearby";
        }
        return "";
    }

    std::string Resolution::method_tag() const {
        std::string out(tier_tag(tier));
        if (tier == Tier::kFuzzyNearby) {
            out += "(" + std::to_string(std::lround(score)) + ")";
        }
        return out;
    }

    Resolver::Resolver(std::string_view text, const std::vector<Token>& tokens, const region::RegionMap& regions)
        : text_(text), tokens_(tokens) {
        inners_.reserve(tokens_.size());
        kinds_.reserve(tokens_.size());
        for (const auto& t : tokens_) {
            inners_.push_back(text::normalize_newlines(text_.substr(t.inner.lo, t.inner.size())));
            kinds_.push_back(regions.kind_of_line(t.start_line));
        }
    }

    Resolution Resolver::accept(size_t i, Tier tier) const {
        Resolution r;
        r.token = i;
        r.tier = tier;
        r.region = region_of(i);
        r.kind = (r.region == RegionKind::kProtectedCode) ? Resolution::Kind::kProtectedSkip
                                                          : Resolution::Kind::kMatched;
        return r;
    }

    bool Resolver::in_window(size_t i, uint32_t line_hint) const {
        const uint32_t mid = tokens_[i].mid_line();
        const uint32_t d = (mid > line_hint) ? mid - line_hint : line_hint - mid;
        return d <= k_window_lines;
    }

    bool Resolver::try_line(const TranslationUnit& u, const std::string& want, Resolution& out) const {
        if (!u.line_hint) return false;
        const uint32_t line = *u.line_hint;

        if (u.index_hint) {
            std::vector<size_t> on_line;
            for (size_t i = 0; i < tokens_.size(); ++i) {
                if (tokens_[i].start_line == line && tokens_[i].end_line == line) on_line.push_back(i);
            }
            const uint32_t idx = *u.index_hint;
            if (idx < on_line.size() && inner_of(on_line[idx]) == want) {
                out = accept(on_line[idx], Tier::kLineIndex);
                return true;
            }
        }

        std::vector<size_t> exact;
        for (size_t i = 0; i < tokens_.size(); ++i) {
            const Token& t = tokens_[i];
            if (t.start_line <= line && line <= t.end_line && inner_of(i) == want) exact.push_back(i);
        }
        if (exact.size() == 1) {
            out = accept(exact.front(), Tier::kLineExact);
            return true;
        }
        return false;
    }

    bool Resolver::try_nearby(const TranslationUnit& u, const std::string& want, Resolution& out) const {
        if (!u.line_hint) return false;

        std::vector<size_t> exact;
        for (size_t i = 0; i < tokens_.size(); ++i) {
            if (in_window(i, *u.line_hint) && inner_of(i) == want) exact.push_back(i);
        }
        if (exact.size() == 1) {
            out = accept(exact.front(), Tier::kNearby);
            return true;
        }
        return false;
    }

    bool Resolver::try_anchors(const TranslationUnit& u, const std::string& want, Resolution& out) const {
        if (!u.has_anchors()) return false;

        size_t lo = 0;
        size_t hi = text_.size();
        bool located = false;
        if (!u.anchor_prev.empty()) {
            const size_t p = text_.find(u.anchor_prev);
            if (p != std::string_view::npos) {
                lo = p + u.anchor_prev.size();
                located = true;
            }
        }
        if (!u.anchor_next.empty()) {
            const size_t n = text_.find(u.anchor_next, lo);
            if (n != std::string_view::npos) {
                hi = n;
                located = true;
            }
        }
        // stale anchors bound nothing; leave the whole file to the uniqueness tiers
        if (!located) return false;

        std::vector<size_t> inside;
        for (size_t i = 0; i < tokens_.size(); ++i) {
            if (tokens_[i].outer.lo >= lo && tokens_[i].outer.hi <= hi) inside.push_back(i);
        }

        std::vector<size_t> exact;
        for (size_t i : inside) {
            if (inner_of(i) == want) exact.push_back(i);
        }
        if (exact.size() == 1) {
            out = accept(exact.front(), Tier::kAnchors);
            return true;
        }
        if (exact.size() > 1) {
            const size_t mid = (lo + hi) / 2;
            const auto dist = [&](size_t i) -> size_t {
                const size_t c = (static_cast<size_t>(tokens_[i].inner.lo) + tokens_[i].inner.hi) / 2;
                return (c > mid) ? c - mid : mid - c;
            };
            // min_element keeps the earliest token on a distance tie
            const auto best = std::min_element(exact.begin(), exact.end(),
                                               [&](size_t a, size_t b) { return dist(a) < dist(b); });
            out = accept(*best, Tier::kAnchorsClosest);
            return true;
        }

        const std::string want_sig = text::semantic_signature(want);
        std::vector<size_t> same_sig;
        for (size_t i : inside) {
            if (text::semantic_signature(inner_of(i)) == want_sig) same_sig.push_back(i);
        }
        if (same_sig.size() == 1) {
            out = accept(same_sig.front(), Tier::kSemantic);
            return true;
        }
        return false;
    }

    bool Resolver::try_unique(const std::string& want, Resolution& out) const {
        std::vector<size_t> exact;
        for (size_t i = 0; i < tokens_.size(); ++i) {
            if (inner_of(i) == want) exact.push_back(i);
        }
        if (exact.size() == 1) {
            out = accept(exact.front(), Tier::kUnique);
            return true;
        }
        return false;
    }

    bool Resolver::try_replace_once(const std::string& want, Resolution& out) const {
        static constexpr QuoteStyle k_order[] = {
            QuoteStyle::kTripleDouble,
            QuoteStyle::kTripleSingle,
            QuoteStyle::kDouble,
            QuoteStyle::kSingle,
        };

        for (QuoteStyle q : k_order) {
            std::vector<size_t> cand;
            for (size_t i = 0; i < tokens_.size(); ++i) {
                if (tokens_[i].quote != q) continue;
                if (region_of(i) == RegionKind::kProtectedCode) continue;
                if (inner_of(i) == want) cand.push_back(i);
            }
            if (cand.size() == 1) {
                out = accept(cand.front(), Tier::kReplaceOnce);
                return true;
            }
        }
        return false;
    }

    bool Resolver::try_fuzzy(const TranslationUnit& u, const std::string& want, Resolution& out) const {
        if (!u.line_hint) return false;

        struct Scored {
            double score;
            size_t token;
        };
        std::vector<Scored> scored;
        for (size_t i = 0; i < tokens_.size(); ++i) {
            if (!in_window(i, *u.line_hint)) continue;
            if (region_of(i) == RegionKind::kProtectedCode) continue;
            scored.push_back(Scored{text::token_set_ratio(want, inner_of(i)), i});
        }
        if (scored.empty()) return false;

        std::stable_sort(scored.begin(), scored.end(), [&](const Scored& a, const Scored& b) {
            if (a.score != b.score) return a.score > b.score;
            return tokens_[a.token].inner.lo < tokens_[b.token].inner.lo;
        });

        const Scored& top = scored.front();
        if (top.score < k_fuzzy_min_score) return false;
        if (scored.size() >= 2 && top.score - scored[1].score < k_fuzzy_min_margin) return false;

        out = accept(top.token, Tier::kFuzzyNearby);
        out.score = top.score;
        return true;
    }

    Resolution Resolver::resolve(const TranslationUnit& unit) const {
        const std::string want = text::normalize_newlines(unit.original_text);

        Resolution r;
        if (try_line(unit, want, r)) return r;
        if (try_nearby(unit, want, r)) return r;
        if (try_anchors(unit, want, r)) return r;
        if (try_unique(want, r)) return r;
        if (try_replace_once(want, r)) return r;
        if (try_fuzzy(unit, want, r)) return r;
        return Resolution{};
    }

} // namespace backfill::match
