// engine/include/backfill/match/Resolver.hpp
#pragma once
#include <backfill/lex/Token.hpp>
#include <backfill/match/Unit.hpp>
#include <backfill/region/RegionMap.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace backfill::match {

    enum class Tier : uint8_t {
        kNone,
        kLineIndex,        // S1-line-idx
        kLineExact,        // S1-line-exact
        kNearby,           // S2-nearby
        kAnchors,          // S3-anchors
        kAnchorsClosest,   // S3-anchors-closest
        kSemantic,         // S3.5-semantic
        kUnique,           // S4-unique
        kReplaceOnce,      // S5-replace-once
        kFuzzyNearby,      // S6-fuzzy-nearby(<score>)
    };

    std::string_view tier_tag(Tier t);

    // cascade constants; not configurable
    inline constexpr uint32_t k_window_lines = 200;
    inline constexpr double k_fuzzy_min_score = 92.0;
    inline constexpr double k_fuzzy_min_margin = 3.0;

    struct Resolution {
        enum class Kind : uint8_t {
            kMatched,
            kProtectedSkip,   // the tier's unique candidate is inside a python block
            kNotFound,
        };

        Kind kind = Kind::kNotFound;
        size_t token = 0;                 // index into the token list (kMatched / kProtectedSkip)
        Tier tier = Tier::kNone;
        double score = 0.0;               // fuzzy tier only
        region::RegionKind region = region::RegionKind::kRoot;

        bool matched() const {  return kind == Kind::kMatched;  }

        /// @brief Tier tag, with the rounded score for the fuzzy tier.
        std::string method_tag() const;
    };

    /// @brief Picks at most one literal for a unit in a single text snapshot.
    /// @details The resolver borrows text, tokens and regions; all three must come
    /// from the same snapshot and outlive the resolver.
    class Resolver {
    public:
        Resolver(std::string_view text, const std::vector<Token>& tokens, const region::RegionMap& regions);

        Resolution resolve(const TranslationUnit& unit) const;

    private:
        const std::string& inner_of(size_t i) const {  return inners_[i];  }
        region::RegionKind region_of(size_t i) const {  return kinds_[i];  }

        // the tier's unique candidate: matched, or protected skip
        Resolution accept(size_t i, Tier tier) const;

        bool try_line(const TranslationUnit& u, const std::string& want, Resolution& out) const;
        bool try_nearby(const TranslationUnit& u, const std::string& want, Resolution& out) const;
        bool try_anchors(const TranslationUnit& u, const std::string& want, Resolution& out) const;
        bool try_unique(const std::string& want, Resolution& out) const;
        bool try_replace_once(const std::string& want, Resolution& out) const;
        bool try_fuzzy(const TranslationUnit& u, const std::string& want, Resolution& out) const;

        bool in_window(size_t i, uint32_t line_hint) const;

        std::string_view text_;
        const std::vector<Token>& tokens_;
        std::vector<std::string> inners_;            // newline-normalized inner text per token
        std::vector<region::RegionKind> kinds_;      // region at each token's start line
    };

} // namespace backfill::match
