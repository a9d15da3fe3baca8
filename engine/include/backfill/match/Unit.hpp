// engine/include/backfill/match/Unit.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>


namespace backfill::match {

    /// @brief One translation to place into a file.
    /// @details Hints come from the extraction stage and may be stale; anchors are
    /// the nearest non-empty neighbour lines at extraction time (empty = absent).
    struct TranslationUnit {
        std::string id{};
        std::string original_text{};
        std::string translated_text{};
        std::optional<uint32_t> line_hint{};   // 1-based
        std::optional<uint32_t> index_hint{};  // 0-based among literals on that line
        std::string anchor_prev{};
        std::string anchor_next{};

        bool has_anchors() const {  return !anchor_prev.empty() || !anchor_next.empty();  }

        /// @brief id, original and translation are all present.
        bool well_formed() const {
            return !id.empty() && !original_text.empty() && !translated_text.empty();
        }
    };

} // namespace backfill::match
