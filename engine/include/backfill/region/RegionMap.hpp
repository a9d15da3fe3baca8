// engine/include/backfill/region/RegionMap.hpp
#pragma once
#include <cstdint>
#include <string_view>
#include <vector>


namespace backfill::region {

    enum class RegionKind : uint8_t {
        kRoot,
        kLabelBlock,      // `label name:`            (dialogue block A)
        kScreenBlock,     // `screen name(...):`      (dialogue block B)
        kProtectedCode,   // `init python:` / `python early:` ...
    };

    /// @brief Report name of a region kind: root / label / screen / python.
    std::string_view kind_name(RegionKind k);

    struct Region {
        RegionKind kind = RegionKind::kRoot;
        uint32_t start_line = 1; // 1-based, opener line
        uint32_t end_line = 1;   // 1-based, inclusive
    };

    /// @brief Indentation-delimited block regions of one text snapshot.
    class RegionMap {
    public:
        static RegionMap classify(std::string_view source);

        /// @brief Innermost region kind of a line by priority python > screen > label > root.
        RegionKind kind_of_line(uint32_t line) const;

        bool is_protected(uint32_t line) const {
            return kind_of_line(line) == RegionKind::kProtectedCode;
        }

        const std::vector<Region>& regions() const {  return regions_;  }

    private:
        std::vector<Region> regions_;
    };

    // block opener predicates (one physical line, without the newline)
    bool is_protected_opener(std::string_view line);
    bool is_label_opener(std::string_view line);
    bool is_screen_opener(std::string_view line);

    // every leading space or tab counts as one column
    uint32_t indent_width(std::string_view line);

} // namespace backfill::region
