// engine/include/backfill/patch/FilePatch.hpp
#pragma once
#include <backfill/match/Unit.hpp>
#include <backfill/report/Ledger.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace backfill::patch {

    struct FileResult {
        std::string text{};
        size_t applied = 0;   // edits that changed the text

        bool modified() const {  return applied != 0;  }
    };

    /// @brief Processing order: (line_hint, index_hint, id), missing hints last.
    std::vector<const match::TranslationUnit*> sort_units(const std::vector<match::TranslationUnit>& units);

    /// @brief Applies all units to one file's text, recording one outcome per unit.
    /// @details Each unit is resolved against a fresh scan of the current text, so an
    /// accepted edit is visible to every later unit. A unit failure never stops the file.
    FileResult patch_file(std::string_view text,
                          std::string_view file,
                          const std::vector<match::TranslationUnit>& units,
                          report::Ledger& ledger);

} // namespace backfill::patch
