// tools/backfillc/include/backfillc/records/Records.hpp
#pragma once
#include <backfill/diag/Diagnostic.hpp>
#include <backfill/match/Unit.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>


namespace backfillc::records {

    // translation keys, first non-blank string wins
    inline constexpr std::string_view k_translation_keys[] = {
        "zh", "cn", "zh_cn", "translation", "text_zh", "target", "tgt", "zh_final",
    };

    struct Record {
        std::string file{};               // `file` field, may be empty
        backfill::match::TranslationUnit unit{};
    };

    struct RecordSet {
        std::vector<Record> records{};    // first-seen order; a repeated id replaces the earlier record

        size_t lines_read = 0;
        size_t bad_json = 0;
        size_t missing_id = 0;
        size_t missing_translation = 0;
    };

    /// @brief Parses JSONL text. Bad lines are warnings in `bag`; records without a
    /// translation are only counted.
    RecordSet parse_records(std::string_view text, std::string_view origin, backfill::diag::Bag& bag);

    /// @brief Reads and parses a JSONL file; false (with an error in `bag`) if unreadable.
    bool load_records(const std::filesystem::path& path, RecordSet& out, backfill::diag::Bag& bag);

    /// @brief Record belongs to `rel` (forward slashes) if its id starts with `rel:` or its file equals `rel`.
    bool belongs_to(const Record& r, std::string_view rel);

    std::vector<backfill::match::TranslationUnit> units_for_file(const RecordSet& set, std::string_view rel);

} // namespace backfillc::records
