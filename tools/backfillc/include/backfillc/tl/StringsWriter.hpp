// tools/backfillc/include/backfillc/tl/StringsWriter.hpp
#pragma once
#include <backfillc/records/Records.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>


namespace backfillc::tl {

    struct StringsPair {
        std::string old_text{};
        std::string new_text{};
        std::string id{};
    };

    /// @brief Record pairs keyed by source file (`file`, else the id prefix before ':').
    /// With `per_file == false` every pair lands under the empty key. Records without a file are dropped.
    std::map<std::string, std::vector<StringsPair>> group_pairs(const records::RecordSet& set, bool per_file);

    /// @brief `old "..."` / `new "..."` literal for a body taken from source text.
    std::string quote_block(std::string_view body);

    /// @brief `translate <lang> strings:` block. Pairs are deduplicated by old text (first wins);
    /// a differing later translation adds a `# CONFLICT` comment above the entry.
    std::string build_strings(const std::vector<StringsPair>& pairs, std::string_view lang);

    /// @brief `<out>/game/tl/<lang>/<rel with .rpy>`, or `.../strings.rpy` for the empty key.
    std::filesystem::path strings_path(const std::filesystem::path& out_root, std::string_view lang, std::string_view rel);

} // namespace backfillc::tl
