// tools/backfillc/include/backfillc/config/TomlLite.hpp
#pragma once
#include <backfillc/config/Config.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>


namespace backfillc::config::toml_lite {

    /// @brief `[section]` / `key = value` subset: strings, integers, booleans, string arrays.
    /// Keys are flattened to `section.key`.
    bool parse_text(std::string_view text,
                    std::string_view origin,
                    FlatMap& out,
                    std::vector<std::string>& warnings,
                    std::string& err);

    bool parse_file(const std::filesystem::path& path,
                    FlatMap& out,
                    std::vector<std::string>& warnings,
                    std::string& err);

} // namespace backfillc::config::toml_lite
