// tools/backfillc/include/backfillc/config/Config.hpp
#pragma once
#include <backfill/diag/Diagnostic.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>


namespace backfillc::config {

    using Value = std::variant<std::string, int64_t, bool, std::vector<std::string>>;
    using FlatMap = std::map<std::string, Value>;

    inline constexpr std::string_view k_project_config_name = "backfill.toml";

    /// @brief Run settings after config defaults; CLI flags are applied on top by the caller.
    struct Settings {
        std::string scan_extension = ".rpy";
        std::vector<std::string> scan_exclude_dirs{"tl"};

        std::string output_dir = "out_patch";
        std::string output_suffix = ".zh.rpy";
        bool output_backup = false;

        int64_t run_workers = 0;      // 0 = sequential

        std::string report_path{};    // empty = <jsonl stem>.patch_report.tsv

        std::string tl_lang = "zh_CN";
        bool tl_per_file = true;

        bool log_verbose = false;
    };

    struct LoadedConfig {
        std::filesystem::path path{};   // empty when no config file was used
        FlatMap values{};
    };

    bool is_known_key(std::string_view key);

    /// @brief `explicit_path` if given (must exist), else `<project_root>/backfill.toml` if present.
    /// Parse failures are errors in `bag`; unknown keys are warnings and dropped.
    bool load(const std::optional<std::filesystem::path>& explicit_path,
              const std::filesystem::path& project_root,
              LoadedConfig& out,
              backfill::diag::Bag& bag);

    /// @brief Values over defaults. A key with the wrong type is an error and keeps its default.
    Settings materialize(const LoadedConfig& cfg, backfill::diag::Bag& bag);

    std::string render_value_text(const Value& v);

} // namespace backfillc::config
