// tools/backfillc/include/backfillc/driver/Runner.hpp
#pragma once
#include <backfillc/cli/Options.hpp>
#include <backfillc/config/Config.hpp>

#include <backfill/diag/Diagnostic.hpp>
#include <backfill/match/Unit.hpp>
#include <backfill/report/Ledger.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>


namespace backfillc::driver {

    /// @brief Effective run settings: CLI flags over config over defaults.
    struct RunSettings {
        std::filesystem::path project_root{};
        std::filesystem::path jsonl_path{};
        std::filesystem::path out_root{};
        std::filesystem::path report_path{};

        std::string extension = ".rpy";
        std::vector<std::string> exclude_dirs{};
        std::string suffix = ".zh.rpy";
        std::string lang = "zh_CN";

        bool dry_run = false;
        bool backup = false;
        bool tl_per_file = true;
        bool verbose = false;
        uint32_t workers = 0;
    };

    RunSettings resolve_settings(const cli::Options& opt, const config::Settings& cfg);

    /// @brief Files under `root` with `extension` (case-insensitive), skipping any path
    /// with a component named in `exclude_dirs`. Sorted by relative path.
    std::vector<std::filesystem::path> discover_files(const std::filesystem::path& root,
                                                      const std::string& extension,
                                                      const std::vector<std::string>& exclude_dirs);

    struct FileJob {
        std::string rel{};                                   // forward slashes
        std::filesystem::path source{};
        std::vector<backfill::match::TranslationUnit> units{};
    };

    struct FileOutcome {
        std::string rel{};
        std::string text{};
        bool modified = false;
        backfill::report::Ledger ledger{};
        backfill::diag::Bag diags{};
    };

    /// @brief Patches every job; with `workers > 1` jobs are spread over that many threads.
    /// Outcomes are returned in job order regardless of scheduling.
    std::vector<FileOutcome> patch_all(const std::vector<FileJob>& jobs, uint32_t workers);

    int run(const cli::Options& opt);

} // namespace backfillc::driver
