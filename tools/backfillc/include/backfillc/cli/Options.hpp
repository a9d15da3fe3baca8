// tools/backfillc/include/backfillc/cli/Options.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>


namespace backfillc::cli {

    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kPatch,
        kTl,
    };

    /// @brief Parsed command line. Unset optionals fall back to config, then defaults.
    struct Options {
        Mode mode = Mode::kUsage;

        std::string project_root{};
        std::string jsonl_path{};

        std::optional<std::string> out_dir{};
        std::optional<std::string> extension{};
        std::optional<std::vector<std::string>> exclude_dirs{};
        std::optional<std::string> suffix{};
        std::optional<std::string> report_path{};
        std::optional<std::string> config_path{};
        std::optional<std::string> lang{};

        bool dry_run = false;
        std::optional<bool> backup{};
        std::optional<uint32_t> workers{};     // 0 = sequential
        bool workers_auto = false;
        std::optional<bool> tl_per_file{};
        std::optional<bool> verbose{};

        bool ok = true;
        std::string error{};
    };

    void print_usage(std::ostream& os);

    Options parse_options(int argc, char** argv);

    /// @brief `a,b , c` -> {"a","b","c"}; empty items dropped.
    std::vector<std::string> split_list(const std::string& s);

} // namespace backfillc::cli
