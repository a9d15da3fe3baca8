// tools/backfillc/src/config/Config.cpp
#include <backfillc/config/Config.hpp>
#include <backfillc/config/TomlLite.hpp>

#include <sstream>
#include <unordered_set>


namespace backfillc::config {

    using backfill::diag::Code;
    using backfill::diag::Severity;

    namespace {

        const std::unordered_set<std::string>& known_keys_() {
            static const std::unordered_set<std::string> k{
                "scan.extension",
                "scan.exclude_dirs",

                "output.dir",
                "output.suffix",
                "output.backup",

                "run.workers",

                "report.path",

                "tl.lang",
                "tl.per_file",

                "log.verbose",
            };
            return k;
        }

        template <typename T>
        const T* as_ptr(const Value* v) {
            if (v == nullptr) return nullptr;
            return std::get_if<T>(v);
        }

        void filter_unknown_keys(FlatMap& values, backfill::diag::Bag& bag, const std::string& source_name) {
            std::vector<std::string> to_erase{};
            for (const auto& [k, _] : values) {
                if (!is_known_key(k)) {
                    bag.add(Severity::kWarning, Code::kConfigUnknownKey, source_name, 0,
                            "unknown key '" + k + "' ignored");
                    to_erase.push_back(k);
                }
            }
            for (const auto& k : to_erase) {
                values.erase(k);
            }
        }

    } // namespace

    bool is_known_key(std::string_view key) {
        return known_keys_().contains(std::string(key));
    }

    bool load(const std::optional<std::filesystem::path>& explicit_path,
              const std::filesystem::path& project_root,
              LoadedConfig& out,
              backfill::diag::Bag& bag) {
        out = LoadedConfig{};

        std::error_code ec{};
        if (explicit_path.has_value()) {
            out.path = *explicit_path;
        } else {
            const auto candidate = project_root / k_project_config_name;
            if (!std::filesystem::is_regular_file(candidate, ec)) return true;
            out.path = candidate;
        }

        std::vector<std::string> warnings{};
        std::string err{};
        if (!toml_lite::parse_file(out.path, out.values, warnings, err)) {
            bag.add(Severity::kError, Code::kConfigParseFailed, out.path.string(), 0, err);
            out.values.clear();
            return false;
        }
        for (auto& w : warnings) {
            bag.add(Severity::kWarning, Code::kConfigParseFailed, out.path.string(), 0, std::move(w));
        }

        filter_unknown_keys(out.values, bag, out.path.string());
        return true;
    }

    Settings materialize(const LoadedConfig& cfg, backfill::diag::Bag& bag) {
        Settings s{};
        const FlatMap& v = cfg.values;
        const std::string origin = cfg.path.string();

        auto mismatch = [&](std::string_view key, std::string_view expected) {
            bag.add(Severity::kError, Code::kConfigTypeMismatch, origin, 0,
                    "config key '" + std::string(key) + "' has wrong type (expected " + std::string(expected) + ")");
        };

        auto get_string = [&](std::string_view key, std::string& dst) {
            const auto it = v.find(std::string(key));
            if (it == v.end()) return;
            if (const auto* p = as_ptr<std::string>(&it->second); p != nullptr) {
                dst = *p;
                return;
            }
            mismatch(key, "string");
        };
        auto get_int = [&](std::string_view key, int64_t& dst) {
            const auto it = v.find(std::string(key));
            if (it == v.end()) return;
            if (const auto* p = as_ptr<int64_t>(&it->second); p != nullptr) {
                dst = *p;
                return;
            }
            mismatch(key, "int");
        };
        auto get_bool = [&](std::string_view key, bool& dst) {
            const auto it = v.find(std::string(key));
            if (it == v.end()) return;
            if (const auto* p = as_ptr<bool>(&it->second); p != nullptr) {
                dst = *p;
                return;
            }
            mismatch(key, "bool");
        };
        auto get_strings = [&](std::string_view key, std::vector<std::string>& dst) {
            const auto it = v.find(std::string(key));
            if (it == v.end()) return;
            if (const auto* p = as_ptr<std::vector<std::string>>(&it->second); p != nullptr) {
                dst = *p;
                return;
            }
            mismatch(key, "string array");
        };

        get_string("scan.extension", s.scan_extension);
        get_strings("scan.exclude_dirs", s.scan_exclude_dirs);

        get_string("output.dir", s.output_dir);
        get_string("output.suffix", s.output_suffix);
        get_bool("output.backup", s.output_backup);

        get_int("run.workers", s.run_workers);

        get_string("report.path", s.report_path);

        get_string("tl.lang", s.tl_lang);
        get_bool("tl.per_file", s.tl_per_file);

        get_bool("log.verbose", s.log_verbose);

        if (s.run_workers < 0) s.run_workers = 0;
        return s;
    }

    std::string render_value_text(const Value& v) {
        if (const auto* p = as_ptr<std::string>(&v); p != nullptr) return *p;
        if (const auto* p = as_ptr<int64_t>(&v); p != nullptr) return std::to_string(*p);
        if (const auto* p = as_ptr<bool>(&v); p != nullptr) return *p ? "true" : "false";
        const auto& items = std::get<std::vector<std::string>>(v);
        std::ostringstream oss;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i != 0) oss << ",";
            oss << items[i];
        }
        return oss.str();
    }

} // namespace backfillc::config
