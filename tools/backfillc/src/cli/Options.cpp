// tools/backfillc/src/cli/Options.cpp
#include <backfillc/cli/Options.hpp>

#include <cctype>
#include <limits>
#include <string_view>


namespace backfillc::cli {

    namespace {

        bool parse_opt_value(const std::vector<std::string_view>& args,
                             size_t& i,
                             std::string_view key,
                             std::string& out,
                             std::string& err) {
            const auto a = args[i];
            const auto pref = std::string(key) + "=";
            if (a.rfind(pref, 0) == 0) {
                out = std::string(a.substr(pref.size()));
                if (out.empty()) {
                    err = std::string(key) + " requires a value";
                    return false;
                }
                return true;
            }

            if (i + 1 >= args.size()) {
                err = std::string(key) + " requires a value";
                return false;
            }
            ++i;
            out = std::string(args[i]);
            if (out.empty()) {
                err = std::string(key) + " requires a value";
                return false;
            }
            return true;
        }

        bool parse_u32(const std::string& s, uint32_t& out) {
            if (s.empty()) return false;
            for (const char c : s) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            }
            if (s.size() > 9) return false;
            const unsigned long v = std::stoul(s);
            if (v > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) return false;
            out = static_cast<uint32_t>(v);
            return true;
        }

        // `--key value` or `--key=value`
        bool matches_key(std::string_view a, std::string_view key) {
            if (a == key) return true;
            return a.size() > key.size() && a.substr(0, key.size()) == key && a[key.size()] == '=';
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "backfillc <project_root> <translated.jsonl> [options]\n"
            << "  --version\n"
            << "  --help\n"
            << "\n"
            << "Options:\n"
            << "  -o, --out DIR         output root (default: out_patch)\n"
            << "  --ext .rpy            source extension to scan\n"
            << "  --exclude-dirs a,b    directory names to skip (default: tl)\n"
            << "  --suffix .zh.rpy      extension of patched output files\n"
            << "  --dry-run             resolve and report, write nothing\n"
            << "  --backup              copy an existing output file to <file>.bak first\n"
            << "  --workers N|auto      files patched in parallel (0 = sequential)\n"
            << "  --report PATH         TSV report path (default: <jsonl>.patch_report.tsv)\n"
            << "  --config PATH         config file (default: <project_root>/backfill.toml)\n"
            << "  --tl-mode             emit 'translate <lang> strings:' files instead of patching\n"
            << "  --lang L              tl language directory (default: zh_CN)\n"
            << "  --no-tl-per-file      one strings.rpy instead of one file per source\n"
            << "  --verbose             per-file progress\n";
    }

    std::vector<std::string> split_list(const std::string& s) {
        std::vector<std::string> out;
        std::string cur;
        auto flush = [&]() {
            size_t b = 0;
            size_t e = cur.size();
            while (b < e && std::isspace(static_cast<unsigned char>(cur[b]))) ++b;
            while (e > b && std::isspace(static_cast<unsigned char>(cur[e - 1]))) --e;
            if (e > b) out.push_back(cur.substr(b, e - b));
            cur.clear();
        };
        for (char c : s) {
            if (c == ',') {
                flush();
                continue;
            }
            cur.push_back(c);
        }
        flush();
        return out;
    }

    Options parse_options(int argc, char** argv) {
        Options opt{};

        if (argc <= 1) {
            opt.mode = Mode::kUsage;
            return opt;
        }

        std::vector<std::string_view> args;
        args.reserve(static_cast<size_t>(argc - 1));
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        for (auto a : args) {
            if (a == "--version") {
                opt.mode = Mode::kVersion;
                return opt;
            }
            if (a == "--help" || a == "-h") {
                opt.mode = Mode::kUsage;
                return opt;
            }
        }

        auto fail = [&](std::string msg) {
            opt.ok = false;
            opt.error = std::move(msg);
            return opt;
        };

        bool tl_mode = false;
        std::vector<std::string> positional;
        for (size_t i = 0; i < args.size(); ++i) {
            const auto a = args[i];
            std::string v;
            std::string err;

            if (a == "--dry-run") {
                opt.dry_run = true;
            } else if (a == "--backup") {
                opt.backup = true;
            } else if (a == "--tl-mode") {
                tl_mode = true;
            } else if (a == "--no-tl-per-file") {
                opt.tl_per_file = false;
            } else if (a == "--tl-per-file") {
                opt.tl_per_file = true;
            } else if (a == "--verbose" || a == "-v") {
                opt.verbose = true;
            } else if (a == "-o" || matches_key(a, "--out")) {
                if (!parse_opt_value(args, i, a == "-o" ? "-o" : "--out", v, err)) return fail(err);
                opt.out_dir = v;
            } else if (matches_key(a, "--ext")) {
                if (!parse_opt_value(args, i, "--ext", v, err)) return fail(err);
                if (v.front() != '.') v.insert(v.begin(), '.');
                opt.extension = v;
            } else if (matches_key(a, "--exclude-dirs")) {
                if (!parse_opt_value(args, i, "--exclude-dirs", v, err)) return fail(err);
                opt.exclude_dirs = split_list(v);
            } else if (matches_key(a, "--suffix")) {
                if (!parse_opt_value(args, i, "--suffix", v, err)) return fail(err);
                opt.suffix = v;
            } else if (matches_key(a, "--report")) {
                if (!parse_opt_value(args, i, "--report", v, err)) return fail(err);
                opt.report_path = v;
            } else if (matches_key(a, "--config")) {
                if (!parse_opt_value(args, i, "--config", v, err)) return fail(err);
                opt.config_path = v;
            } else if (matches_key(a, "--lang")) {
                if (!parse_opt_value(args, i, "--lang", v, err)) return fail(err);
                opt.lang = v;
            } else if (matches_key(a, "--workers")) {
                if (!parse_opt_value(args, i, "--workers", v, err)) return fail(err);
                if (v == "auto") {
                    opt.workers_auto = true;
                } else {
                    uint32_t n = 0;
                    if (!parse_u32(v, n)) return fail("--workers expects a non-negative integer or 'auto'");
                    opt.workers = n;
                }
            } else if (!a.empty() && a.front() == '-' && a != "-") {
                return fail("unknown option: " + std::string(a));
            } else {
                positional.emplace_back(a);
            }
        }

        if (positional.size() != 2) {
            return fail("expected <project_root> <translated.jsonl>");
        }
        opt.project_root = positional[0];
        opt.jsonl_path = positional[1];
        opt.mode = tl_mode ? Mode::kTl : Mode::kPatch;
        return opt;
    }

} // namespace backfillc::cli
