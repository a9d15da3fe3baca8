// tools/backfillc/src/driver/Runner.cpp
#include <backfillc/driver/Runner.hpp>
#include <backfillc/driver/Log.hpp>
#include <backfillc/os/File.hpp>
#include <backfillc/records/Records.hpp>
#include <backfillc/tl/StringsWriter.hpp>

#include <backfill/patch/FilePatch.hpp>
#include <backfill/text/Utf8.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <limits>
#include <thread>


namespace backfillc::driver {

    namespace fs = std::filesystem;

    using backfill::diag::Code;
    using backfill::diag::Severity;
    using backfill::report::Status;

    namespace {

        std::string lower_ascii(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string with_dot(std::string ext) {
            if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
            return ext;
        }

        void merge_diags(backfill::diag::Bag& into, const backfill::diag::Bag& from) {
            for (const auto& d : from.diags()) into.add(d);
        }

        FileOutcome patch_one(const FileJob& job) {
            FileOutcome out;
            out.rel = job.rel;

            std::string text;
            std::string err;
            if (!os::read_file(job.source, text, err)) {
                out.diags.add(Severity::kError, Code::kFileReadFailed, job.rel, 0, err);
                return out;
            }

            uint32_t bad_off = 0;
            if (!backfill::text::validate_utf8_strict(text, bad_off)) {
                out.diags.add(Severity::kWarning, Code::kInvalidUtf8, job.rel, 0,
                              "invalid UTF-8 at byte " + std::to_string(bad_off) + "; bytes are kept as-is");
            }

            auto res = backfill::patch::patch_file(text, job.rel, job.units, out.ledger);
            out.modified = res.modified();
            out.text = std::move(res.text);
            return out;
        }

        std::string summary_line(size_t files, const backfill::report::Ledger& ledger) {
            return "patched files: " + std::to_string(files) +
                   ", rows: " + std::to_string(ledger.size()) +
                   " (ok=" + std::to_string(ledger.count(Status::kOk)) +
                   ", noop=" + std::to_string(ledger.count(Status::kNoop)) +
                   ", warn=" + std::to_string(ledger.count(Status::kWarn)) +
                   ", fail=" + std::to_string(ledger.count(Status::kFail)) + ")";
        }

        int run_patch(const RunSettings& s, const records::RecordSet& set, backfill::diag::Bag& bag) {
            std::vector<FileJob> jobs;
            const auto files = discover_files(s.project_root, s.extension, s.exclude_dirs);
            for (const auto& p : files) {
                FileJob job;
                job.rel = os::relative_generic(s.project_root, p);
                job.units = records::units_for_file(set, job.rel);
                if (job.units.empty()) continue;
                job.source = p;
                jobs.push_back(std::move(job));
            }

            if (s.verbose) {
                std::cout << "scanned " << files.size() << " file(s), " << jobs.size() << " with records\n";
            }

            auto outcomes = patch_all(jobs, s.workers);

            backfill::report::Ledger all;
            size_t patched = 0;
            for (auto& o : outcomes) {
                merge_diags(bag, o.diags);
                all.append(std::move(o.ledger));

                if (!o.modified) {
                    if (s.verbose) std::cout << "unchanged " << o.rel << "\n";
                    continue;
                }

                fs::path target = s.out_root / fs::path(o.rel);
                target.replace_extension(s.suffix);

                if (s.dry_run) {
                    ++patched;
                    if (s.verbose) std::cout << "would write " << target.string() << "\n";
                    continue;
                }

                if (!os::is_inside(s.out_root, target)) {
                    bag.add(Severity::kError, Code::kUnsafeOutputPath, o.rel, 0,
                            "output path escapes the output root: " + target.string());
                    continue;
                }

                std::string err;
                if (s.backup && !os::backup_existing(target, err)) {
                    bag.add(Severity::kError, Code::kFileWriteFailed, o.rel, 0, err);
                    continue;
                }
                if (!os::write_file_atomic(target, o.text, err)) {
                    bag.add(Severity::kError, Code::kFileWriteFailed, o.rel, 0, err);
                    continue;
                }
                ++patched;
                if (s.verbose) std::cout << "wrote " << target.string() << "\n";
            }

            std::string err;
            if (!os::write_file_atomic(s.report_path, backfill::report::render_tsv(all), err)) {
                bag.add(Severity::kError, Code::kReportWriteFailed, s.report_path.string(), 0, err);
            }

            print_diags(bag);
            std::cout << summary_line(patched, all) << "\n";
            std::cout << "report: " << s.report_path.string() << "\n";
            std::cout << "output root: " << s.out_root.string() << "\n";
            if (s.dry_run) std::cout << "dry run: no patched files written\n";

            return bag.has_error() ? 1 : 0;
        }

        int run_tl(const RunSettings& s, const records::RecordSet& set, backfill::diag::Bag& bag) {
            auto groups = tl::group_pairs(set, s.tl_per_file);
            if (!s.tl_per_file && groups.empty()) groups[std::string{}];

            size_t written = 0;
            for (const auto& [rel, pairs] : groups) {
                const fs::path target = tl::strings_path(s.out_root, s.lang, rel);
                if (!os::is_inside(s.out_root, target)) {
                    bag.add(Severity::kError, Code::kUnsafeOutputPath, rel, 0,
                            "output path escapes the output root: " + target.string());
                    continue;
                }

                const std::string content = tl::build_strings(pairs, s.lang);
                if (!s.dry_run) {
                    std::string err;
                    if (!os::write_file_atomic(target, content, err)) {
                        bag.add(Severity::kError, Code::kFileWriteFailed, rel, 0, err);
                        continue;
                    }
                }
                ++written;
                if (s.verbose) std::cout << (s.dry_run ? "would write " : "wrote ") << target.string() << "\n";
            }

            print_diags(bag);
            std::cout << "tl files: " << written << " -> "
                      << (s.out_root / "game" / "tl" / s.lang).string() << "\n";
            std::cout << "output root: " << s.out_root.string() << "\n";
            if (s.dry_run) std::cout << "dry run: no tl files written\n";

            return bag.has_error() ? 1 : 0;
        }

    } // namespace

    RunSettings resolve_settings(const cli::Options& opt, const config::Settings& cfg) {
        RunSettings s;
        s.project_root = fs::path(opt.project_root);
        s.jsonl_path = fs::path(opt.jsonl_path);

        s.out_root = fs::path(opt.out_dir.value_or(cfg.output_dir));
        s.extension = with_dot(opt.extension.value_or(cfg.scan_extension));
        s.exclude_dirs = opt.exclude_dirs.value_or(cfg.scan_exclude_dirs);
        s.suffix = with_dot(opt.suffix.value_or(cfg.output_suffix));
        s.lang = opt.lang.value_or(cfg.tl_lang);

        if (opt.report_path) {
            s.report_path = fs::path(*opt.report_path);
        } else if (!cfg.report_path.empty()) {
            s.report_path = fs::path(cfg.report_path);
        } else {
            s.report_path = s.jsonl_path;
            s.report_path.replace_extension(".patch_report.tsv");
        }

        s.dry_run = opt.dry_run;
        s.backup = opt.backup.value_or(cfg.output_backup);
        s.tl_per_file = opt.tl_per_file.value_or(cfg.tl_per_file);
        s.verbose = opt.verbose.value_or(cfg.log_verbose);

        if (opt.workers_auto) {
            const unsigned hc = std::thread::hardware_concurrency();
            s.workers = hc > 1 ? hc - 1 : 1;
        } else if (opt.workers) {
            s.workers = *opt.workers;
        } else {
            const int64_t w = std::min<int64_t>(cfg.run_workers, std::numeric_limits<uint32_t>::max());
            s.workers = static_cast<uint32_t>(w < 0 ? 0 : w);
        }
        return s;
    }

    std::vector<fs::path> discover_files(const fs::path& root,
                                         const std::string& extension,
                                         const std::vector<std::string>& exclude_dirs) {
        const std::string want = lower_ascii(extension);

        std::vector<std::pair<std::string, fs::path>> found;
        std::error_code ec{};
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        const fs::recursive_directory_iterator end;
        for (; !ec && it != end; it.increment(ec)) {
            const fs::path& p = it->path();
            std::error_code fec{};
            if (!it->is_regular_file(fec)) continue;
            if (lower_ascii(p.extension().string()) != want) continue;

            const fs::path rel = p.lexically_relative(root);
            bool excluded = false;
            for (const auto& part : rel) {
                if (std::find(exclude_dirs.begin(), exclude_dirs.end(), part.string()) != exclude_dirs.end()) {
                    excluded = true;
                    break;
                }
            }
            if (excluded) continue;
            found.emplace_back(rel.generic_string(), p);
        }

        std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

        std::vector<fs::path> out;
        out.reserve(found.size());
        for (auto& f : found) out.push_back(std::move(f.second));
        return out;
    }

    std::vector<FileOutcome> patch_all(const std::vector<FileJob>& jobs, uint32_t workers) {
        std::vector<FileOutcome> out(jobs.size());

        const size_t n_threads = std::min<size_t>(workers, jobs.size());
        if (n_threads <= 1) {
            for (size_t i = 0; i < jobs.size(); ++i) out[i] = patch_one(jobs[i]);
            return out;
        }

        // each slot is written by exactly one worker; order follows the job list
        std::atomic<size_t> next{0};
        std::vector<std::thread> pool;
        pool.reserve(n_threads);
        for (size_t t = 0; t < n_threads; ++t) {
            pool.emplace_back([&jobs, &out, &next]() {
                for (;;) {
                    const size_t i = next.fetch_add(1);
                    if (i >= jobs.size()) return;
                    out[i] = patch_one(jobs[i]);
                }
            });
        }
        for (auto& th : pool) th.join();
        return out;
    }

    int run(const cli::Options& opt) {
        backfill::diag::Bag bag;

        std::error_code ec{};
        if (!fs::is_directory(opt.project_root, ec)) {
            print_error("project root is not a directory: " + opt.project_root);
            return 1;
        }

        config::LoadedConfig loaded;
        std::optional<fs::path> explicit_cfg{};
        if (opt.config_path) explicit_cfg = fs::path(*opt.config_path);
        config::load(explicit_cfg, fs::path(opt.project_root), loaded, bag);
        const config::Settings cfg = config::materialize(loaded, bag);
        if (bag.has_error()) {
            print_diags(bag);
            print_error("invalid configuration");
            return 1;
        }

        const RunSettings s = resolve_settings(opt, cfg);
        if (s.verbose && !loaded.path.empty()) {
            std::cout << "config: " << loaded.path.string() << "\n";
            for (const auto& [k, v] : loaded.values) {
                std::cout << "  " << k << " = " << config::render_value_text(v) << "\n";
            }
        }

        records::RecordSet set;
        if (!records::load_records(s.jsonl_path, set, bag)) {
            print_diags(bag);
            print_error("cannot read translations: " + s.jsonl_path.string());
            return 1;
        }
        if (s.verbose) {
            std::cout << "records: " << set.records.size() << " usable of " << set.lines_read << " line(s)\n";
        }

        if (opt.mode == cli::Mode::kTl) return run_tl(s, set, bag);
        return run_patch(s, set, bag);
    }

} // namespace backfillc::driver
