// tools/backfillc/src/main.cpp
#include <backfillc/cli/Options.hpp>
#include <backfillc/driver/Log.hpp>
#include <backfillc/driver/Runner.hpp>
#include <backfill/Version.hpp>

#include <iostream>


int main(int argc, char** argv) {
    if (argc <= 1) {
        std::cout << backfill::k_version_string << "\n";
        backfillc::cli::print_usage(std::cout);
        return 0;
    }

    const auto opt = backfillc::cli::parse_options(argc, argv);

    if (!opt.ok) {
        backfillc::driver::print_error(opt.error);
        backfillc::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == backfillc::cli::Mode::kVersion) {
        std::cout << backfill::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == backfillc::cli::Mode::kUsage) {
        backfillc::cli::print_usage(std::cout);
        return 0;
    }

    return backfillc::driver::run(opt);
}
