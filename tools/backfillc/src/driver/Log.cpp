// tools/backfillc/src/driver/Log.cpp
#include <backfillc/driver/Log.hpp>

#include <backfill/diag/Render.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif


namespace backfillc::driver {

    namespace {

        constexpr const char* kAnsiReset = "\033[0m";
        constexpr const char* kAnsiRed = "\033[31m";
        constexpr const char* kAnsiYellow = "\033[33m";

    } // namespace

    bool use_stderr_color() {
        if (std::getenv("NO_COLOR") != nullptr) return false;
#if defined(_WIN32)
        return _isatty(_fileno(stderr)) != 0;
#else
        return isatty(fileno(stderr)) != 0;
#endif
    }

    void print_error(std::string_view msg) {
        if (use_stderr_color()) {
            std::cerr << kAnsiRed << "error: " << msg << kAnsiReset << "\n";
        } else {
            std::cerr << "error: " << msg << "\n";
        }
    }

    void print_diags(const backfill::diag::Bag& bag) {
        if (bag.diags().empty()) return;

        if (!use_stderr_color()) {
            std::cerr << bag.render_text();
            return;
        }
        for (const auto& d : bag.diags()) {
            const bool err = d.severity == backfill::diag::Severity::kError;
            std::cerr << (err ? kAnsiRed : kAnsiYellow) << backfill::diag::render_one(d) << kAnsiReset << "\n";
        }
    }

} // namespace backfillc::driver
