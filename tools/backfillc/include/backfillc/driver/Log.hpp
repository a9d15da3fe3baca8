// tools/backfillc/include/backfillc/driver/Log.hpp
#pragma once
#include <backfill/diag/Diagnostic.hpp>

#include <string_view>


namespace backfillc::driver {

    /// @brief stderr is a terminal and NO_COLOR is unset.
    bool use_stderr_color();

    /// @brief `error: <msg>` on stderr, red when colored output is allowed.
    void print_error(std::string_view msg);

    /// @brief Renders every diagnostic of the bag to stderr.
    void print_diags(const backfill::diag::Bag& bag);

} // namespace backfillc::driver
