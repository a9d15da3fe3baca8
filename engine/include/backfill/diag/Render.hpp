// engine/include/backfill/diag/Render.hpp
#pragma once
#include <backfill/diag/Diagnostic.hpp>

#include <string>
#include <string_view>


namespace backfill::diag {

    /// @brief Stable upper-case name of a diagnostic code (used in reports and tests).
    std::string_view code_name(Code c);

    std::string_view severity_name(Severity s);

    /// @brief `warning[CODE]: message` followed by ` --> file:line` when a location is known.
    std::string render_one(const Diagnostic& d);

} // namespace backfill::diag
