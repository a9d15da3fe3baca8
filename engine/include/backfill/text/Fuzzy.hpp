// engine/include/backfill/text/Fuzzy.hpp
#pragma once
#include <cstdint>
#include <string_view>
#include <vector>


namespace backfill::text {

    /// @brief Longest common subsequence length over code points.
    size_t lcs_length(const std::vector<uint32_t>& a, const std::vector<uint32_t>& b);

    /// @brief Normalized indel similarity in [0, 100]: 100 * 2 * LCS / (|a| + |b|).
    /// Two empty strings compare as 100.
    double indel_ratio(std::string_view a, std::string_view b);

    /// @brief Token-set similarity in [0, 100] over whitespace-separated tokens.
    /// Shared tokens are compared against each side's extra tokens; either side empty gives 0.
    double token_set_ratio(std::string_view a, std::string_view b);

} // namespace backfill::text
