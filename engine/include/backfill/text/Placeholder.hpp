// engine/include/backfill/text/Placeholder.hpp
#pragma once
#include <set>
#include <string>
#include <string_view>
#include <vector>


namespace backfill::text {

    /// @brief Ren'Py text tag names that are never treated as `{name}` placeholders.
    bool is_renpy_single_tag(std::string_view name);
    bool is_renpy_paired_tag(std::string_view name);

    /// @brief All placeholder occurrences: `[name]`, printf `%...`, `{0}`, `{name!r:>8}`.
    /// Brace forms adjacent to another brace (`{{x}}`) are escapes and skipped.
    std::vector<std::string> placeholders(std::string_view s);

    std::set<std::string> placeholder_set(std::string_view s);

    bool placeholders_match(std::string_view original, std::string_view translated);

    /// @brief `['%s', '[name]']` (sorted).
    std::string render_placeholder_set(const std::set<std::string>& set);

} // namespace backfill::text
