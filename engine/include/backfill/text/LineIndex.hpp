// engine/include/backfill/text/LineIndex.hpp
#pragma once
#include <cstdint>
#include <string_view>
#include <vector>


namespace backfill {

    /// @brief Sorted line-start table for one text snapshot.
    /// @details Built once per scan; never updated in place after an edit.
    class LineIndex {
    public:
        explicit LineIndex(std::string_view text);

        // byte_off -> 1-based line number (clamped to the text size)
        uint32_t line_of(uint32_t byte_off) const;

        uint32_t line_count() const { return static_cast<uint32_t>(line_starts_.size()); }

        // 1-based line -> byte offset of its first character
        uint32_t line_start(uint32_t line) const;

        static std::vector<uint32_t> build_line_starts(std::string_view s);

    private:
        std::vector<uint32_t> line_starts_; // byte offsets, includes 0
        uint32_t size_ = 0;
    };

} // namespace backfill
