// engine/src/text/line_index.cpp
#include <backfill/text/LineIndex.hpp>

#include <algorithm>


namespace backfill {

    std::vector<uint32_t> LineIndex::build_line_starts(std::string_view s) {
        std::vector<uint32_t> starts;
        starts.push_back(0);

        for (uint32_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\n') starts.push_back(i + 1);
        }
        return starts;
    }

    LineIndex::LineIndex(std::string_view text)
        : line_starts_(build_line_starts(text)), size_(static_cast<uint32_t>(text.size())) {}

    uint32_t LineIndex::line_of(uint32_t byte_off) const {
        const uint32_t off = std::min(byte_off, size_);

        auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), off);
        const uint32_t idx = (it == line_starts_.begin()) ? 0 : static_cast<uint32_t>((it - line_starts_.begin()) - 1);
        return idx + 1;
    }

    uint32_t LineIndex::line_start(uint32_t line) const {
        if (line == 0) return 0;
        if (line > line_starts_.size()) return size_;
        return line_starts_[line - 1];
    }

} // namespace backfill
