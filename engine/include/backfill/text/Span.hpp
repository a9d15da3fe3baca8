// engine/include/backfill/text/Span.hpp
#pragma once
#include <cstdint>


namespace backfill {

    struct Span {
        uint32_t lo = 0;   // byte offset inclusive
        uint32_t hi = 0;   // byte offset exclusive

        uint32_t size() const { return hi - lo; }
        bool contains(const Span& o) const { return lo <= o.lo && o.hi <= hi; }
    };

} // namespace backfill
