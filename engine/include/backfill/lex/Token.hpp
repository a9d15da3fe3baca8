// engine/include/backfill/lex/Token.hpp
#pragma once
#include <backfill/text/Span.hpp>

#include <cstdint>
#include <string_view>


namespace backfill {

    enum class QuoteStyle : uint8_t {
        kSingle,        // '...'
        kDouble,        // "..."
        kTripleSingle,  // '''...'''
        kTripleDouble,  // """..."""
    };

    constexpr bool is_triple(QuoteStyle q) {
        return q == QuoteStyle::kTripleSingle || q == QuoteStyle::kTripleDouble;
    }

    constexpr char quote_char(QuoteStyle q) {
        return (q == QuoteStyle::kSingle || q == QuoteStyle::kTripleSingle) ? '\'' : '"';
    }

    constexpr std::string_view quote_delim(QuoteStyle q) {
        switch (q) {
            case QuoteStyle::kSingle: return "'";
            case QuoteStyle::kDouble: return "\"";
            case QuoteStyle::kTripleSingle: return "'''";
            case QuoteStyle::kTripleDouble: return "\"\"\"";
        }
        return "\"";
    }

    /// @brief One string literal found in a text snapshot.
    /// @details Offsets are only valid for the snapshot that produced the token.
    struct Token {
        Span outer{};                  // including delimiters
        Span inner{};                  // delimiters excluded
        QuoteStyle quote = QuoteStyle::kDouble;
        uint32_t start_line = 1;       // 1-based
        uint32_t end_line = 1;         // 1-based, inclusive
        bool terminated = true;        // false: literal ran into end-of-line / end-of-text

        uint32_t mid_line() const { return (start_line + end_line) / 2; }
    };

} // namespace backfill
