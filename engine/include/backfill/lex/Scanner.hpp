// engine/include/backfill/lex/Scanner.hpp
#pragma once
#include <backfill/lex/Token.hpp>
#include <backfill/text/LineIndex.hpp>

#include <string_view>
#include <vector>


namespace backfill {

    /// @brief String-literal scanner for line-oriented script sources.
    /// @details Only quote structure is recognized; everything outside a literal is skipped.
    ///          Never fails: an unterminated triple literal runs to end-of-text and an
    ///          unterminated single-line literal runs to end-of-line.
    class Scanner {
    public:
        explicit Scanner(std::string_view source);

        std::vector<Token> scan_all();

    private:
        char peek(size_t k = 0) const;
        bool eof() const;
        char bump();

        bool at_triple(char q) const;

        Token scan_triple(char q);
        Token scan_single(char q);

        Token make_token(size_t start, size_t inner_lo, size_t inner_hi, size_t end,
                         QuoteStyle quote, bool terminated) const;

        std::string_view source_;
        LineIndex lines_;
        size_t pos_ = 0;
    };

    std::vector<Token> scan_literals(std::string_view source);

} // namespace backfill
