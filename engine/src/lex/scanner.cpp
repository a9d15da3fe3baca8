// engine/src/lex/scanner.cpp
#include <backfill/lex/Scanner.hpp>


namespace backfill {

    Scanner::Scanner(std::string_view source)
        : source_(source), lines_(source) {}

    char Scanner::peek(size_t k) const {
        size_t i = pos_ + k;
        if (i >= source_.size()) return '\0';
        return source_[i];
    }

    bool Scanner::eof() const {
        return pos_ >= source_.size();
    }

    char Scanner::bump() {
        if (eof()) return '\0';
        return source_[pos_++];
    }

    bool Scanner::at_triple(char q) const {
        return pos_ + 2 < source_.size() &&
               source_[pos_] == q && source_[pos_ + 1] == q && source_[pos_ + 2] == q;
    }

    Token Scanner::make_token(size_t start, size_t inner_lo, size_t inner_hi, size_t end,
                              QuoteStyle quote, bool terminated) const {
        Token t;
        t.outer = Span{static_cast<uint32_t>(start), static_cast<uint32_t>(end)};
        t.inner = Span{static_cast<uint32_t>(inner_lo), static_cast<uint32_t>(inner_hi)};
        t.quote = quote;
        t.start_line = lines_.line_of(static_cast<uint32_t>(start));
        t.end_line = (end > start) ? lines_.line_of(static_cast<uint32_t>(end - 1)) : t.start_line;
        t.terminated = terminated;
        return t;
    }

    Token Scanner::scan_triple(char q) {
        const QuoteStyle style = (q == '\'') ? QuoteStyle::kTripleSingle : QuoteStyle::kTripleDouble;
        const size_t start = pos_;
        pos_ += 3;
        const size_t inner_lo = pos_;

        while (!eof()) {
            if (peek() == '\\') {
                // escape consumes the next byte, so \""" never closes
                bump();
                bump();
                continue;
            }
            if (at_triple(q)) {
                const size_t inner_hi = pos_;
                pos_ += 3;
                return make_token(start, inner_lo, inner_hi, pos_, style, true);
            }
            bump();
        }

        return make_token(start, inner_lo, source_.size(), source_.size(), style, false);
    }

    Token Scanner::scan_single(char q) {
        const QuoteStyle style = (q == '\'') ? QuoteStyle::kSingle : QuoteStyle::kDouble;
        const size_t start = pos_;
        bump(); // opening quote
        const size_t inner_lo = pos_;

        while (!eof()) {
            const char c = peek();
            if (c == '\n' || (c == '\r' && peek(1) == '\n')) break;

            if (c == '\\') {
                // an escaped newline does not continue the literal on the next line
                if (peek(1) == '\n' || peek(1) == '\0') {
                    bump();
                    break;
                }
                bump();
                bump();
                continue;
            }
            if (c == q) {
                const size_t inner_hi = pos_;
                bump();
                return make_token(start, inner_lo, inner_hi, pos_, style, true);
            }
            bump();
        }

        return make_token(start, inner_lo, pos_, pos_, style, false);
    }

    std::vector<Token> Scanner::scan_all() {
        std::vector<Token> out;
        pos_ = 0;

        while (!eof()) {
            const char c = peek();
            if (c == '"' || c == '\'') {
                if (at_triple(c)) out.push_back(scan_triple(c));
                else out.push_back(scan_single(c));
                continue;
            }
            bump();
        }
        return out;
    }

    std::vector<Token> scan_literals(std::string_view source) {
        Scanner sc(source);
        return sc.scan_all();
    }

} // namespace backfill
