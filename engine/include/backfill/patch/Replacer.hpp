// engine/include/backfill/patch/Replacer.hpp
#pragma once
#include <backfill/lex/Token.hpp>

#include <string>
#include <string_view>


namespace backfill::patch {

    /// @brief Escapes unescaped `q` in `s` for a single-line literal delimited by `q`.
    /// Raw line breaks become `\n` / `\r` so the literal stays on one line.
    /// A trailing lone backslash is doubled so it cannot swallow the closing quote;
    /// an unterminated literal has no closing quote and keeps it as-is.
    std::string escape_for_quote(std::string_view s, char q, bool terminated = true);

    /// @brief Breaks every unescaped run of three `q` (`""\"`) and escapes unescaped `q`
    /// at the very end, so a triple literal delimited by `q` still closes where it did.
    std::string sanitize_triple(std::string_view s, char q, bool terminated = true);

    /// @brief Translation made safe for the token's quote style.
    /// Text that is already a valid inner body for the style comes back unchanged.
    std::string quote_safe(std::string_view translated, QuoteStyle quote, bool terminated = true);

    /// @brief Replaces the token's inner span with `body`; no other byte changes.
    std::string splice(std::string_view text, const Token& tok, std::string_view body);

} // namespace backfill::patch
