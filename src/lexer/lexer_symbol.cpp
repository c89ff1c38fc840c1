//! # Lexer - Symbols, Keywords and Markers
//!
//! ## Name Rules
//!
//! Symbols start with a letter; keywords with `:`, tags with `#`, namespace
//! maps with `#:`. All four then continue with symbol characters and at
//! most one `/`:
//!
//! - `foo`, `my.ns/bar`, `<=`-style names after the first letter
//! - `:foo`, `:my.ns/bar`
//! - `#inst`, `#my/tag`
//! - `#:my.ns`
//!
//! The name ends at the first character that is not a symbol character;
//! that character is then read again between tokens.
//!
//! ## Literal Disambiguation
//!
//! After `nil`, `true` or `false` the lexer is in `CheckLiteral`. A
//! separator (or end of input) confirms the literal. Anything else turns the
//! token into a symbol that already holds the prefix: `nilable`, `trueness`.

#include "eden/lexer/chars.hpp"
#include "eden/lexer/lexer.hpp"

namespace eden::lexer {

auto Lexer::scan_check_literal() -> bool {
    if (chars::is_separator(peek_byte())) {
        return finalize_token();
    }

    reclassify(TokenKind::Symbol, ScanMode::Symbol);
    return true;
}

auto Lexer::scan_dispatch() -> bool {
    switch (source_.at(pos_ + 1)) {
    case '{':
        return emit(TokenKind::SetOpen, "#{", source_.slice(pos_, pos_ + 2));
    case '_':
        return emit(TokenKind::Discard, "#_", source_.slice(pos_, pos_ + 2));
    case ':':
        begin_token(TokenKind::NsMap, "", ScanMode::Symbol);
        consume(source_.slice(pos_, pos_ + 2));
        return true;
    default:
        begin_token(TokenKind::Tag, "", ScanMode::Symbol);
        consume(source_.slice(pos_, pos_ + 1));
        return true;
    }
}

auto Lexer::scan_symbol() -> bool {
    auto ch = peek();
    char c = peek_byte();

    if (c == '/') {
        if (current_->value.find('/') != std::string::npos) {
            return unexpected(ch);
        }
        consume(ch);
        append(ch);
        return true;
    }

    if (chars::is_symbol_char(c)) {
        consume(ch);
        append(ch);
        return true;
    }

    return finalize_token();
}

} // namespace eden::lexer
