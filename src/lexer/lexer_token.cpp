//! # Lexer - Token Dispatch
//!
//! This file implements `scan_new()`, which runs between tokens and decides
//! what the next character starts.
//!
//! ## Dispatch Order
//!
//! 1. Skip whitespace and commas
//! 2. Comments (`;`)
//! 3. Literal prefixes `nil`, `true`, `false`
//! 4. Strings (`"`)
//! 5. Characters (`\c`)
//! 6. Keywords (`:`)
//! 7. `#` markers: `#{`, `#_`, `#:`, then tags
//! 8. Numbers (sign or digit)
//! 9. Delimiters
//! 10. Symbols (letter)
//!
//! Anything else is unexpected input.

#include "eden/lexer/chars.hpp"
#include "eden/lexer/lexer.hpp"

namespace eden::lexer {

namespace {

struct LiteralPrefix {
    std::string_view text;
    TokenKind kind;
};

constexpr LiteralPrefix LITERAL_PREFIXES[] = {
    {"nil", TokenKind::Nil},
    {"true", TokenKind::True},
    {"false", TokenKind::False},
};

} // anonymous namespace

auto Lexer::scan_new() -> bool {
    auto ch = peek();
    char c = peek_byte();

    if (chars::is_whitespace(c)) {
        consume(ch);
        return true;
    }

    if (c == ';') {
        begin_token(TokenKind::Comment, "", ScanMode::Comment);
        consume(ch);
        return true;
    }

    for (const auto& literal : LITERAL_PREFIXES) {
        if (source_.matches(pos_, literal.text)) {
            begin_token(literal.kind, std::string(literal.text), ScanMode::CheckLiteral);
            consume(literal.text);
            return true;
        }
    }

    switch (c) {
    case '"':
        begin_token(TokenKind::String, "", ScanMode::String);
        consume(ch);
        return true;
    case '\\':
        return scan_character();
    case ':':
        begin_token(TokenKind::Keyword, "", ScanMode::Symbol);
        consume(ch);
        return true;
    case '#':
        return scan_dispatch();
    case '-':
    case '+':
        begin_token(TokenKind::Integer, std::string(ch), ScanMode::Number);
        consume(ch);
        return true;
    default:
        break;
    }

    if (chars::is_digit(c)) {
        begin_token(TokenKind::Integer, std::string(ch), ScanMode::Number);
        consume(ch);
        return true;
    }

    if (auto kind = delimiter_kind(c)) {
        return emit(*kind, std::string(ch), ch);
    }

    if (chars::is_letter(c)) {
        begin_token(TokenKind::Symbol, std::string(ch), ScanMode::Symbol);
        consume(ch);
        return true;
    }

    return unexpected(ch);
}

} // namespace eden::lexer
