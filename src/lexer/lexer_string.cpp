//! # Lexer - Strings and Characters
//!
//! ## Escape Sequences
//!
//! | Escape | Character       |
//! |--------|-----------------|
//! | `\"`   | Double quote    |
//! | `\t`   | Tab             |
//! | `\r`   | Carriage return |
//! | `\n`   | Newline         |
//! | `\\`   | Backslash       |
//!
//! Any other escaped character is unexpected input. The cursor counts the
//! two raw characters of an escape, not the decoded one.
//!
//! ## Characters
//!
//! `\c` outside a string is a complete character token whose value is `c`.
//! It is emitted in one step, so there is no character mode.

#include "eden/lexer/lexer.hpp"

namespace eden::lexer {

namespace {

auto decode_escape(std::string_view escaped) -> std::optional<char> {
    if (escaped.size() != 1) {
        return std::nullopt;
    }

    switch (escaped.front()) {
    case '"':
        return '"';
    case 't':
        return '\t';
    case 'r':
        return '\r';
    case 'n':
        return '\n';
    case '\\':
        return '\\';
    default:
        return std::nullopt;
    }
}

} // anonymous namespace

auto Lexer::scan_string() -> bool {
    auto ch = peek();

    if (ch == "\"") {
        consume(ch);
        return finalize_token();
    }

    if (ch == "\\") {
        auto escaped = source_.char_at(pos_ + 1);
        if (escaped.empty()) {
            // Input ends after the backslash; the string stays unfinished
            consume(ch);
            append(ch);
            return true;
        }

        auto decoded = decode_escape(escaped);
        if (!decoded) {
            return unexpected(escaped);
        }

        consume(source_.slice(pos_, pos_ + ch.size() + escaped.size()));
        append(std::string_view(&*decoded, 1));
        return true;
    }

    consume(ch);
    append(ch);
    return true;
}

auto Lexer::scan_character() -> bool {
    auto escaped = source_.char_at(pos_ + 1);
    if (escaped.empty()) {
        return unfinished(Token{
            .kind = TokenKind::Character, .value = "", .location = start_location()});
    }

    return emit(TokenKind::Character, std::string(escaped),
                source_.slice(pos_, pos_ + 1 + escaped.size()));
}

} // namespace eden::lexer
