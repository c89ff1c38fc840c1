//! # Lexer - Numbers
//!
//! Numbers are kept as text. The lexer only checks their shape and decides
//! between `Integer` and `Float`.
//!
//! ## Number Formats
//!
//! | Form        | Example            | Kind    |
//! |-------------|--------------------|---------|
//! | Integer     | `42`, `-7`, `+3`   | Integer |
//! | Big integer | `42N`              | Integer |
//! | Fraction    | `3.14`             | Float   |
//! | Exponent    | `1e10`, `2.5E-3`   | Float   |
//! | Big decimal | `3.14M`, `1M`      | Float   |
//!
//! ## Modes
//!
//! `Number` accepts digits, `.`, `e`/`E`, `N` and `M`. After `.` the lexer is
//! in `Fraction` and after `e` in `Exponent`; both need a digit (`Exponent`
//! also takes a sign) before falling back to `Number`. `N` and `M` end the
//! token at once.

#include "eden/lexer/chars.hpp"
#include "eden/lexer/lexer.hpp"

namespace eden::lexer {

auto Lexer::scan_number() -> bool {
    auto ch = peek();
    char c = peek_byte();

    if (chars::is_digit(c)) {
        consume(ch);
        append(ch);
        mode_ = ScanMode::Number;
        return true;
    }

    if (mode_ == ScanMode::Exponent && (c == '+' || c == '-')) {
        consume(ch);
        append(ch);
        return true;
    }

    if (mode_ != ScanMode::Number) {
        // A digit is still owed after '.', 'e' or the exponent sign
        if (chars::is_separator(c)) {
            return unfinished();
        }
        return unexpected(ch);
    }

    switch (c) {
    case '.':
        consume(ch);
        append(ch);
        retype(TokenKind::Float);
        mode_ = ScanMode::Fraction;
        return true;
    case 'e':
    case 'E':
        consume(ch);
        append(ch);
        retype(TokenKind::Float);
        mode_ = ScanMode::Exponent;
        return true;
    case 'N':
        consume(ch);
        append(ch);
        return finalize_token();
    case 'M':
        consume(ch);
        append(ch);
        retype(TokenKind::Float);
        return finalize_token();
    default:
        break;
    }

    if (chars::is_separator(c)) {
        return finalize_token();
    }
    return unexpected(ch);
}

} // namespace eden::lexer
