//! # Token Utilities
//!
//! - `token_kind_to_string()`: Convert token kind to display string
//! - `is_literal()` / `is_delimiter()`: Kind categories
//! - `delimiter_kind()`: Map `{ } [ ] ( )` to kinds
//! - `to_string()` / `operator<<`: Debug rendering used by logs and tests

#include "eden/lexer/token.hpp"

#include <ostream>
#include <sstream>

namespace eden::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    // Literals
    case TokenKind::Nil:
        return "nil";
    case TokenKind::True:
        return "true";
    case TokenKind::False:
        return "false";
    case TokenKind::Integer:
        return "integer";
    case TokenKind::Float:
        return "float";
    case TokenKind::String:
        return "string";
    case TokenKind::Character:
        return "character";

    // Names
    case TokenKind::Symbol:
        return "symbol";
    case TokenKind::Keyword:
        return "keyword";

    // Markers
    case TokenKind::Comment:
        return "comment";
    case TokenKind::Discard:
        return "discard";
    case TokenKind::Tag:
        return "tag";
    case TokenKind::NsMap:
        return "ns_map";
    case TokenKind::SetOpen:
        return "set_open";

    // Delimiters
    case TokenKind::CurlyOpen:
        return "curly_open";
    case TokenKind::CurlyClose:
        return "curly_close";
    case TokenKind::BracketOpen:
        return "bracket_open";
    case TokenKind::BracketClose:
        return "bracket_close";
    case TokenKind::ParenOpen:
        return "paren_open";
    case TokenKind::ParenClose:
        return "paren_close";
    }
    return "unknown";
}

auto is_literal(TokenKind kind) -> bool {
    return kind >= TokenKind::Nil && kind <= TokenKind::Character;
}

auto is_delimiter(TokenKind kind) -> bool {
    return kind >= TokenKind::CurlyOpen && kind <= TokenKind::ParenClose;
}

auto delimiter_kind(char c) -> std::optional<TokenKind> {
    switch (c) {
    case '{':
        return TokenKind::CurlyOpen;
    case '}':
        return TokenKind::CurlyClose;
    case '[':
        return TokenKind::BracketOpen;
    case ']':
        return TokenKind::BracketClose;
    case '(':
        return TokenKind::ParenOpen;
    case ')':
        return TokenKind::ParenClose;
    default:
        return std::nullopt;
    }
}

auto to_string(const Token& token) -> std::string {
    std::ostringstream oss;
    oss << token;
    return oss.str();
}

auto operator<<(std::ostream& os, const Token& token) -> std::ostream& {
    os << token_kind_to_string(token.kind) << "(\"";

    // Escape control characters so a token always renders on one line
    for (char c : token.value) {
        switch (c) {
        case '"':
            os << "\\\"";
            break;
        case '\\':
            os << "\\\\";
            break;
        case '\n':
            os << "\\n";
            break;
        case '\r':
            os << "\\r";
            break;
        case '\t':
            os << "\\t";
            break;
        default:
            os << c;
        }
    }

    os << "\")";
    if (token.location) {
        os << "@" << *token.location;
    }
    return os;
}

} // namespace eden::lexer
