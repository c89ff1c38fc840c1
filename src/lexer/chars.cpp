#include "eden/lexer/chars.hpp"

namespace eden::lexer::chars {

auto is_letter(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_symbol_char(char c) -> bool {
    if (is_letter(c) || is_digit(c)) {
        return true;
    }

    switch (c) {
    case '_':
    case '?':
    case '.':
    case '*':
    case '+':
    case '!':
    case '-':
    case '$':
    case '%':
    case '&':
    case '=':
    case '<':
    case '>':
    case '#':
    case ':':
    case '|':
        return true;
    default:
        return false;
    }
}

auto is_whitespace(char c) -> bool {
    switch (c) {
    case ' ':
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
    case ',':
        return true;
    default:
        return false;
    }
}

auto is_delimiter(char c) -> bool {
    switch (c) {
    case '{':
    case '}':
    case '[':
    case ']':
    case '(':
    case ')':
        return true;
    default:
        return false;
    }
}

auto is_separator(char c) -> bool {
    return is_whitespace(c) || is_delimiter(c);
}

} // namespace eden::lexer::chars
