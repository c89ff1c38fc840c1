#include "eden/lexer/cursor.hpp"

#include <ostream>

namespace eden::lexer {

void Cursor::advance(std::string_view text) {
    for (char c : text) {
        if (c == '\n') {
            ++loc_.line;
            loc_.col = 0;
        } else if (c == '\r') {
            continue;
        } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            // Continuation bytes belong to the code point already counted
            ++loc_.col;
        }
    }
}

auto operator<<(std::ostream& os, const Location& loc) -> std::ostream& {
    return os << loc.line << ":" << loc.col;
}

} // namespace eden::lexer
