//! # Location Tracking
//!
//! The cursor follows the lexer through the input and knows the line and
//! column of the next unread character. It only ever moves forward, over
//! exactly the text the lexer consumed.
//!
//! ## Counting Rules
//!
//! | Character     | Effect                           |
//! |---------------|----------------------------------|
//! | `\n`          | line + 1, column reset to 0      |
//! | `\r`          | none (zero width)                |
//! | anything else | column + 1 per UTF-8 code point  |

#ifndef EDEN_LEXER_CURSOR_HPP
#define EDEN_LEXER_CURSOR_HPP

#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace eden::lexer {

/// A position in the input.
///
/// Lines are 1-based, columns are 0-based.
struct Location {
    uint32_t line = 1;
    uint32_t col = 0;

    [[nodiscard]] auto operator==(const Location& other) const -> bool = default;
};

auto operator<<(std::ostream& os, const Location& loc) -> std::ostream&;

/// Forward-only line/column tracker.
class Cursor {
public:
    Cursor() = default;

    /// Moves the cursor over `text`, left to right.
    void advance(std::string_view text);

    /// Returns the position of the next unread character.
    [[nodiscard]] auto location() const -> Location {
        return loc_;
    }

private:
    Location loc_;
};

} // namespace eden::lexer

#endif // EDEN_LEXER_CURSOR_HPP
