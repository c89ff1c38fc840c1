//! # Source Text
//!
//! This module owns the text handed to the lexer and gives byte and
//! UTF-8 code point access to it.
//!
//! ## Characters
//!
//! The lexer works on characters, where one character is one UTF-8 encoded
//! code point. `char_at()` returns the bytes of the code point starting at
//! an offset. A malformed or truncated sequence is returned one byte at a
//! time so that scanning always makes progress.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("{:name \"é\"}");
//! source.char_at(0);  // "{"
//! source.char_at(8);  // "é" (2 bytes)
//! ```

#ifndef EDEN_LEXER_SOURCE_HPP
#define EDEN_LEXER_SOURCE_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace eden::lexer {

/// Text being lexed.
///
/// The source owns its content. String views returned by `content()`,
/// `slice()` and `char_at()` are valid as long as the Source exists.
class Source {
public:
    explicit Source(std::string content);

    /// Returns the entire source content as a string view.
    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    /// Returns the length of the source in bytes.
    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at the given offset.
    ///
    /// Returns '\0' if offset is out of bounds.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns the UTF-8 encoded character starting at `offset`.
    ///
    /// Returns an empty view if offset is out of bounds.
    [[nodiscard]] auto char_at(size_t offset) const -> std::string_view;

    /// Returns a substring from `start` to `end` (exclusive).
    ///
    /// The range is clamped to valid bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Returns true if the content at `offset` begins with `prefix`.
    [[nodiscard]] auto matches(size_t offset, std::string_view prefix) const -> bool;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content) -> Source;

private:
    std::string content_; ///< UTF-8 encoded source content.
};

/// Returns the byte length of the UTF-8 sequence introduced by `lead`.
///
/// Returns 1 for ASCII and for bytes that cannot start a sequence.
[[nodiscard]] auto utf8_char_length(char lead) -> size_t;

} // namespace eden::lexer

#endif // EDEN_LEXER_SOURCE_HPP
