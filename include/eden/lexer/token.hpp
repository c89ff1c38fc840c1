//! # Token Definitions
//!
//! This module defines the tokens produced by the EDN lexer.
//!
//! ## Overview
//!
//! EDN tokens are categorized into:
//!
//! - **Literals**: `nil`, `true`, `false`, integers, floats, strings, characters
//! - **Names**: symbols (`foo`, `my.ns/bar`), keywords (`:foo`)
//! - **Markers**: tags (`#inst`), discard (`#_`), namespace maps (`#:ns`), sets (`#{`)
//! - **Delimiters**: `{ } [ ] ( )`
//! - **Comments**: `; ...` up to the end of the line
//!
//! ## Payloads
//!
//! Every token carries its text payload as scanned. Numbers keep their sign
//! and `N`/`M` suffix verbatim (`-42N`, `3.14M`). Strings carry decoded
//! content. Keywords, tags and namespace maps drop their prefix, so `:foo`,
//! `#foo` and `#:foo` all carry `foo`.

#ifndef EDEN_LEXER_TOKEN_HPP
#define EDEN_LEXER_TOKEN_HPP

#include "eden/lexer/cursor.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace eden::lexer {

/// All possible token kinds in EDN.
enum class TokenKind : uint8_t {
    // ========================================================================
    // Literals
    // ========================================================================
    Nil,       ///< `nil`
    True,      ///< `true`
    False,     ///< `false`
    Integer,   ///< `42`, `-7`, `+3`, `42N`
    Float,     ///< `3.14`, `1e10`, `2.5e-3`, `3.14M`, `1M`
    String,    ///< `"hello\n"`
    Character, ///< `\a`

    // ========================================================================
    // Names
    // ========================================================================
    Symbol,  ///< `foo`, `my.ns/bar`, `nilable`
    Keyword, ///< `:foo`, `:my.ns/bar`

    // ========================================================================
    // Markers
    // ========================================================================
    Comment, ///< `; text`
    Discard, ///< `#_`
    Tag,     ///< `#inst`, `#my/tag`
    NsMap,   ///< `#:ns`
    SetOpen, ///< `#{`

    // ========================================================================
    // Delimiters
    // ========================================================================
    CurlyOpen,    ///< `{`
    CurlyClose,   ///< `}`
    BracketOpen,  ///< `[`
    BracketClose, ///< `]`
    ParenOpen,    ///< `(`
    ParenClose,   ///< `)`
};

/// Returns the lowercase name of a token kind (`nil`, `set_open`, ...).
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Returns true for `nil`, `true`, `false`, numbers, strings and characters.
[[nodiscard]] auto is_literal(TokenKind kind) -> bool;

/// Returns true for the six single-character collection delimiters.
[[nodiscard]] auto is_delimiter(TokenKind kind) -> bool;

/// Maps a delimiter character to its token kind.
///
/// Returns `std::nullopt` if `c` is not one of `{ } [ ] ( )`.
[[nodiscard]] auto delimiter_kind(char c) -> std::optional<TokenKind>;

// ============================================================================
// Token
// ============================================================================

/// A lexical token of EDN text.
///
/// # Example
///
/// For the input `[:a 1]` the lexer produces:
/// - `Token { kind: BracketOpen, value: "[" }`
/// - `Token { kind: Keyword, value: "a" }`
/// - `Token { kind: Integer, value: "1" }`
/// - `Token { kind: BracketClose, value: "]" }`
struct Token {
    /// The kind of token.
    TokenKind kind;

    /// Text payload.
    std::string value;

    /// Position of the first character of the token.
    ///
    /// Only present when the lexer was asked to track locations.
    std::optional<Location> location;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto operator==(const Token& other) const -> bool = default;
};

/// Renders a token as `kind("value")`, followed by `@line:col` when located.
[[nodiscard]] auto to_string(const Token& token) -> std::string;

auto operator<<(std::ostream& os, const Token& token) -> std::ostream&;

} // namespace eden::lexer

#endif // EDEN_LEXER_TOKEN_HPP
