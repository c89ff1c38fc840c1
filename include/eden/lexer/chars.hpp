//! # Character Classes
//!
//! Pure predicates used by the lexer to choose transitions. All classes are
//! ASCII-only: any byte of a multi-byte UTF-8 sequence belongs to none of
//! them.
//!
//! | Class      | Members                                              |
//! |------------|------------------------------------------------------|
//! | letter     | `a-z A-Z`                                            |
//! | digit      | `0-9`                                                |
//! | symbol     | `_ ? a-z A-Z 0-9 . * + ! - $ % & = < > # : \|`       |
//! | whitespace | space, `\t`, `\n`, `\v`, `\f`, `\r`, and `,`         |
//! | delimiter  | `{ } [ ] ( )`                                        |
//! | separator  | whitespace or delimiter                              |

#ifndef EDEN_LEXER_CHARS_HPP
#define EDEN_LEXER_CHARS_HPP

namespace eden::lexer::chars {

[[nodiscard]] auto is_letter(char c) -> bool;

[[nodiscard]] auto is_digit(char c) -> bool;

/// Returns true if `c` may continue a symbol, keyword, tag or ns-map name.
///
/// `/` is not a symbol character: the lexer admits it separately, once per
/// token.
[[nodiscard]] auto is_symbol_char(char c) -> bool;

/// Returns true for whitespace. Commas count as whitespace in EDN.
[[nodiscard]] auto is_whitespace(char c) -> bool;

[[nodiscard]] auto is_delimiter(char c) -> bool;

/// Returns true if `c` ends a literal, number or symbol.
[[nodiscard]] auto is_separator(char c) -> bool;

} // namespace eden::lexer::chars

#endif // EDEN_LEXER_CHARS_HPP
