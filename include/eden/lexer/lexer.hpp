//! # EDN Lexer
//!
//! This module implements the lexical analyzer for EDN text. The lexer
//! converts UTF-8 input into an ordered sequence of tokens for a reader.
//!
//! ## Features
//!
//! - **Single pass**: Input is read left to right with one character of
//!   lookahead, in a loop whose stack use does not depend on input size
//! - **Literal disambiguation**: `nil`, `true`, `false` become symbols when
//!   followed by a symbol character (`nilable`, `trueness`)
//! - **Verbatim numbers**: `42N`, `3.14M`, `-1e10` keep their text; no value
//!   is computed
//! - **Locations**: Optional 1-based line and 0-based column per token
//!
//! ## Error Handling
//!
//! Lexing stops at the first error. `tokenize()` returns either every token
//! or a single `LexError`, never both.
//!
//! ## Example
//!
//! ```cpp
//! auto result = eden::lexer::tokenize("{:a 1, :b [true nil]}", {.location = true});
//! if (is_err(result)) {
//!     std::cerr << to_string(unwrap_err(result)) << "\n";
//!     return;
//! }
//! for (const auto& token : unwrap(result)) {
//!     std::cout << token << "\n";
//! }
//! ```

#ifndef EDEN_LEXER_LEXER_HPP
#define EDEN_LEXER_LEXER_HPP

#include "eden/common.hpp"
#include "eden/lexer/cursor.hpp"
#include "eden/lexer/source.hpp"
#include "eden/lexer/token.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eden::lexer {

/// Options recognized by the lexer.
struct LexOptions {
    /// Attach the start location to every token.
    bool location = false;
};

// ============================================================================
// Errors
// ============================================================================

/// The two ways lexing can fail.
enum class LexErrorKind : uint8_t {
    UnexpectedInput, ///< No transition accepts the next character.
    UnfinishedToken, ///< A token's grammar was cut short.
};

/// An error encountered during lexical analysis.
///
/// `UnexpectedInput` errors carry the offending character in `input`.
/// `UnfinishedToken` errors carry the partial token (kind and the value
/// accumulated so far) in `token`.
struct LexError {
    LexErrorKind kind;
    std::string input;
    std::optional<Token> token;

    /// Cursor position when the error was detected.
    Location position;
};

[[nodiscard]] auto error_kind_to_string(LexErrorKind kind) -> std::string_view;

/// Renders a one-line diagnostic, e.g. `unexpected input '@' at 1:0`.
[[nodiscard]] auto to_string(const LexError& error) -> std::string;

// ============================================================================
// Lexer
// ============================================================================

/// Scanner modes.
///
/// `New` is the only mode without a token in progress.
enum class ScanMode : uint8_t {
    New,          ///< Between tokens.
    Comment,      ///< After `;`, until a line break.
    CheckLiteral, ///< After `nil`/`true`/`false`, deciding literal or symbol.
    String,       ///< Inside `"..."`.
    Symbol,       ///< Symbol, keyword, tag or ns-map name.
    Number,       ///< Sign or digits, ready for `.`, `e`, `N`, `M` or more digits.
    Fraction,     ///< After `.`, a digit is required.
    Exponent,     ///< After `e`/`E`, a sign or digit is required.
};

/// Lexical analyzer for EDN text.
///
/// A lexer scans one source. It keeps the scan state (mode, token in
/// progress, cursor) as members and drives it with an explicit loop.
///
/// # Usage
///
/// ```cpp
/// Source source = Source::from_string("[1 2.5M \\c]");
/// Lexer lexer(source);
/// auto result = lexer.tokenize();
/// ```
class Lexer {
public:
    /// Constructs a lexer for the given source.
    ///
    /// The source must outlive the lexer.
    explicit Lexer(const Source& source, LexOptions options = {});

    /// Tokenizes the entire source.
    ///
    /// Returns all tokens in source order, or the first error.
    [[nodiscard]] auto tokenize() -> Result<std::vector<Token>, LexError>;

private:
    // ========================================================================
    // State
    // ========================================================================

    const Source& source_;         ///< Reference to source being lexed.
    LexOptions options_;           ///< Options for this scan.
    size_t pos_ = 0;               ///< Current byte position in source.
    ScanMode mode_ = ScanMode::New;
    std::optional<Token> current_; ///< Token in progress; empty in `New`.
    Cursor cursor_;                ///< Position of the next unread character.
    std::vector<Token> tokens_;    ///< Finalized tokens.
    std::optional<LexError> error_;

    void reset();

    // ========================================================================
    // Character Access
    // ========================================================================

    /// Returns the current character (one UTF-8 code point).
    [[nodiscard]] auto peek() const -> std::string_view;

    /// Returns the current byte, '\0' at end of input.
    [[nodiscard]] auto peek_byte() const -> char;

    /// Moves past `text`, which must be the input at the current position.
    void consume(std::string_view text);

    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Scanner Driver
    // ========================================================================

    /// Performs one transition from the current mode.
    ///
    /// Returns false if the transition failed; `error_` is then set.
    [[nodiscard]] auto step() -> bool;

    /// Applies the end-of-input rules.
    [[nodiscard]] auto finish() -> bool;

    [[nodiscard]] auto scan_new() -> bool;
    [[nodiscard]] auto scan_comment() -> bool;
    [[nodiscard]] auto scan_check_literal() -> bool;
    [[nodiscard]] auto scan_string() -> bool;
    [[nodiscard]] auto scan_character() -> bool;
    [[nodiscard]] auto scan_dispatch() -> bool;
    [[nodiscard]] auto scan_symbol() -> bool;
    [[nodiscard]] auto scan_number() -> bool;

    // ========================================================================
    // Token Builder
    // ========================================================================

    /// Returns the cursor position if locations were requested.
    [[nodiscard]] auto start_location() const -> std::optional<Location>;

    /// Starts a token at the cursor and switches to `mode`.
    void begin_token(TokenKind kind, std::string value, ScanMode mode);

    /// Appends text to the token in progress.
    void append(std::string_view text);

    /// Changes the kind of the token in progress (integer to float).
    void retype(TokenKind kind);

    /// Turns a tentative token into another kind, keeping its text and
    /// start location, and continues in `mode`.
    void reclassify(TokenKind kind, ScanMode mode);

    /// Moves the token in progress into the output and returns to `New`.
    [[nodiscard]] auto finalize_token() -> bool;

    /// Consumes `lexeme` and outputs a complete token in one step.
    [[nodiscard]] auto emit(TokenKind kind, std::string value, std::string_view lexeme) -> bool;

    // ========================================================================
    // Error Reporting
    // ========================================================================

    [[nodiscard]] auto unexpected(std::string_view input) -> bool;
    [[nodiscard]] auto unfinished() -> bool;
    [[nodiscard]] auto unfinished(Token token) -> bool;
};

/// Tokenizes `input` in one call.
[[nodiscard]] auto tokenize(std::string_view input, LexOptions options = {})
    -> Result<std::vector<Token>, LexError>;

} // namespace eden::lexer

#endif // EDEN_LEXER_LEXER_HPP
