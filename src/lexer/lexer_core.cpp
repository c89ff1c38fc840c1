//! # Lexer Core
//!
//! This file implements the scanning loop and the pieces every mode shares:
//!
//! - **Driver**: `tokenize()`, `step()` and the end-of-input rules
//! - **Character access**: `peek()`, `consume()`, `is_at_end()`
//! - **Comments**: `; ...` up to the next line break
//!
//! ## Scan Loop
//!
//! `tokenize()` calls `step()` until the input is exhausted. Each step looks
//! at the current mode and the next character, consumes zero or more
//! characters, and may finalize a token. A step that consumes nothing always
//! changes the mode, so the loop cannot stall.
//!
//! ## End of Input
//!
//! | Mode                           | Result                        |
//! |--------------------------------|-------------------------------|
//! | `String`, `Fraction`, `Exponent` | unfinished-token error      |
//! | any other                      | pending token is finalized    |

#include "eden/lexer/lexer.hpp"
#include "eden/log/log.hpp"

namespace eden::lexer {

Lexer::Lexer(const Source& source, LexOptions options) : source_(source), options_(options) {}

void Lexer::reset() {
    pos_ = 0;
    mode_ = ScanMode::New;
    current_.reset();
    cursor_ = Cursor{};
    tokens_.clear();
    error_.reset();
}

auto Lexer::tokenize() -> Result<std::vector<Token>, LexError> {
    reset();
    EDEN_LOG_DEBUG("lexer", "Tokenizing " << source_.length() << " bytes"
                                          << (options_.location ? " with locations" : ""));

    bool ok = true;
    while (ok && !is_at_end()) {
        ok = step();
    }
    if (ok) {
        ok = finish();
    }

    if (!ok) {
        EDEN_LOG_DEBUG("lexer", "Tokenizing failed: " << to_string(*error_));
        return std::move(*error_);
    }

    EDEN_LOG_DEBUG("lexer", "Produced " << tokens_.size() << " tokens");
    return std::move(tokens_);
}

auto Lexer::peek() const -> std::string_view {
    return source_.char_at(pos_);
}

auto Lexer::peek_byte() const -> char {
    return source_.at(pos_);
}

void Lexer::consume(std::string_view text) {
    cursor_.advance(text);
    pos_ += text.size();
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::step() -> bool {
    switch (mode_) {
    case ScanMode::New:
        return scan_new();
    case ScanMode::Comment:
        return scan_comment();
    case ScanMode::CheckLiteral:
        return scan_check_literal();
    case ScanMode::String:
        return scan_string();
    case ScanMode::Symbol:
        return scan_symbol();
    case ScanMode::Number:
    case ScanMode::Fraction:
    case ScanMode::Exponent:
        return scan_number();
    }
    return unexpected(peek());
}

auto Lexer::finish() -> bool {
    switch (mode_) {
    case ScanMode::String:
    case ScanMode::Fraction:
    case ScanMode::Exponent:
        return unfinished();
    default:
        break;
    }

    if (current_) {
        return finalize_token();
    }
    return true;
}

auto Lexer::scan_comment() -> bool {
    auto ch = peek();
    char c = ch.front();

    if (c == '\n' || c == '\r') {
        consume(ch);
        return finalize_token();
    }

    consume(ch);
    if (c != ';') {
        append(ch);
    }
    return true;
}

auto tokenize(std::string_view input, LexOptions options) -> Result<std::vector<Token>, LexError> {
    Source source = Source::from_string(std::string(input));
    Lexer lexer(source, options);
    return lexer.tokenize();
}

} // namespace eden::lexer
