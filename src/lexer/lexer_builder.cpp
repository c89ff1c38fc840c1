//! # Lexer - Token Builder
//!
//! The token in progress lives in `current_`. It is started by
//! `begin_token()`, grown by `append()`, possibly retyped, and leaves only
//! through `finalize_token()`.
//!
//! ## Locations
//!
//! A token's location is read from the cursor in `begin_token()`, before
//! any of its characters are consumed. `reclassify()` keeps that location,
//! so `trueish` starts where `true` started.

#include "eden/lexer/lexer.hpp"
#include "eden/log/log.hpp"

namespace eden::lexer {

auto Lexer::start_location() const -> std::optional<Location> {
    if (!options_.location) {
        return std::nullopt;
    }
    return cursor_.location();
}

void Lexer::begin_token(TokenKind kind, std::string value, ScanMode mode) {
    current_ = Token{.kind = kind, .value = std::move(value), .location = start_location()};
    mode_ = mode;
}

void Lexer::append(std::string_view text) {
    current_->value.append(text);
}

void Lexer::retype(TokenKind kind) {
    current_->kind = kind;
}

void Lexer::reclassify(TokenKind kind, ScanMode mode) {
    EDEN_LOG_TRACE("lexer", "Reclassifying " << *current_ << " as "
                                             << token_kind_to_string(kind));
    current_->kind = kind;
    mode_ = mode;
}

auto Lexer::finalize_token() -> bool {
    if (current_->kind == TokenKind::Keyword && current_->value.empty()) {
        return unfinished();
    }

    EDEN_LOG_TRACE("lexer", "Token " << *current_);
    tokens_.push_back(std::move(*current_));
    current_.reset();
    mode_ = ScanMode::New;
    return true;
}

auto Lexer::emit(TokenKind kind, std::string value, std::string_view lexeme) -> bool {
    current_ = Token{.kind = kind, .value = std::move(value), .location = start_location()};
    consume(lexeme);
    return finalize_token();
}

} // namespace eden::lexer
