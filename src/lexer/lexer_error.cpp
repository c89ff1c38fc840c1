//! # Lexer - Errors
//!
//! Lexing stops at the first error. The failing transition records a
//! `LexError` in `error_` and returns false; `tokenize()` hands it back.

#include "eden/lexer/lexer.hpp"

#include <sstream>

namespace eden::lexer {

auto error_kind_to_string(LexErrorKind kind) -> std::string_view {
    switch (kind) {
    case LexErrorKind::UnexpectedInput:
        return "unexpected input";
    case LexErrorKind::UnfinishedToken:
        return "unfinished token";
    }
    return "unknown error";
}

auto to_string(const LexError& error) -> std::string {
    std::ostringstream oss;
    oss << error_kind_to_string(error.kind);

    if (error.kind == LexErrorKind::UnexpectedInput) {
        oss << " '" << error.input << "'";
    } else if (error.token) {
        oss << " " << token_kind_to_string(error.token->kind) << " \"" << error.token->value
            << "\"";
    }

    oss << " at " << error.position;
    return oss.str();
}

auto Lexer::unexpected(std::string_view input) -> bool {
    error_ = LexError{.kind = LexErrorKind::UnexpectedInput,
                      .input = std::string(input),
                      .token = std::nullopt,
                      .position = cursor_.location()};
    return false;
}

auto Lexer::unfinished() -> bool {
    return unfinished(*current_);
}

auto Lexer::unfinished(Token token) -> bool {
    error_ = LexError{.kind = LexErrorKind::UnfinishedToken,
                      .input = "",
                      .token = std::move(token),
                      .position = cursor_.location()};
    return false;
}

} // namespace eden::lexer
