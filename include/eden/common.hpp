//! # Common Definitions
//!
//! This module provides the small set of types shared by every eden
//! component.
//!
//! ## Overview
//!
//! - **Version Information**: Library version constants
//! - **Result Type**: Error handling without exceptions
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Values over handles**: Tokens and errors are plain copyable values

#ifndef EDEN_COMMON_HPP
#define EDEN_COMMON_HPP

#include <string>
#include <variant>

namespace eden {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 1;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions.
///
/// # Example
///
/// ```cpp
/// auto result = eden::lexer::tokenize("[1 2 3]");
/// if (is_ok(result)) {
///     for (const auto& token : unwrap(result)) { ... }
/// } else {
///     report(unwrap_err(result));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace eden

#endif // EDEN_COMMON_HPP
