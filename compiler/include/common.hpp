//! # Common Definitions
//!
//! Version constants and the `Result` type shared by every autojit
//! component. Errors never travel as exceptions: each fallible operation
//! returns `Result<T, JitError>` and callers test it with `is_ok`/`is_err`.
//! There is no process-wide compiler state; registries hang off a
//! `jit::JitContext` handed to each entry point.

#ifndef AUTOJIT_COMMON_HPP
#define AUTOJIT_COMMON_HPP

#include <string>
#include <variant>

namespace autojit {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<Signature, JitError> parsed = parse_signature("f8(f8)");
/// if (is_ok(parsed)) {
///     const Signature& sig = unwrap(parsed);
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
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace autojit

#endif // AUTOJIT_COMMON_HPP
