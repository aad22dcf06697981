//! # Common Definitions
//!
//! This module provides common types and utilities used throughout the
//! bintag library. It establishes the foundational abstractions that every
//! other component depends on.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Library version constants
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique ownership
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors on data paths are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership; documents are trees

#ifndef BINTAG_COMMON_HPP
#define BINTAG_COMMON_HPP

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bintag {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string (e.g., "1.0.0").
constexpr const char* VERSION = "1.0.0";

/// Major version number.
constexpr int VERSION_MAJOR = 1;

/// Minor version number.
constexpr int VERSION_MINOR = 0;

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
/// auto result = tag.get_int("number");
/// if (is_ok(result)) {
///     int32_t value = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// The success value of operations that produce nothing.
using Unit = std::monostate;

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

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
///
/// `Box<T>` represents unique ownership of a heap-allocated value.
/// When the Box is dropped, the value is deallocated.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
///
/// # Example
///
/// ```cpp
/// auto ptr = make_box<BinaryTag>();
/// ```
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace bintag

#endif // BINTAG_COMMON_HPP
