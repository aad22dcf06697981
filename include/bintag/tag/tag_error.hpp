//! # Tag Error Types
//!
//! This module provides the error type returned by every fallible operation
//! of the tag library: typed accessors, container lookups, replacement
//! checks and the binary codec.
//!
//! ## Error Kinds
//!
//! | Kind | Raised by |
//! |------|-----------|
//! | `TypeMismatch` | Accessor or typed getter against a value of another type |
//! | `KeyNotFound` | Container lookup of a missing entry |
//! | `CompositeNotData` | Leaf-only getter against a stored container |
//! | `IncompatibleReplacement` | Type-checked `set` changing an entry's type |
//! | `UnknownDiscriminant` | Decoder reading a type byte outside 0-15 |
//! | `InvalidData` | Malformed payload (negative count, bad UTF-8, oversize string) |
//! | `Io` | Byte sink/source failure, forwarded unchanged by the codec |
//!
//! ## Example
//!
//! ```cpp
//! auto result = tag.get_int("missing");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//!     // Output: "KeyNotFound: no entry named 'missing'"
//! }
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bintag::tag {

enum class DataType : uint8_t;

/// The category of a `TagError`.
enum class TagErrorKind : uint8_t {
    TypeMismatch,            ///< Stored type differs from the requested one
    KeyNotFound,             ///< No entry under the requested name
    CompositeNotData,        ///< A container was found where leaf data was required
    IncompatibleReplacement, ///< Type-checked `set` would change an entry's type
    UnknownDiscriminant,     ///< Type byte outside the valid range
    InvalidData,             ///< Malformed or unencodable payload
    Io                       ///< Failure reported by a byte sink or source
};

/// Returns the display name of an error kind (e.g., "TypeMismatch").
[[nodiscard]] auto error_kind_name(TagErrorKind kind) -> const char*;

/// An error produced by the tag library.
///
/// `TagError` contains the error category, a human-readable message and
/// optional context: the entry name, the expected and actual data types for
/// type errors, and the byte offset for codec errors.
struct TagError {
    /// The error category.
    TagErrorKind kind;

    /// Human-readable error description.
    std::string message;

    /// Name of the container entry involved (empty if none).
    std::string key;

    /// Type that was required, for type errors.
    std::optional<DataType> expected;

    /// Type that was found, for type errors.
    std::optional<DataType> actual;

    /// Byte offset in the stream, for codec errors.
    std::optional<size_t> offset;

    /// Creates a `TypeMismatch` error.
    ///
    /// # Arguments
    ///
    /// * `expected` - The type the caller asked for
    /// * `actual` - The type that is stored
    /// * `key` - The entry name, if the value came from a container
    static auto type_mismatch(DataType expected, DataType actual, std::string_view key = {})
        -> TagError;

    /// Creates a `KeyNotFound` error for the given entry name.
    static auto key_not_found(std::string_view key) -> TagError;

    /// Creates a `CompositeNotData` error for the given entry name.
    static auto composite_not_data(std::string_view key = {}) -> TagError;

    /// Creates an `IncompatibleReplacement` error.
    ///
    /// # Arguments
    ///
    /// * `key` - The entry being replaced
    /// * `previous` - Type of the stored value
    /// * `replacement` - Type of the rejected value
    static auto incompatible_replacement(std::string_view key, DataType previous,
                                         DataType replacement) -> TagError;

    /// Creates an `UnknownDiscriminant` error for a raw type byte.
    static auto unknown_discriminant(unsigned id, std::optional<size_t> offset = std::nullopt)
        -> TagError;

    /// Creates an `InvalidData` error.
    static auto invalid_data(std::string msg, std::optional<size_t> offset = std::nullopt)
        -> TagError;

    /// Creates an `Io` error.
    static auto io(std::string msg, std::optional<size_t> offset = std::nullopt) -> TagError;

    /// Formats the error as a human-readable string.
    ///
    /// The format is `"offset N: Kind: message"` when an offset is known and
    /// `"Kind: message"` otherwise.
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace bintag::tag
