//! # Data Types
//!
//! The fixed set of sixteen value kinds. A `DataType` is both the in-memory
//! discriminant of a value and the one-byte prefix written before every
//! value on the wire.
//!
//! ## Serial Ids
//!
//! | Id | Type | Id | Type |
//! |----|------|----|------|
//! | 0 | `Byte` | 8 | `ByteArray` |
//! | 1 | `Short` | 9 | `ShortArray` |
//! | 2 | `Int` | 10 | `IntArray` |
//! | 3 | `Long` | 11 | `LongArray` |
//! | 4 | `Float` | 12 | `FloatArray` |
//! | 5 | `Double` | 13 | `DoubleArray` |
//! | 6 | `String` | 14 | `StringArray` |
//! | 7 | `Tag` | 15 | `TagArray` |
//!
//! Ids are append-only: existing values never change meaning.

#pragma once

#include "bintag/common.hpp"
#include "bintag/tag/tag_error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace bintag::tag {

/// The kind of a value, in serial-id order.
enum class DataType : uint8_t {
    Byte,        ///< 8-bit signed integer
    Short,       ///< 16-bit signed integer
    Int,         ///< 32-bit signed integer
    Long,        ///< 64-bit signed integer
    Float,       ///< 32-bit IEEE 754 float
    Double,      ///< 64-bit IEEE 754 float
    String,      ///< UTF-8 text
    Tag,         ///< Named container of further values
    ByteArray,   ///< Array of `Byte`
    ShortArray,  ///< Array of `Short`
    IntArray,    ///< Array of `Int`
    LongArray,   ///< Array of `Long`
    FloatArray,  ///< Array of `Float`
    DoubleArray, ///< Array of `Double`
    StringArray, ///< Array of `String`
    TagArray     ///< Array of `Tag`
};

/// Number of defined data types.
inline constexpr size_t DATA_TYPE_COUNT = 16;

/// Returns the byte written on the wire for a data type.
[[nodiscard]] constexpr auto serial_id(DataType type) -> uint8_t {
    return static_cast<uint8_t>(type);
}

/// Returns `true` for the eight array kinds.
[[nodiscard]] constexpr auto is_array(DataType type) -> bool {
    return serial_id(type) >= serial_id(DataType::ByteArray) &&
           serial_id(type) <= serial_id(DataType::TagArray);
}

/// Returns `true` for `Tag`, the only composite kind.
[[nodiscard]] constexpr auto is_composite(DataType type) -> bool {
    return type == DataType::Tag;
}

/// Returns the element type of an array kind, or `type` itself otherwise.
///
/// Array kinds are laid out eight ids after their element kinds.
[[nodiscard]] constexpr auto element_type(DataType type) -> DataType {
    return is_array(type) ? static_cast<DataType>(serial_id(type) - 8) : type;
}

/// Converts a serial id read from a stream into a data type.
///
/// # Returns
///
/// The data type, or an `UnknownDiscriminant` error for ids of 16 and above.
[[nodiscard]] auto data_type_from_id(uint8_t id) -> Result<DataType, TagError>;

/// Returns the canonical name of a data type (e.g., "INT", "FLOAT_ARRAY").
///
/// Fails with `UnknownDiscriminant` when `type` holds a value outside the
/// declared enumerators, which can only happen through a cast from
/// untrusted input.
[[nodiscard]] auto data_type_name(DataType type) -> Result<std::string_view, TagError>;

/// Returns the canonical name, or `"<unknown N>"` for out-of-range values.
///
/// Used when building diagnostics, where failing is not an option.
[[nodiscard]] auto describe(DataType type) -> std::string;

} // namespace bintag::tag
