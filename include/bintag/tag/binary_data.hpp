//! # Binary Data
//!
//! `BinaryData` is the leaf value of a tag document: a single scalar or a
//! homogeneous array. It covers fifteen of the sixteen data types; the
//! sixteenth, `Tag`, is the container itself (see `binary_tag.hpp`).
//!
//! ## Storage
//!
//! | Data Type | C++ Storage | Accessor Returns |
//! |-----------|-------------|------------------|
//! | `Byte` .. `Double` | `int8_t` .. `double` | the value |
//! | `String` | `std::string` | `std::string_view` |
//! | `ByteArray` .. `StringArray` | `std::vector<T>` | `std::span<const T>` |
//! | `TagArray` | `Box<TagArray>` | `std::span<const BinaryTag>` |
//!
//! The tag array is boxed so that this header only needs a forward
//! declaration of `BinaryTag`.
//!
//! ## Immutability
//!
//! A `BinaryData` never changes after construction. Replacing a value means
//! storing a new node in the parent container. Values are move-only; use
//! `copy()` for an independent deep clone.
//!
//! ## Example
//!
//! ```cpp
//! auto n = BinaryData::of_int(42);
//! auto v = n.as_int();      // Ok(42)
//! auto w = n.as_byte();     // Err(TypeMismatch: expected BYTE, got INT)
//!
//! auto pos = BinaryData::of_float_array({1.0f, 0.0f, 0.0f, 1.0f});
//! pos.size();               // 4
//! pos.to_string();          // "[F;1.0f,0.0f,0.0f,1.0f]"
//! ```

#pragma once

#include "bintag/common.hpp"
#include "bintag/tag/data_type.hpp"
#include "bintag/tag/tag_error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bintag::tag {

class BinaryTag;

/// An array of containers.
using TagArray = std::vector<BinaryTag>;

/// A scalar or array leaf value.
class BinaryData {
public:
    /// The variant holding the payload of every leaf kind.
    ///
    /// Alternatives follow serial-id order with `Tag` skipped.
    using Payload = std::variant<int8_t,                   // Byte
                                 int16_t,                  // Short
                                 int32_t,                  // Int
                                 int64_t,                  // Long
                                 float,                    // Float
                                 double,                   // Double
                                 std::string,              // String
                                 std::vector<int8_t>,      // ByteArray
                                 std::vector<int16_t>,     // ShortArray
                                 std::vector<int32_t>,     // IntArray
                                 std::vector<int64_t>,     // LongArray
                                 std::vector<float>,       // FloatArray
                                 std::vector<double>,      // DoubleArray
                                 std::vector<std::string>, // StringArray
                                 Box<TagArray>>;           // TagArray (boxed)

    ~BinaryData();
    /// A moved-from value keeps its type; a moved-from tag array is empty.
    BinaryData(BinaryData&& other) noexcept;
    auto operator=(BinaryData&& other) noexcept -> BinaryData&;
    BinaryData(const BinaryData&) = delete;
    auto operator=(const BinaryData&) -> BinaryData& = delete;

    // ========================================================================
    // Scalar Constructors
    // ========================================================================

    [[nodiscard]] static auto of_byte(int8_t value) -> BinaryData;
    [[nodiscard]] static auto of_short(int16_t value) -> BinaryData;
    [[nodiscard]] static auto of_int(int32_t value) -> BinaryData;
    [[nodiscard]] static auto of_long(int64_t value) -> BinaryData;
    [[nodiscard]] static auto of_float(float value) -> BinaryData;
    [[nodiscard]] static auto of_double(double value) -> BinaryData;
    [[nodiscard]] static auto of_string(std::string value) -> BinaryData;

    // ========================================================================
    // Array Constructors
    // ========================================================================

    [[nodiscard]] static auto of_byte_array(std::vector<int8_t> values) -> BinaryData;
    [[nodiscard]] static auto of_short_array(std::vector<int16_t> values) -> BinaryData;
    [[nodiscard]] static auto of_int_array(std::vector<int32_t> values) -> BinaryData;
    [[nodiscard]] static auto of_long_array(std::vector<int64_t> values) -> BinaryData;
    [[nodiscard]] static auto of_float_array(std::vector<float> values) -> BinaryData;
    [[nodiscard]] static auto of_double_array(std::vector<double> values) -> BinaryData;
    [[nodiscard]] static auto of_string_array(std::vector<std::string> values) -> BinaryData;

    /// Creates a tag array, taking ownership of the containers.
    [[nodiscard]] static auto of_tag_array(TagArray values) -> BinaryData;

    // ========================================================================
    // Type Queries
    // ========================================================================

    /// Returns the data type. Never `DataType::Tag`.
    [[nodiscard]] auto type() const -> DataType {
        return type_;
    }

    /// Returns `true` for the eight array kinds.
    [[nodiscard]] auto is_array() const -> bool {
        return tag::is_array(type_);
    }

    /// Returns 1 for scalars and the element count for arrays.
    [[nodiscard]] auto size() const -> size_t;

    /// Returns the raw payload, for code that dispatches on every kind.
    [[nodiscard]] auto payload() const -> const Payload& {
        return payload_;
    }

    // ========================================================================
    // Typed Accessors
    // ========================================================================
    //
    // Each accessor succeeds only when the stored type matches exactly and
    // fails with `TypeMismatch` otherwise. There is no widening.

    [[nodiscard]] auto as_byte() const -> Result<int8_t, TagError>;
    [[nodiscard]] auto as_short() const -> Result<int16_t, TagError>;
    [[nodiscard]] auto as_int() const -> Result<int32_t, TagError>;
    [[nodiscard]] auto as_long() const -> Result<int64_t, TagError>;
    [[nodiscard]] auto as_float() const -> Result<float, TagError>;
    [[nodiscard]] auto as_double() const -> Result<double, TagError>;
    [[nodiscard]] auto as_string() const -> Result<std::string_view, TagError>;

    [[nodiscard]] auto as_byte_array() const -> Result<std::span<const int8_t>, TagError>;
    [[nodiscard]] auto as_short_array() const -> Result<std::span<const int16_t>, TagError>;
    [[nodiscard]] auto as_int_array() const -> Result<std::span<const int32_t>, TagError>;
    [[nodiscard]] auto as_long_array() const -> Result<std::span<const int64_t>, TagError>;
    [[nodiscard]] auto as_float_array() const -> Result<std::span<const float>, TagError>;
    [[nodiscard]] auto as_double_array() const -> Result<std::span<const double>, TagError>;
    [[nodiscard]] auto as_string_array() const
        -> Result<std::span<const std::string>, TagError>;
    [[nodiscard]] auto as_tag_array() const -> Result<std::span<const BinaryTag>, TagError>;

    // ========================================================================
    // Copy, Comparison, Rendering
    // ========================================================================

    /// Returns a deep copy. Arrays get freshly allocated storage and tag
    /// array elements are copied recursively.
    [[nodiscard]] auto copy() const -> BinaryData;

    /// Compares type, size and contents.
    ///
    /// Floats compare by bit pattern, so a NaN equals an identical NaN and
    /// `0.0` differs from `-0.0`.
    [[nodiscard]] auto operator==(const BinaryData& other) const -> bool;

    [[nodiscard]] auto operator!=(const BinaryData& other) const -> bool {
        return !(*this == other);
    }

    /// Renders the value as diagnostic text (e.g., `42b`, `[I;1,2]`).
    [[nodiscard]] auto to_string() const -> std::string;

private:
    BinaryData(DataType type, Payload payload);

    template <typename T> auto get_as(DataType expected) const -> Result<const T*, TagError>;

    DataType type_;
    Payload payload_;
};

} // namespace bintag::tag
