//! # Binary Data Implementation
//!
//! Constructors, typed accessors, deep copy and equality for `BinaryData`.
//! Rendering lives in `tag_format.cpp`.
//!
//! ## Equality Semantics
//!
//! | Kind | Comparison Rule |
//! |------|-----------------|
//! | integers, strings | Value comparison |
//! | `Float`, `Double` | Bit-pattern comparison |
//! | numeric / string arrays | Element-wise, in order |
//! | `TagArray` | Element-wise container equality, in order |
//!
//! Values of different types are never equal.

#include "bintag/tag/binary_data.hpp"

#include "bintag/tag/binary_tag.hpp"

#include <algorithm>
#include <bit>
#include <span>
#include <type_traits>

namespace bintag::tag {

namespace {

template <typename T> auto same_element(const T& a, const T& b) -> bool {
    if constexpr (std::is_same_v<T, float>) {
        return std::bit_cast<uint32_t>(a) == std::bit_cast<uint32_t>(b);
    } else if constexpr (std::is_same_v<T, double>) {
        return std::bit_cast<uint64_t>(a) == std::bit_cast<uint64_t>(b);
    } else {
        return a == b;
    }
}

template <typename T> auto same_elements(const std::vector<T>& a, const std::vector<T>& b) -> bool {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](const T& x, const T& y) { return same_element(x, y); });
}

/// Elements of a boxed tag array. A moved-from box reads as empty.
auto tag_items(const Box<TagArray>& boxed) -> std::span<const BinaryTag> {
    if (!boxed) {
        return {};
    }
    return std::span<const BinaryTag>(*boxed);
}

} // namespace

BinaryData::BinaryData(DataType type, Payload payload)
    : type_(type), payload_(std::move(payload)) {}

BinaryData::~BinaryData() = default;
BinaryData::BinaryData(BinaryData&& other) noexcept = default;
auto BinaryData::operator=(BinaryData&& other) noexcept -> BinaryData& = default;

// ============================================================================
// Constructors
// ============================================================================

auto BinaryData::of_byte(int8_t value) -> BinaryData {
    return BinaryData(DataType::Byte, value);
}

auto BinaryData::of_short(int16_t value) -> BinaryData {
    return BinaryData(DataType::Short, value);
}

auto BinaryData::of_int(int32_t value) -> BinaryData {
    return BinaryData(DataType::Int, value);
}

auto BinaryData::of_long(int64_t value) -> BinaryData {
    return BinaryData(DataType::Long, value);
}

auto BinaryData::of_float(float value) -> BinaryData {
    return BinaryData(DataType::Float, value);
}

auto BinaryData::of_double(double value) -> BinaryData {
    return BinaryData(DataType::Double, value);
}

auto BinaryData::of_string(std::string value) -> BinaryData {
    return BinaryData(DataType::String, std::move(value));
}

auto BinaryData::of_byte_array(std::vector<int8_t> values) -> BinaryData {
    return BinaryData(DataType::ByteArray, std::move(values));
}

auto BinaryData::of_short_array(std::vector<int16_t> values) -> BinaryData {
    return BinaryData(DataType::ShortArray, std::move(values));
}

auto BinaryData::of_int_array(std::vector<int32_t> values) -> BinaryData {
    return BinaryData(DataType::IntArray, std::move(values));
}

auto BinaryData::of_long_array(std::vector<int64_t> values) -> BinaryData {
    return BinaryData(DataType::LongArray, std::move(values));
}

auto BinaryData::of_float_array(std::vector<float> values) -> BinaryData {
    return BinaryData(DataType::FloatArray, std::move(values));
}

auto BinaryData::of_double_array(std::vector<double> values) -> BinaryData {
    return BinaryData(DataType::DoubleArray, std::move(values));
}

auto BinaryData::of_string_array(std::vector<std::string> values) -> BinaryData {
    return BinaryData(DataType::StringArray, std::move(values));
}

auto BinaryData::of_tag_array(TagArray values) -> BinaryData {
    return BinaryData(DataType::TagArray, make_box<TagArray>(std::move(values)));
}

// ============================================================================
// Accessors
// ============================================================================

template <typename T>
auto BinaryData::get_as(DataType expected) const -> Result<const T*, TagError> {
    if (type_ != expected) {
        return TagError::type_mismatch(expected, type_);
    }
    return &std::get<T>(payload_);
}

auto BinaryData::size() const -> size_t {
    return std::visit(
        [](const auto& value) -> size_t {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Box<TagArray>>) {
                return tag_items(value).size();
            } else if constexpr (std::is_arithmetic_v<T> || std::is_same_v<T, std::string>) {
                return 1;
            } else {
                return value.size();
            }
        },
        payload_);
}

auto BinaryData::as_byte() const -> Result<int8_t, TagError> {
    auto r = get_as<int8_t>(DataType::Byte);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return *unwrap(r);
}

auto BinaryData::as_short() const -> Result<int16_t, TagError> {
    auto r = get_as<int16_t>(DataType::Short);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return *unwrap(r);
}

auto BinaryData::as_int() const -> Result<int32_t, TagError> {
    auto r = get_as<int32_t>(DataType::Int);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return *unwrap(r);
}

auto BinaryData::as_long() const -> Result<int64_t, TagError> {
    auto r = get_as<int64_t>(DataType::Long);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return *unwrap(r);
}

auto BinaryData::as_float() const -> Result<float, TagError> {
    auto r = get_as<float>(DataType::Float);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return *unwrap(r);
}

auto BinaryData::as_double() const -> Result<double, TagError> {
    auto r = get_as<double>(DataType::Double);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return *unwrap(r);
}

auto BinaryData::as_string() const -> Result<std::string_view, TagError> {
    auto r = get_as<std::string>(DataType::String);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return std::string_view(*unwrap(r));
}

auto BinaryData::as_byte_array() const -> Result<std::span<const int8_t>, TagError> {
    auto r = get_as<std::vector<int8_t>>(DataType::ByteArray);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return std::span<const int8_t>(*unwrap(r));
}

auto BinaryData::as_short_array() const -> Result<std::span<const int16_t>, TagError> {
    auto r = get_as<std::vector<int16_t>>(DataType::ShortArray);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return std::span<const int16_t>(*unwrap(r));
}

auto BinaryData::as_int_array() const -> Result<std::span<const int32_t>, TagError> {
    auto r = get_as<std::vector<int32_t>>(DataType::IntArray);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return std::span<const int32_t>(*unwrap(r));
}

auto BinaryData::as_long_array() const -> Result<std::span<const int64_t>, TagError> {
    auto r = get_as<std::vector<int64_t>>(DataType::LongArray);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return std::span<const int64_t>(*unwrap(r));
}

auto BinaryData::as_float_array() const -> Result<std::span<const float>, TagError> {
    auto r = get_as<std::vector<float>>(DataType::FloatArray);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return std::span<const float>(*unwrap(r));
}

auto BinaryData::as_double_array() const -> Result<std::span<const double>, TagError> {
    auto r = get_as<std::vector<double>>(DataType::DoubleArray);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return std::span<const double>(*unwrap(r));
}

auto BinaryData::as_string_array() const -> Result<std::span<const std::string>, TagError> {
    auto r = get_as<std::vector<std::string>>(DataType::StringArray);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return std::span<const std::string>(*unwrap(r));
}

auto BinaryData::as_tag_array() const -> Result<std::span<const BinaryTag>, TagError> {
    auto r = get_as<Box<TagArray>>(DataType::TagArray);
    if (is_err(r)) {
        return unwrap_err(r);
    }
    return tag_items(*unwrap(r));
}

// ============================================================================
// Copy and Equality
// ============================================================================

auto BinaryData::copy() const -> BinaryData {
    return std::visit(
        [this](const auto& value) -> BinaryData {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Box<TagArray>>) {
                auto items = tag_items(value);
                TagArray cloned;
                cloned.reserve(items.size());
                for (const auto& tag : items) {
                    cloned.push_back(tag.copy());
                }
                return of_tag_array(std::move(cloned));
            } else {
                return BinaryData(type_, Payload(std::in_place_type<T>, value));
            }
        },
        payload_);
}

auto BinaryData::operator==(const BinaryData& other) const -> bool {
    if (type_ != other.type_ || payload_.index() != other.payload_.index()) {
        return false;
    }
    if (size() != other.size()) {
        return false;
    }

    return std::visit(
        [&other](const auto& value) -> bool {
            using T = std::decay_t<decltype(value)>;
            const auto& rhs = std::get<T>(other.payload_);
            if constexpr (std::is_same_v<T, Box<TagArray>>) {
                auto a = tag_items(value);
                auto b = tag_items(rhs);
                for (size_t i = 0; i < a.size(); ++i) {
                    if (a[i] != b[i]) {
                        return false;
                    }
                }
                return true;
            } else if constexpr (std::is_arithmetic_v<T> || std::is_same_v<T, std::string>) {
                return same_element(value, rhs);
            } else {
                return same_elements(value, rhs);
            }
        },
        payload_);
}

} // namespace bintag::tag
