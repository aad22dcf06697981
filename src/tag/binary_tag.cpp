//! # Binary Tag Implementation
//!
//! Lookup, typed access, replacement checks, deep copy and equality for
//! `BinaryTag`. The typed getters and setters are thin wrappers over
//! `get_data_typed` and `set`; they add no behavior of their own.

#include "bintag/tag/binary_tag.hpp"

namespace bintag::tag {

namespace {

/// Looks up a leaf of the given type and applies a `BinaryData` accessor.
template <typename T>
auto read_leaf(const BinaryTag& tag, std::string_view name, DataType type,
               Result<T, TagError> (BinaryData::*accessor)() const)
    -> Result<T, TagError> {
    auto data = tag.get_data_typed(name, type);
    if (is_err(data)) {
        return unwrap_err(data);
    }
    return (unwrap(data)->*accessor)();
}

} // namespace

auto BinaryTag::with_capacity([[maybe_unused]] size_t capacity) -> BinaryTag {
    return BinaryTag();
}

auto BinaryTag::from(EntryMap entries) -> BinaryTag {
    BinaryTag tag;
    tag.entries_ = std::move(entries);
    return tag;
}

// ============================================================================
// Node Lookup
// ============================================================================

auto BinaryTag::get(std::string_view name) const -> Result<const BinaryNode*, TagError> {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return TagError::key_not_found(name);
    }
    return &it->second;
}

auto BinaryTag::get_mut(std::string_view name) -> Result<BinaryNode*, TagError> {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return TagError::key_not_found(name);
    }
    return &it->second;
}

auto BinaryTag::get_typed(std::string_view name, DataType type) const
    -> Result<const BinaryNode*, TagError> {
    auto node = get(name);
    if (is_err(node)) {
        return node;
    }
    auto actual = unwrap(node)->type();
    if (actual != type) {
        return TagError::type_mismatch(type, actual, name);
    }
    return node;
}

auto BinaryTag::get_data(std::string_view name) const -> Result<const BinaryData*, TagError> {
    auto node = get(name);
    if (is_err(node)) {
        return unwrap_err(node);
    }
    auto data = unwrap(node)->as_data();
    if (is_err(data)) {
        return TagError::composite_not_data(name);
    }
    return data;
}

auto BinaryTag::get_data_typed(std::string_view name, DataType type) const
    -> Result<const BinaryData*, TagError> {
    auto data = get_data(name);
    if (is_err(data)) {
        return data;
    }
    auto actual = unwrap(data)->type();
    if (actual != type) {
        return TagError::type_mismatch(type, actual, name);
    }
    return data;
}

// ============================================================================
// Typed Getters
// ============================================================================

auto BinaryTag::get_byte(std::string_view name) const -> Result<int8_t, TagError> {
    return read_leaf(*this, name, DataType::Byte, &BinaryData::as_byte);
}

auto BinaryTag::get_short(std::string_view name) const -> Result<int16_t, TagError> {
    return read_leaf(*this, name, DataType::Short, &BinaryData::as_short);
}

auto BinaryTag::get_int(std::string_view name) const -> Result<int32_t, TagError> {
    return read_leaf(*this, name, DataType::Int, &BinaryData::as_int);
}

auto BinaryTag::get_long(std::string_view name) const -> Result<int64_t, TagError> {
    return read_leaf(*this, name, DataType::Long, &BinaryData::as_long);
}

auto BinaryTag::get_float(std::string_view name) const -> Result<float, TagError> {
    return read_leaf(*this, name, DataType::Float, &BinaryData::as_float);
}

auto BinaryTag::get_double(std::string_view name) const -> Result<double, TagError> {
    return read_leaf(*this, name, DataType::Double, &BinaryData::as_double);
}

auto BinaryTag::get_string(std::string_view name) const -> Result<std::string_view, TagError> {
    return read_leaf(*this, name, DataType::String, &BinaryData::as_string);
}

auto BinaryTag::get_byte_array(std::string_view name) const
    -> Result<std::span<const int8_t>, TagError> {
    return read_leaf(*this, name, DataType::ByteArray, &BinaryData::as_byte_array);
}

auto BinaryTag::get_short_array(std::string_view name) const
    -> Result<std::span<const int16_t>, TagError> {
    return read_leaf(*this, name, DataType::ShortArray, &BinaryData::as_short_array);
}

auto BinaryTag::get_int_array(std::string_view name) const
    -> Result<std::span<const int32_t>, TagError> {
    return read_leaf(*this, name, DataType::IntArray, &BinaryData::as_int_array);
}

auto BinaryTag::get_long_array(std::string_view name) const
    -> Result<std::span<const int64_t>, TagError> {
    return read_leaf(*this, name, DataType::LongArray, &BinaryData::as_long_array);
}

auto BinaryTag::get_float_array(std::string_view name) const
    -> Result<std::span<const float>, TagError> {
    return read_leaf(*this, name, DataType::FloatArray, &BinaryData::as_float_array);
}

auto BinaryTag::get_double_array(std::string_view name) const
    -> Result<std::span<const double>, TagError> {
    return read_leaf(*this, name, DataType::DoubleArray, &BinaryData::as_double_array);
}

auto BinaryTag::get_string_array(std::string_view name) const
    -> Result<std::span<const std::string>, TagError> {
    return read_leaf(*this, name, DataType::StringArray, &BinaryData::as_string_array);
}

auto BinaryTag::get_tag_array(std::string_view name) const
    -> Result<std::span<const BinaryTag>, TagError> {
    return read_leaf(*this, name, DataType::TagArray, &BinaryData::as_tag_array);
}

auto BinaryTag::get_tag(std::string_view name) const -> Result<const BinaryTag*, TagError> {
    auto node = get_typed(name, DataType::Tag);
    if (is_err(node)) {
        return unwrap_err(node);
    }
    return unwrap(node)->as_tag();
}

auto BinaryTag::get_tag_mut(std::string_view name) -> Result<BinaryTag*, TagError> {
    auto node = get_mut(name);
    if (is_err(node)) {
        return unwrap_err(node);
    }
    auto actual = unwrap(node)->type();
    if (actual != DataType::Tag) {
        return TagError::type_mismatch(DataType::Tag, actual, name);
    }
    return unwrap(node)->as_tag_mut();
}

// ============================================================================
// Mutation
// ============================================================================

auto BinaryTag::set(std::string_view name, BinaryNode node, bool check_type)
    -> Result<Unit, TagError> {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        entries_.emplace(std::string(name), std::move(node));
        return Unit{};
    }

    if (check_type && it->second.type() != node.type()) {
        return TagError::incompatible_replacement(name, it->second.type(), node.type());
    }
    it->second = std::move(node);
    return Unit{};
}

auto BinaryTag::set_byte(std::string_view name, int8_t value) -> Result<Unit, TagError> {
    return set(name, BinaryData::of_byte(value));
}

auto BinaryTag::set_short(std::string_view name, int16_t value) -> Result<Unit, TagError> {
    return set(name, BinaryData::of_short(value));
}

auto BinaryTag::set_int(std::string_view name, int32_t value) -> Result<Unit, TagError> {
    return set(name, BinaryData::of_int(value));
}

auto BinaryTag::set_long(std::string_view name, int64_t value) -> Result<Unit, TagError> {
    return set(name, BinaryData::of_long(value));
}

auto BinaryTag::set_float(std::string_view name, float value) -> Result<Unit, TagError> {
    return set(name, BinaryData::of_float(value));
}

auto BinaryTag::set_double(std::string_view name, double value) -> Result<Unit, TagError> {
    return set(name, BinaryData::of_double(value));
}

auto BinaryTag::set_string(std::string_view name, std::string value) -> Result<Unit, TagError> {
    return set(name, BinaryData::of_string(std::move(value)));
}

auto BinaryTag::set_byte_array(std::string_view name, std::vector<int8_t> values)
    -> Result<Unit, TagError> {
    return set(name, BinaryData::of_byte_array(std::move(values)));
}

auto BinaryTag::set_short_array(std::string_view name, std::vector<int16_t> values)
    -> Result<Unit, TagError> {
    return set(name, BinaryData::of_short_array(std::move(values)));
}

auto BinaryTag::set_int_array(std::string_view name, std::vector<int32_t> values)
    -> Result<Unit, TagError> {
    return set(name, BinaryData::of_int_array(std::move(values)));
}

auto BinaryTag::set_long_array(std::string_view name, std::vector<int64_t> values)
    -> Result<Unit, TagError> {
    return set(name, BinaryData::of_long_array(std::move(values)));
}

auto BinaryTag::set_float_array(std::string_view name, std::vector<float> values)
    -> Result<Unit, TagError> {
    return set(name, BinaryData::of_float_array(std::move(values)));
}

auto BinaryTag::set_double_array(std::string_view name, std::vector<double> values)
    -> Result<Unit, TagError> {
    return set(name, BinaryData::of_double_array(std::move(values)));
}

auto BinaryTag::set_string_array(std::string_view name, std::vector<std::string> values)
    -> Result<Unit, TagError> {
    return set(name, BinaryData::of_string_array(std::move(values)));
}

auto BinaryTag::set_tag_array(std::string_view name, TagArray values) -> Result<Unit, TagError> {
    return set(name, BinaryData::of_tag_array(std::move(values)));
}

auto BinaryTag::set_tag(std::string_view name, BinaryTag value) -> Result<Unit, TagError> {
    return set(name, BinaryNode(std::move(value)));
}

auto BinaryTag::remove(std::string_view name) -> std::optional<BinaryNode> {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    BinaryNode node = std::move(it->second);
    entries_.erase(it);
    return node;
}

// ============================================================================
// Copy and Equality
// ============================================================================

auto BinaryTag::copy() const -> BinaryTag {
    BinaryTag result;
    for (const auto& [key, node] : entries_) {
        result.entries_.emplace_hint(result.entries_.end(), key, node.copy());
    }
    return result;
}

auto BinaryTag::operator==(const BinaryTag& other) const -> bool {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& [key, node] : entries_) {
        auto it = other.entries_.find(key);
        if (it == other.entries_.end() || it->second != node) {
            return false;
        }
    }
    return true;
}

} // namespace bintag::tag
