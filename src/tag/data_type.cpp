//! # Data Type Implementation
//!
//! Name table and serial-id validation for `DataType`.

#include "bintag/tag/data_type.hpp"

#include <array>

namespace bintag::tag {

namespace {

/// Canonical names, indexed by serial id.
constexpr std::array<std::string_view, DATA_TYPE_COUNT> TYPE_NAMES = {
    "BYTE",       "SHORT",       "INT",        "LONG",         "FLOAT",        "DOUBLE",
    "STRING",     "TAG",         "BYTE_ARRAY", "SHORT_ARRAY",  "INT_ARRAY",    "LONG_ARRAY",
    "FLOAT_ARRAY", "DOUBLE_ARRAY", "STRING_ARRAY", "TAG_ARRAY",
};

} // namespace

auto data_type_from_id(uint8_t id) -> Result<DataType, TagError> {
    if (id >= DATA_TYPE_COUNT) {
        return TagError::unknown_discriminant(id);
    }
    return static_cast<DataType>(id);
}

auto data_type_name(DataType type) -> Result<std::string_view, TagError> {
    auto id = serial_id(type);
    if (id >= DATA_TYPE_COUNT) {
        return TagError::unknown_discriminant(id);
    }
    return TYPE_NAMES[id];
}

auto describe(DataType type) -> std::string {
    auto name = data_type_name(type);
    if (is_ok(name)) {
        return std::string(unwrap(name));
    }
    return "<unknown " + std::to_string(serial_id(type)) + ">";
}

} // namespace bintag::tag
