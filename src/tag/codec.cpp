//! # Binary Tag Codec Implementation
//!
//! Leaf payloads are encoded through a single table indexed by serial id.
//! Each row holds the write and read functions for one leaf kind, built
//! from a handful of templates over the element type. The container kind
//! has no row; it is handled by `write_tag_contents` / `read_tag_contents`,
//! which recurse back into the node functions for their entries.
//!
//! ## Offsets
//!
//! Decoding errors carry the offset of the offending field: the type byte
//! for `UnknownDiscriminant`, the count for a negative count, and the first
//! byte that could not be read for `Io`.
//!
//! ## Nesting
//!
//! Decoding tracks container depth. A container at `MAX_DECODE_DEPTH`
//! fails with `InvalidData` at the offset of its count.
//!
//! ## See Also
//!
//! - `data_io.cpp` - Big-endian primitives and modified UTF-8

#include "bintag/tag/codec.hpp"

#include "bintag/log/log.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <string>
#include <type_traits>

namespace bintag::tag {

namespace {

using WriteFn = Result<Unit, TagError> (*)(const BinaryData&, DataWriter&);
using ReadFn = Result<BinaryData, TagError> (*)(DataReader&, size_t depth);

/// Write and read functions for one leaf kind.
struct DataCodec {
    WriteFn write;
    ReadFn read;
};

// ============================================================================
// Element Primitives
// ============================================================================

template <typename T> auto write_value(DataWriter& writer, const T& value) -> Result<Unit, TagError> {
    if constexpr (std::is_same_v<T, int8_t>) {
        return writer.write_i8(value);
    } else if constexpr (std::is_same_v<T, int16_t>) {
        return writer.write_i16(value);
    } else if constexpr (std::is_same_v<T, int32_t>) {
        return writer.write_i32(value);
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return writer.write_i64(value);
    } else if constexpr (std::is_same_v<T, float>) {
        return writer.write_f32(value);
    } else if constexpr (std::is_same_v<T, double>) {
        return writer.write_f64(value);
    } else {
        return writer.write_utf(value);
    }
}

template <typename T> auto read_value(DataReader& reader) -> Result<T, TagError> {
    if constexpr (std::is_same_v<T, int8_t>) {
        return reader.read_i8();
    } else if constexpr (std::is_same_v<T, int16_t>) {
        return reader.read_i16();
    } else if constexpr (std::is_same_v<T, int32_t>) {
        return reader.read_i32();
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return reader.read_i64();
    } else if constexpr (std::is_same_v<T, float>) {
        return reader.read_f32();
    } else if constexpr (std::is_same_v<T, double>) {
        return reader.read_f64();
    } else {
        return reader.read_utf();
    }
}

template <typename T> auto make_scalar(T value) -> BinaryData {
    if constexpr (std::is_same_v<T, int8_t>) {
        return BinaryData::of_byte(value);
    } else if constexpr (std::is_same_v<T, int16_t>) {
        return BinaryData::of_short(value);
    } else if constexpr (std::is_same_v<T, int32_t>) {
        return BinaryData::of_int(value);
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return BinaryData::of_long(value);
    } else if constexpr (std::is_same_v<T, float>) {
        return BinaryData::of_float(value);
    } else if constexpr (std::is_same_v<T, double>) {
        return BinaryData::of_double(value);
    } else {
        return BinaryData::of_string(std::move(value));
    }
}

template <typename T> auto make_array(std::vector<T> values) -> BinaryData {
    if constexpr (std::is_same_v<T, int8_t>) {
        return BinaryData::of_byte_array(std::move(values));
    } else if constexpr (std::is_same_v<T, int16_t>) {
        return BinaryData::of_short_array(std::move(values));
    } else if constexpr (std::is_same_v<T, int32_t>) {
        return BinaryData::of_int_array(std::move(values));
    } else if constexpr (std::is_same_v<T, int64_t>) {
        return BinaryData::of_long_array(std::move(values));
    } else if constexpr (std::is_same_v<T, float>) {
        return BinaryData::of_float_array(std::move(values));
    } else if constexpr (std::is_same_v<T, double>) {
        return BinaryData::of_double_array(std::move(values));
    } else {
        return BinaryData::of_string_array(std::move(values));
    }
}

// ============================================================================
// Counts
// ============================================================================

auto write_count(DataWriter& writer, size_t count) -> Result<Unit, TagError> {
    if (count > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return TagError::invalid_data("cannot encode " + std::to_string(count) +
                                          " elements, limit is 2147483647",
                                      writer.bytes_written());
    }
    return writer.write_i32(static_cast<int32_t>(count));
}

auto read_count(DataReader& reader) -> Result<size_t, TagError> {
    size_t at = reader.offset();
    auto count = reader.read_i32();
    if (is_err(count)) {
        return unwrap_err(count);
    }
    if (unwrap(count) < 0) {
        return TagError::invalid_data("negative count " + std::to_string(unwrap(count)), at);
    }
    return static_cast<size_t>(unwrap(count));
}

// ============================================================================
// Per-Kind Codecs
// ============================================================================

template <typename T>
auto write_scalar(const BinaryData& data, DataWriter& writer) -> Result<Unit, TagError> {
    return write_value(writer, std::get<T>(data.payload()));
}

template <typename T>
auto read_scalar(DataReader& reader, size_t /*depth*/) -> Result<BinaryData, TagError> {
    auto value = read_value<T>(reader);
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return make_scalar<T>(std::move(unwrap(value)));
}

template <typename T>
auto write_array(const BinaryData& data, DataWriter& writer) -> Result<Unit, TagError> {
    const auto& values = std::get<std::vector<T>>(data.payload());
    auto status = write_count(writer, values.size());
    if (is_err(status)) {
        return status;
    }
    for (const auto& value : values) {
        status = write_value(writer, value);
        if (is_err(status)) {
            return status;
        }
    }
    return Unit{};
}

template <typename T>
auto read_array(DataReader& reader, size_t /*depth*/) -> Result<BinaryData, TagError> {
    auto count = read_count(reader);
    if (is_err(count)) {
        return unwrap_err(count);
    }

    std::vector<T> values;
    values.reserve(std::min(unwrap(count), MAX_PREALLOCATED_ELEMENTS));
    for (size_t i = 0; i < unwrap(count); ++i) {
        auto value = read_value<T>(reader);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        values.push_back(std::move(unwrap(value)));
    }
    return make_array<T>(std::move(values));
}

auto write_tag_array(const BinaryData& data, DataWriter& writer) -> Result<Unit, TagError> {
    auto tags = unwrap(data.as_tag_array());
    auto status = write_count(writer, tags.size());
    if (is_err(status)) {
        return status;
    }
    for (const auto& tag : tags) {
        status = write_tag_contents(tag, writer);
        if (is_err(status)) {
            return status;
        }
    }
    return Unit{};
}

auto read_tag_array(DataReader& reader, size_t depth) -> Result<BinaryData, TagError> {
    auto count = read_count(reader);
    if (is_err(count)) {
        return unwrap_err(count);
    }

    TagArray tags;
    tags.reserve(std::min(unwrap(count), MAX_PREALLOCATED_ELEMENTS));
    for (size_t i = 0; i < unwrap(count); ++i) {
        auto tag = read_tag_contents(reader, depth);
        if (is_err(tag)) {
            return unwrap_err(tag);
        }
        tags.push_back(std::move(unwrap(tag)));
    }
    return BinaryData::of_tag_array(std::move(tags));
}

/// One row per serial id. The `Tag` row is empty.
constexpr std::array<DataCodec, DATA_TYPE_COUNT> CODECS = {{
    {&write_scalar<int8_t>, &read_scalar<int8_t>},
    {&write_scalar<int16_t>, &read_scalar<int16_t>},
    {&write_scalar<int32_t>, &read_scalar<int32_t>},
    {&write_scalar<int64_t>, &read_scalar<int64_t>},
    {&write_scalar<float>, &read_scalar<float>},
    {&write_scalar<double>, &read_scalar<double>},
    {&write_scalar<std::string>, &read_scalar<std::string>},
    {nullptr, nullptr},
    {&write_array<int8_t>, &read_array<int8_t>},
    {&write_array<int16_t>, &read_array<int16_t>},
    {&write_array<int32_t>, &read_array<int32_t>},
    {&write_array<int64_t>, &read_array<int64_t>},
    {&write_array<float>, &read_array<float>},
    {&write_array<double>, &read_array<double>},
    {&write_array<std::string>, &read_array<std::string>},
    {&write_tag_array, &read_tag_array},
}};

// ============================================================================
// Nodes
// ============================================================================

auto write_node(const BinaryNode& node, DataWriter& writer) -> Result<Unit, TagError> {
    auto status = writer.write_u8(serial_id(node.type()));
    if (is_err(status)) {
        return status;
    }
    return node.visit([&writer](const auto& value) -> Result<Unit, TagError> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, BinaryData>) {
            return write_data_payload(value, writer);
        } else {
            return write_tag_contents(value, writer);
        }
    });
}

/// Reads a type byte, mapping out-of-range ids to `UnknownDiscriminant` at
/// the byte's offset.
auto read_type(DataReader& reader) -> Result<DataType, TagError> {
    size_t at = reader.offset();
    auto id = reader.read_u8();
    if (is_err(id)) {
        return unwrap_err(id);
    }
    auto type = data_type_from_id(unwrap(id));
    if (is_err(type)) {
        auto err = unwrap_err(type);
        err.offset = at;
        return err;
    }
    return type;
}

/// Reads a node whose containers sit at `depth`.
auto read_node(DataReader& reader, size_t depth) -> Result<BinaryNode, TagError> {
    auto type = read_type(reader);
    if (is_err(type)) {
        return unwrap_err(type);
    }

    if (is_composite(unwrap(type))) {
        auto tag = read_tag_contents(reader, depth);
        if (is_err(tag)) {
            return unwrap_err(tag);
        }
        return BinaryNode(std::move(unwrap(tag)));
    }

    auto data = read_data_payload(unwrap(type), reader, depth);
    if (is_err(data)) {
        return unwrap_err(data);
    }
    return BinaryNode(std::move(unwrap(data)));
}

} // namespace

// ============================================================================
// Content-Level Codec
// ============================================================================

auto write_tag_contents(const BinaryTag& tag, DataWriter& writer) -> Result<Unit, TagError> {
    auto status = write_count(writer, tag.size());
    if (is_err(status)) {
        return status;
    }
    for (const auto& [key, node] : tag.entries()) {
        status = writer.write_utf(key);
        if (is_err(status)) {
            return status;
        }
        status = write_node(node, writer);
        if (is_err(status)) {
            return status;
        }
    }
    return Unit{};
}

auto read_tag_contents(DataReader& reader, size_t depth) -> Result<BinaryTag, TagError> {
    if (depth >= MAX_DECODE_DEPTH) {
        return TagError::invalid_data("containers nested deeper than " +
                                          std::to_string(MAX_DECODE_DEPTH) + " levels",
                                      reader.offset());
    }

    auto count = read_count(reader);
    if (is_err(count)) {
        return unwrap_err(count);
    }

    BinaryTag tag;
    for (size_t i = 0; i < unwrap(count); ++i) {
        auto key = reader.read_utf();
        if (is_err(key)) {
            return unwrap_err(key);
        }
        auto node = read_node(reader, depth + 1);
        if (is_err(node)) {
            return unwrap_err(node);
        }
        auto status = tag.set(unwrap(key), std::move(unwrap(node)), false);
        if (is_err(status)) {
            return unwrap_err(status);
        }
    }
    return tag;
}

auto write_data_payload(const BinaryData& data, DataWriter& writer) -> Result<Unit, TagError> {
    return CODECS[serial_id(data.type())].write(data, writer);
}

auto read_data_payload(DataType type, DataReader& reader, size_t depth)
    -> Result<BinaryData, TagError> {
    if (is_composite(type)) {
        return TagError::composite_not_data();
    }
    auto id = serial_id(type);
    if (id >= DATA_TYPE_COUNT) {
        return TagError::unknown_discriminant(id, reader.offset());
    }
    return CODECS[id].read(reader, depth);
}

// ============================================================================
// Stream Codec
// ============================================================================

auto encode(const BinaryNode& node, ByteSink& sink) -> Result<Unit, TagError> {
    DataWriter writer(sink);
    auto status = write_node(node, writer);
    if (is_err(status)) {
        BINTAG_LOG_DEBUG("codec", "encode failed: " << unwrap_err(status).to_string());
        return status;
    }
    BINTAG_LOG_TRACE("codec", "encoded " << describe(node.type()) << " in "
                                         << writer.bytes_written() << " bytes");
    return status;
}

auto encode(const BinaryTag& tag, ByteSink& sink) -> Result<Unit, TagError> {
    DataWriter writer(sink);
    auto status = writer.write_u8(serial_id(DataType::Tag));
    if (is_ok(status)) {
        status = write_tag_contents(tag, writer);
    }
    if (is_err(status)) {
        BINTAG_LOG_DEBUG("codec", "encode failed: " << unwrap_err(status).to_string());
        return status;
    }
    BINTAG_LOG_TRACE("codec", "encoded TAG with " << tag.size() << " entries in "
                                                  << writer.bytes_written() << " bytes");
    return status;
}

auto encode(const BinaryData& data, ByteSink& sink) -> Result<Unit, TagError> {
    DataWriter writer(sink);
    auto status = writer.write_u8(serial_id(data.type()));
    if (is_err(status)) {
        return status;
    }
    return write_data_payload(data, writer);
}

auto decode(ByteSource& source) -> Result<BinaryNode, TagError> {
    DataReader reader(source);
    auto node = read_node(reader, 0);
    if (is_err(node)) {
        BINTAG_LOG_DEBUG("codec", "decode failed: " << unwrap_err(node).to_string());
        return node;
    }
    BINTAG_LOG_TRACE("codec", "decoded " << describe(unwrap(node).type()) << " from "
                                         << reader.offset() << " bytes");
    return node;
}

auto decode_root(ByteSource& source) -> Result<BinaryTag, TagError> {
    DataReader reader(source);
    auto type = read_type(reader);
    if (is_err(type)) {
        BINTAG_LOG_DEBUG("codec", "decode failed: " << unwrap_err(type).to_string());
        return unwrap_err(type);
    }
    if (!is_composite(unwrap(type))) {
        auto err = TagError::type_mismatch(DataType::Tag, unwrap(type));
        err.offset = 0;
        return err;
    }

    auto tag = read_tag_contents(reader);
    if (is_err(tag)) {
        BINTAG_LOG_DEBUG("codec", "decode failed: " << unwrap_err(tag).to_string());
        return tag;
    }
    BINTAG_LOG_TRACE("codec", "decoded TAG with " << unwrap(tag).size() << " entries from "
                                                  << reader.offset() << " bytes");
    return tag;
}

// ============================================================================
// Buffer and File Helpers
// ============================================================================

auto encode_to_bytes(const BinaryTag& tag) -> Result<std::vector<uint8_t>, TagError> {
    BufferSink sink;
    auto status = encode(tag, sink);
    if (is_err(status)) {
        return unwrap_err(status);
    }
    return sink.take();
}

auto encode_to_bytes(const BinaryNode& node) -> Result<std::vector<uint8_t>, TagError> {
    BufferSink sink;
    auto status = encode(node, sink);
    if (is_err(status)) {
        return unwrap_err(status);
    }
    return sink.take();
}

auto decode_bytes(std::span<const uint8_t> bytes) -> Result<BinaryNode, TagError> {
    BufferSource source(bytes);
    return decode(source);
}

auto decode_root_bytes(std::span<const uint8_t> bytes) -> Result<BinaryTag, TagError> {
    BufferSource source(bytes);
    return decode_root(source);
}

auto write_tag_file(const std::filesystem::path& path, const BinaryTag& tag)
    -> Result<Unit, TagError> {
    // An encoding failure must leave an existing file untouched
    auto bytes = encode_to_bytes(tag);
    if (is_err(bytes)) {
        return unwrap_err(bytes);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return TagError::io("cannot open '" + path.string() + "' for writing");
    }

    StreamSink sink(out);
    auto status = sink.write(unwrap(bytes));
    if (is_err(status)) {
        return status;
    }

    out.close();
    if (!out) {
        return TagError::io("failed to write '" + path.string() + "'");
    }
    BINTAG_LOG_DEBUG("codec", "wrote " << path.string());
    return Unit{};
}

auto read_tag_file(const std::filesystem::path& path) -> Result<BinaryTag, TagError> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return TagError::io("cannot open '" + path.string() + "' for reading");
    }

    StreamSource source(in);
    auto tag = decode_root(source);
    if (is_ok(tag)) {
        BINTAG_LOG_DEBUG("codec", "read " << path.string());
    }
    return tag;
}

} // namespace bintag::tag
