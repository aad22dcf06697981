//! # Binary Tag Codec
//!
//! Serializes tag documents to bytes and back. The format is
//! self-describing: every value is prefixed with its one-byte `DataType`,
//! so decoding needs no schema.
//!
//! ## Wire Format
//!
//! ```text
//! node     := type:u8 payload
//! payload  := scalar | string | tag | array
//! scalar   := big-endian i8 / i16 / i32 / i64 / f32 / f64
//! string   := len:u16 modified-utf8[len]
//! tag      := count:i32 (key:string node)[count]
//! array    := count:i32 element[count]      ; no per-element type byte
//! element  := scalar | string | tag         ; tag elements are contents only
//! ```
//!
//! A root document is a single `node`. Counts are signed; a negative count
//! on input is `InvalidData`, and a type byte of 16 or more is
//! `UnknownDiscriminant`. Errors from the byte sink or source (`Io`) are
//! forwarded unchanged.
//!
//! ## Entry Points
//!
//! | Function | Purpose |
//! |----------|---------|
//! | `encode` / `decode` | Any node, with its type byte |
//! | `decode_root` | Root document that must be a container |
//! | `write_tag_contents` / `read_tag_contents` | Container without type byte |
//! | `write_data_payload` / `read_data_payload` | Leaf payload without type byte |
//! | `encode_to_bytes` / `decode_bytes` / `decode_root_bytes` | In-memory buffers |
//! | `write_tag_file` / `read_tag_file` | Whole files |
//!
//! ## Example
//!
//! ```cpp
//! BinaryTag tag;
//! tag.set_string("name", "bin-tag");
//!
//! BufferSink sink;
//! auto written = encode(tag, sink);
//!
//! BufferSource source(sink.bytes());
//! auto decoded = decode_root(source);
//! assert(unwrap(decoded) == tag);
//! ```

#pragma once

#include "bintag/common.hpp"
#include "bintag/tag/binary_data.hpp"
#include "bintag/tag/binary_node.hpp"
#include "bintag/tag/binary_tag.hpp"
#include "bintag/tag/byte_stream.hpp"
#include "bintag/tag/data_io.hpp"
#include "bintag/tag/tag_error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace bintag::tag {

/// Upper bound on elements reserved up front when decoding a count.
///
/// Counts come from untrusted input; larger arrays still decode, they just
/// grow as elements arrive.
inline constexpr size_t MAX_PREALLOCATED_ELEMENTS = 4096;

/// Deepest container nesting accepted when decoding.
///
/// The root container is at depth 0. A container (or tag array element)
/// at this depth fails with `InvalidData` at the offset of its count, so
/// hostile input cannot exhaust the stack.
inline constexpr size_t MAX_DECODE_DEPTH = 512;

// ============================================================================
// Stream Codec
// ============================================================================

/// Writes a node: its type byte followed by its payload.
auto encode(const BinaryNode& node, ByteSink& sink) -> Result<Unit, TagError>;

/// Writes a container as a root document (type byte `7`, then contents).
auto encode(const BinaryTag& tag, ByteSink& sink) -> Result<Unit, TagError>;

/// Writes a leaf value with its type byte.
auto encode(const BinaryData& data, ByteSink& sink) -> Result<Unit, TagError>;

/// Reads one node, dispatching on its leading type byte.
[[nodiscard]] auto decode(ByteSource& source) -> Result<BinaryNode, TagError>;

/// Reads a root document that must be a container.
///
/// # Returns
///
/// The container, `TypeMismatch` if the root type byte names any other
/// valid type, or the first decoding error.
[[nodiscard]] auto decode_root(ByteSource& source) -> Result<BinaryTag, TagError>;

// ============================================================================
// Content-Level Codec
// ============================================================================

/// Writes a container's entry count and entries, without a type byte.
///
/// This is the layout of each element of a tag array.
auto write_tag_contents(const BinaryTag& tag, DataWriter& writer) -> Result<Unit, TagError>;

/// Reads a container written by `write_tag_contents`.
///
/// When a key occurs more than once, the last occurrence wins. `depth` is
/// the nesting level of the container being read; see `MAX_DECODE_DEPTH`.
[[nodiscard]] auto read_tag_contents(DataReader& reader, size_t depth = 0)
    -> Result<BinaryTag, TagError>;

/// Writes a leaf value's payload, without a type byte.
auto write_data_payload(const BinaryData& data, DataWriter& writer) -> Result<Unit, TagError>;

/// Reads the payload of a leaf of the given type.
///
/// Fails with `CompositeNotData` for `DataType::Tag`. Containers inside a
/// tag array are read at `depth`.
[[nodiscard]] auto read_data_payload(DataType type, DataReader& reader, size_t depth = 0)
    -> Result<BinaryData, TagError>;

// ============================================================================
// Buffer and File Helpers
// ============================================================================

/// Encodes a root container into a fresh byte vector.
[[nodiscard]] auto encode_to_bytes(const BinaryTag& tag) -> Result<std::vector<uint8_t>, TagError>;

/// Encodes any node into a fresh byte vector.
[[nodiscard]] auto encode_to_bytes(const BinaryNode& node)
    -> Result<std::vector<uint8_t>, TagError>;

/// Decodes one node from a byte buffer. Trailing bytes are ignored.
[[nodiscard]] auto decode_bytes(std::span<const uint8_t> bytes) -> Result<BinaryNode, TagError>;

/// Decodes a root container from a byte buffer. Trailing bytes are ignored.
[[nodiscard]] auto decode_root_bytes(std::span<const uint8_t> bytes)
    -> Result<BinaryTag, TagError>;

/// Writes a root container to a file, replacing its contents.
auto write_tag_file(const std::filesystem::path& path, const BinaryTag& tag)
    -> Result<Unit, TagError>;

/// Reads a root container from a file.
[[nodiscard]] auto read_tag_file(const std::filesystem::path& path) -> Result<BinaryTag, TagError>;

} // namespace bintag::tag
