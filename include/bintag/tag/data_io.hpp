//! # Data Writer and Reader
//!
//! Primitive encoding layer of the binary tag format. `DataWriter` turns
//! integers, floats and strings into big-endian bytes on a `ByteSink`;
//! `DataReader` performs the inverse transformation on a `ByteSource`.
//!
//! ## Primitive Layout
//!
//! | Primitive | Bytes | Encoding |
//! |-----------|-------|----------|
//! | `u8` / `i8` | 1 | Raw byte |
//! | `i16` | 2 | Big-endian two's complement |
//! | `i32` | 4 | Big-endian two's complement |
//! | `i64` | 8 | Big-endian two's complement |
//! | `f32` | 4 | IEEE 754 bit pattern, big-endian |
//! | `f64` | 8 | IEEE 754 bit pattern, big-endian |
//! | `utf` | 2 + n | `u16` byte length, then modified UTF-8 |
//!
//! ## Modified UTF-8
//!
//! Strings are held as standard UTF-8 in memory and converted at the wire
//! boundary:
//!
//! - U+0000 is written as the two bytes `C0 80`, so no zero byte appears
//! - Code points above U+FFFF are written as a UTF-16 surrogate pair, each
//!   surrogate taking three bytes
//! - The encoded form is limited to 65535 bytes
//!
//! ## Example
//!
//! ```cpp
//! BufferSink sink;
//! DataWriter writer(sink);
//! writer.write_i32(42);
//! writer.write_utf("hello");
//!
//! BufferSource source(sink.bytes());
//! DataReader reader(source);
//! auto n = reader.read_i32();   // 42
//! auto s = reader.read_utf();   // "hello"
//! ```

#pragma once

#include "bintag/common.hpp"
#include "bintag/tag/byte_stream.hpp"
#include "bintag/tag/tag_error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bintag::tag {

/// Largest encoded string length representable by the `u16` prefix.
inline constexpr size_t MAX_UTF_LENGTH = 65535;

/// Converts standard UTF-8 to modified UTF-8 (without the length prefix).
///
/// Fails with `InvalidData` if `text` is not valid UTF-8.
[[nodiscard]] auto encode_modified_utf8(std::string_view text)
    -> Result<std::vector<uint8_t>, TagError>;

/// Converts modified UTF-8 (without the length prefix) to standard UTF-8.
///
/// Fails with `InvalidData` on malformed sequences or unpaired surrogates.
[[nodiscard]] auto decode_modified_utf8(std::span<const uint8_t> bytes)
    -> Result<std::string, TagError>;

/// Writes big-endian primitives and strings to a `ByteSink`.
class DataWriter {
public:
    explicit DataWriter(ByteSink& sink) : sink_(sink) {}

    auto write_u8(uint8_t value) -> Result<Unit, TagError>;
    auto write_i8(int8_t value) -> Result<Unit, TagError>;
    auto write_i16(int16_t value) -> Result<Unit, TagError>;
    auto write_i32(int32_t value) -> Result<Unit, TagError>;
    auto write_i64(int64_t value) -> Result<Unit, TagError>;
    auto write_f32(float value) -> Result<Unit, TagError>;
    auto write_f64(double value) -> Result<Unit, TagError>;

    /// Writes a `u16` length prefix followed by the modified UTF-8 bytes.
    ///
    /// Fails with `InvalidData` if `text` is not valid UTF-8 or encodes to
    /// more than `MAX_UTF_LENGTH` bytes. Nothing is written on failure.
    auto write_utf(std::string_view text) -> Result<Unit, TagError>;

    /// Number of bytes successfully written.
    [[nodiscard]] auto bytes_written() const -> size_t {
        return written_;
    }

private:
    auto write_bytes(std::span<const uint8_t> bytes) -> Result<Unit, TagError>;
    auto write_be(uint64_t bits, size_t width) -> Result<Unit, TagError>;

    ByteSink& sink_;
    size_t written_ = 0;
};

/// Reads big-endian primitives and strings from a `ByteSource`.
class DataReader {
public:
    explicit DataReader(ByteSource& source) : source_(source) {}

    auto read_u8() -> Result<uint8_t, TagError>;
    auto read_i8() -> Result<int8_t, TagError>;
    auto read_i16() -> Result<int16_t, TagError>;
    auto read_i32() -> Result<int32_t, TagError>;
    auto read_i64() -> Result<int64_t, TagError>;
    auto read_f32() -> Result<float, TagError>;
    auto read_f64() -> Result<double, TagError>;

    /// Reads a `u16` length prefix and that many modified UTF-8 bytes.
    auto read_utf() -> Result<std::string, TagError>;

    /// Number of bytes consumed so far.
    [[nodiscard]] auto offset() const -> size_t {
        return offset_;
    }

private:
    auto read_bytes(std::span<uint8_t> out) -> Result<Unit, TagError>;
    auto read_be(size_t width) -> Result<uint64_t, TagError>;

    ByteSource& source_;
    size_t offset_ = 0;
};

} // namespace bintag::tag
