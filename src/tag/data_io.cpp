//! # Data Writer and Reader Implementation
//!
//! Big-endian primitive I/O and the modified UTF-8 string codec.
//!
//! ## Byte Order
//!
//! All multi-byte values are written most significant byte first,
//! independent of the host byte order. Floats travel as their IEEE 754 bit
//! patterns, so NaN payloads and signed zeros survive a round trip.
//!
//! ## See Also
//!
//! - `codec.cpp` - Value-level encoding built on these primitives

#include "bintag/tag/data_io.hpp"

#include <array>
#include <bit>

namespace bintag::tag {

namespace {

constexpr uint32_t SURROGATE_HIGH_FIRST = 0xD800;
constexpr uint32_t SURROGATE_HIGH_LAST = 0xDBFF;
constexpr uint32_t SURROGATE_LOW_FIRST = 0xDC00;
constexpr uint32_t SURROGATE_LOW_LAST = 0xDFFF;
constexpr uint32_t MAX_CODE_POINT = 0x10FFFF;

/// Appends one UTF-16 code unit in modified UTF-8 form (1-3 bytes).
void append_unit(std::vector<uint8_t>& out, uint32_t unit) {
    if (unit != 0 && unit < 0x80) {
        out.push_back(static_cast<uint8_t>(unit));
    } else if (unit < 0x800) {
        out.push_back(static_cast<uint8_t>(0xC0 | (unit >> 6)));
        out.push_back(static_cast<uint8_t>(0x80 | (unit & 0x3F)));
    } else {
        out.push_back(static_cast<uint8_t>(0xE0 | (unit >> 12)));
        out.push_back(static_cast<uint8_t>(0x80 | ((unit >> 6) & 0x3F)));
        out.push_back(static_cast<uint8_t>(0x80 | (unit & 0x3F)));
    }
}

/// Appends a code point in standard UTF-8 form (1-4 bytes).
void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto is_continuation(uint8_t b) -> bool {
    return (b & 0xC0) == 0x80;
}

} // namespace

// ============================================================================
// Modified UTF-8
// ============================================================================

auto encode_modified_utf8(std::string_view text) -> Result<std::vector<uint8_t>, TagError> {
    std::vector<uint8_t> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<uint8_t>(text[i]);
        uint32_t cp = 0;
        size_t len = 0;

        if (lead < 0x80) {
            cp = lead;
            len = 1;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            len = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            len = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            len = 4;
        } else {
            return TagError::invalid_data("invalid UTF-8 lead byte in string", i);
        }

        if (i + len > text.size()) {
            return TagError::invalid_data("truncated UTF-8 sequence in string", i);
        }
        for (size_t k = 1; k < len; ++k) {
            auto b = static_cast<uint8_t>(text[i + k]);
            if (!is_continuation(b)) {
                return TagError::invalid_data("invalid UTF-8 continuation byte in string", i + k);
            }
            cp = (cp << 6) | (b & 0x3F);
        }

        bool overlong = (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
                        (len == 4 && cp < 0x10000);
        bool surrogate = cp >= SURROGATE_HIGH_FIRST && cp <= SURROGATE_LOW_LAST;
        if (overlong || surrogate || cp > MAX_CODE_POINT) {
            return TagError::invalid_data("invalid UTF-8 code point in string", i);
        }

        if (cp >= 0x10000) {
            uint32_t v = cp - 0x10000;
            append_unit(out, SURROGATE_HIGH_FIRST + (v >> 10));
            append_unit(out, SURROGATE_LOW_FIRST + (v & 0x3FF));
        } else {
            append_unit(out, cp);
        }
        i += len;
    }

    return out;
}

auto decode_modified_utf8(std::span<const uint8_t> bytes) -> Result<std::string, TagError> {
    std::string out;
    out.reserve(bytes.size());

    uint32_t pending_high = 0;
    size_t pending_at = 0;
    size_t i = 0;
    while (i < bytes.size()) {
        uint8_t b0 = bytes[i];
        uint32_t unit = 0;
        size_t len = 0;

        if (b0 < 0x80) {
            unit = b0;
            len = 1;
        } else if ((b0 & 0xE0) == 0xC0) {
            len = 2;
        } else if ((b0 & 0xF0) == 0xE0) {
            len = 3;
        } else {
            return TagError::invalid_data("malformed modified UTF-8 input", i);
        }

        if (i + len > bytes.size()) {
            return TagError::invalid_data("truncated modified UTF-8 sequence", i);
        }
        if (len == 2) {
            if (!is_continuation(bytes[i + 1])) {
                return TagError::invalid_data("malformed modified UTF-8 input", i + 1);
            }
            unit = ((b0 & 0x1Fu) << 6) | (bytes[i + 1] & 0x3Fu);
        } else if (len == 3) {
            if (!is_continuation(bytes[i + 1]) || !is_continuation(bytes[i + 2])) {
                return TagError::invalid_data("malformed modified UTF-8 input", i + 1);
            }
            unit = ((b0 & 0x0Fu) << 12) | ((bytes[i + 1] & 0x3Fu) << 6) | (bytes[i + 2] & 0x3Fu);
        }

        if (unit >= SURROGATE_HIGH_FIRST && unit <= SURROGATE_HIGH_LAST) {
            if (pending_high != 0) {
                return TagError::invalid_data("unpaired high surrogate", pending_at);
            }
            pending_high = unit;
            pending_at = i;
        } else if (unit >= SURROGATE_LOW_FIRST && unit <= SURROGATE_LOW_LAST) {
            if (pending_high == 0) {
                return TagError::invalid_data("unpaired low surrogate", i);
            }
            append_utf8(out, 0x10000 + ((pending_high - SURROGATE_HIGH_FIRST) << 10) +
                                 (unit - SURROGATE_LOW_FIRST));
            pending_high = 0;
        } else {
            if (pending_high != 0) {
                return TagError::invalid_data("unpaired high surrogate", pending_at);
            }
            append_utf8(out, unit);
        }
        i += len;
    }

    if (pending_high != 0) {
        return TagError::invalid_data("unpaired high surrogate", pending_at);
    }
    return out;
}

// ============================================================================
// DataWriter
// ============================================================================

auto DataWriter::write_bytes(std::span<const uint8_t> bytes) -> Result<Unit, TagError> {
    auto status = sink_.write(bytes);
    if (is_ok(status)) {
        written_ += bytes.size();
    }
    return status;
}

auto DataWriter::write_be(uint64_t bits, size_t width) -> Result<Unit, TagError> {
    std::array<uint8_t, 8> buf{};
    for (size_t i = 0; i < width; ++i) {
        buf[i] = static_cast<uint8_t>(bits >> (8 * (width - 1 - i)));
    }
    return write_bytes(std::span<const uint8_t>(buf.data(), width));
}

auto DataWriter::write_u8(uint8_t value) -> Result<Unit, TagError> {
    return write_be(value, 1);
}

auto DataWriter::write_i8(int8_t value) -> Result<Unit, TagError> {
    return write_be(static_cast<uint8_t>(value), 1);
}

auto DataWriter::write_i16(int16_t value) -> Result<Unit, TagError> {
    return write_be(static_cast<uint16_t>(value), 2);
}

auto DataWriter::write_i32(int32_t value) -> Result<Unit, TagError> {
    return write_be(static_cast<uint32_t>(value), 4);
}

auto DataWriter::write_i64(int64_t value) -> Result<Unit, TagError> {
    return write_be(static_cast<uint64_t>(value), 8);
}

auto DataWriter::write_f32(float value) -> Result<Unit, TagError> {
    return write_be(std::bit_cast<uint32_t>(value), 4);
}

auto DataWriter::write_f64(double value) -> Result<Unit, TagError> {
    return write_be(std::bit_cast<uint64_t>(value), 8);
}

auto DataWriter::write_utf(std::string_view text) -> Result<Unit, TagError> {
    auto encoded = encode_modified_utf8(text);
    if (is_err(encoded)) {
        auto err = unwrap_err(encoded);
        err.offset = written_;
        return err;
    }
    const auto& bytes = unwrap(encoded);
    if (bytes.size() > MAX_UTF_LENGTH) {
        return TagError::invalid_data("encoded string is " + std::to_string(bytes.size()) +
                                          " bytes, limit is " + std::to_string(MAX_UTF_LENGTH),
                                      written_);
    }

    auto status = write_be(bytes.size(), 2);
    if (is_err(status)) {
        return status;
    }
    return write_bytes(bytes);
}

// ============================================================================
// DataReader
// ============================================================================

auto DataReader::read_bytes(std::span<uint8_t> out) -> Result<Unit, TagError> {
    auto status = source_.read(out);
    if (is_ok(status)) {
        offset_ += out.size();
    }
    return status;
}

auto DataReader::read_be(size_t width) -> Result<uint64_t, TagError> {
    std::array<uint8_t, 8> buf{};
    auto status = read_bytes(std::span<uint8_t>(buf.data(), width));
    if (is_err(status)) {
        return unwrap_err(status);
    }
    uint64_t bits = 0;
    for (size_t i = 0; i < width; ++i) {
        bits = (bits << 8) | buf[i];
    }
    return bits;
}

auto DataReader::read_u8() -> Result<uint8_t, TagError> {
    auto bits = read_be(1);
    if (is_err(bits)) {
        return unwrap_err(bits);
    }
    return static_cast<uint8_t>(unwrap(bits));
}

auto DataReader::read_i8() -> Result<int8_t, TagError> {
    auto bits = read_be(1);
    if (is_err(bits)) {
        return unwrap_err(bits);
    }
    return static_cast<int8_t>(static_cast<uint8_t>(unwrap(bits)));
}

auto DataReader::read_i16() -> Result<int16_t, TagError> {
    auto bits = read_be(2);
    if (is_err(bits)) {
        return unwrap_err(bits);
    }
    return static_cast<int16_t>(static_cast<uint16_t>(unwrap(bits)));
}

auto DataReader::read_i32() -> Result<int32_t, TagError> {
    auto bits = read_be(4);
    if (is_err(bits)) {
        return unwrap_err(bits);
    }
    return static_cast<int32_t>(static_cast<uint32_t>(unwrap(bits)));
}

auto DataReader::read_i64() -> Result<int64_t, TagError> {
    auto bits = read_be(8);
    if (is_err(bits)) {
        return unwrap_err(bits);
    }
    return static_cast<int64_t>(unwrap(bits));
}

auto DataReader::read_f32() -> Result<float, TagError> {
    auto bits = read_be(4);
    if (is_err(bits)) {
        return unwrap_err(bits);
    }
    return std::bit_cast<float>(static_cast<uint32_t>(unwrap(bits)));
}

auto DataReader::read_f64() -> Result<double, TagError> {
    auto bits = read_be(8);
    if (is_err(bits)) {
        return unwrap_err(bits);
    }
    return std::bit_cast<double>(unwrap(bits));
}

auto DataReader::read_utf() -> Result<std::string, TagError> {
    auto len = read_be(2);
    if (is_err(len)) {
        return unwrap_err(len);
    }

    size_t start = offset_;
    std::vector<uint8_t> bytes(static_cast<size_t>(unwrap(len)));
    auto status = read_bytes(bytes);
    if (is_err(status)) {
        return unwrap_err(status);
    }

    auto text = decode_modified_utf8(bytes);
    if (is_err(text)) {
        auto err = unwrap_err(text);
        err.offset = start + err.offset.value_or(0);
        return err;
    }
    return std::move(unwrap(text));
}

} // namespace bintag::tag
