//! # Byte Sinks and Sources
//!
//! The codec never touches files or sockets directly. It writes to a
//! `ByteSink` and reads from a `ByteSource`; callers pick where the bytes go.
//!
//! ## Implementations
//!
//! | Type | Backing store |
//! |------|---------------|
//! | `BufferSink` | Growable in-memory byte vector |
//! | `BufferSource` | Borrowed span of bytes |
//! | `StreamSink` | `std::ostream` (files, string streams) |
//! | `StreamSource` | `std::istream` |
//!
//! Failures are reported as `TagErrorKind::Io` errors and are forwarded
//! unchanged by the codec.
//!
//! ## Thread Safety
//!
//! Sinks and sources are NOT thread-safe; use one per thread.

#pragma once

#include "bintag/common.hpp"
#include "bintag/tag/tag_error.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <span>
#include <vector>

namespace bintag::tag {

/// Destination for encoded bytes.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /// Writes all of `bytes`, or fails with an `Io` error.
    virtual auto write(std::span<const uint8_t> bytes) -> Result<Unit, TagError> = 0;
};

/// Origin of bytes to decode.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Fills all of `out`, or fails with an `Io` error.
    ///
    /// A short read (end of input) is a failure, never a partial success.
    virtual auto read(std::span<uint8_t> out) -> Result<Unit, TagError> = 0;
};

/// Sink that appends to an in-memory buffer. Never fails.
class BufferSink : public ByteSink {
public:
    BufferSink() = default;

    auto write(std::span<const uint8_t> bytes) -> Result<Unit, TagError> override;

    /// Returns the bytes written so far.
    [[nodiscard]] auto bytes() const -> const std::vector<uint8_t>& {
        return buffer_;
    }

    /// Moves the written bytes out, leaving the sink empty.
    [[nodiscard]] auto take() -> std::vector<uint8_t>;

private:
    std::vector<uint8_t> buffer_;
};

/// Source reading from a borrowed byte span.
///
/// The span must outlive the source.
class BufferSource : public ByteSource {
public:
    explicit BufferSource(std::span<const uint8_t> bytes) : bytes_(bytes) {}

    auto read(std::span<uint8_t> out) -> Result<Unit, TagError> override;

    /// Number of bytes consumed so far.
    [[nodiscard]] auto position() const -> size_t {
        return position_;
    }

    /// Number of bytes not yet consumed.
    [[nodiscard]] auto remaining() const -> size_t {
        return bytes_.size() - position_;
    }

private:
    std::span<const uint8_t> bytes_;
    size_t position_ = 0;
};

/// Sink writing to an output stream.
class StreamSink : public ByteSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    auto write(std::span<const uint8_t> bytes) -> Result<Unit, TagError> override;

private:
    std::ostream& out_;
};

/// Source reading from an input stream.
class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& in) : in_(in) {}

    auto read(std::span<uint8_t> out) -> Result<Unit, TagError> override;

private:
    std::istream& in_;
};

} // namespace bintag::tag
