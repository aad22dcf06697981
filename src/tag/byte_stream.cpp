//! # Byte Sink and Source Implementations

#include "bintag/tag/byte_stream.hpp"

#include <algorithm>
#include <string>

namespace bintag::tag {

// ============================================================================
// BufferSink / BufferSource
// ============================================================================

auto BufferSink::write(std::span<const uint8_t> bytes) -> Result<Unit, TagError> {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    return Unit{};
}

auto BufferSink::take() -> std::vector<uint8_t> {
    std::vector<uint8_t> out;
    out.swap(buffer_);
    return out;
}

auto BufferSource::read(std::span<uint8_t> out) -> Result<Unit, TagError> {
    if (out.size() > remaining()) {
        return TagError::io("unexpected end of input: needed " + std::to_string(out.size()) +
                                " bytes, " + std::to_string(remaining()) + " left",
                            position_);
    }
    std::copy_n(bytes_.begin() + static_cast<std::ptrdiff_t>(position_), out.size(), out.begin());
    position_ += out.size();
    return Unit{};
}

// ============================================================================
// StreamSink / StreamSource
// ============================================================================

auto StreamSink::write(std::span<const uint8_t> bytes) -> Result<Unit, TagError> {
    out_.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!out_) {
        return TagError::io("output stream write failed");
    }
    return Unit{};
}

auto StreamSource::read(std::span<uint8_t> out) -> Result<Unit, TagError> {
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    auto got = in_.gcount();
    if (static_cast<size_t>(got) != out.size()) {
        return TagError::io("unexpected end of stream: needed " + std::to_string(out.size()) +
                            " bytes, got " + std::to_string(got));
    }
    return Unit{};
}

} // namespace bintag::tag
