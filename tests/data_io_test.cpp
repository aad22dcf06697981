//! # Data I/O Tests
//!
//! Big-endian primitives, modified UTF-8 and the byte sinks and sources
//! underneath the codec.

#include "bintag/tag/byte_stream.hpp"
#include "bintag/tag/data_io.hpp"

#include <array>
#include <bit>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <sstream>

using namespace bintag;
using namespace bintag::tag;

using Bytes = std::vector<uint8_t>;

// ============================================================================
// Modified UTF-8
// ============================================================================

TEST(ModifiedUtf8Test, AsciiIsUnchanged) {
    auto encoded = encode_modified_utf8("bin-tag");
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded), (Bytes{'b', 'i', 'n', '-', 't', 'a', 'g'}));
}

TEST(ModifiedUtf8Test, NulIsTwoBytes) {
    std::string text("a\0b", 3);
    auto encoded = encode_modified_utf8(text);
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded), (Bytes{'a', 0xC0, 0x80, 'b'}));

    auto decoded = decode_modified_utf8(unwrap(encoded));
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded), text);
}

TEST(ModifiedUtf8Test, BmpCharactersKeepStandardForm) {
    // U+00E9 and U+20AC
    auto encoded = encode_modified_utf8("\xC3\xA9\xE2\x82\xAC");
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded), (Bytes{0xC3, 0xA9, 0xE2, 0x82, 0xAC}));
}

TEST(ModifiedUtf8Test, SupplementaryCharacterBecomesSurrogatePair) {
    // U+1F600 is D83D DE00 in UTF-16
    std::string emoji = "\xF0\x9F\x98\x80";
    auto encoded = encode_modified_utf8(emoji);
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded), (Bytes{0xED, 0xA0, 0xBD, 0xED, 0xB8, 0x80}));

    auto decoded = decode_modified_utf8(unwrap(encoded));
    ASSERT_TRUE(is_ok(decoded));
    EXPECT_EQ(unwrap(decoded), emoji);
}

TEST(ModifiedUtf8Test, EncodeRejectsInvalidUtf8) {
    for (std::string bad : {std::string("\xFF"), std::string("ab\xC3"), std::string("\xC0\xAF"),
                            std::string("\xED\xA0\x80")}) {
        auto encoded = encode_modified_utf8(bad);
        ASSERT_TRUE(is_err(encoded)) << "accepted invalid input of size " << bad.size();
        EXPECT_EQ(unwrap_err(encoded).kind, TagErrorKind::InvalidData);
    }
}

TEST(ModifiedUtf8Test, DecodeRejectsUnpairedSurrogates) {
    Bytes lone_high{0xED, 0xA0, 0xBD, 'x'};
    auto high = decode_modified_utf8(lone_high);
    ASSERT_TRUE(is_err(high));
    EXPECT_EQ(unwrap_err(high).kind, TagErrorKind::InvalidData);
    EXPECT_EQ(unwrap_err(high).offset, 0u);

    Bytes lone_low{'x', 0xED, 0xB8, 0x80};
    auto low = decode_modified_utf8(lone_low);
    ASSERT_TRUE(is_err(low));
    EXPECT_EQ(unwrap_err(low).offset, 1u);
}

TEST(ModifiedUtf8Test, DecodeRejectsTruncatedSequence) {
    Bytes truncated{'a', 0xE2, 0x82};
    auto decoded = decode_modified_utf8(truncated);
    ASSERT_TRUE(is_err(decoded));
    EXPECT_EQ(unwrap_err(decoded).kind, TagErrorKind::InvalidData);
    EXPECT_EQ(unwrap_err(decoded).offset, 1u);
}

// ============================================================================
// DataWriter
// ============================================================================

TEST(DataWriterTest, WritesBigEndianIntegers) {
    BufferSink sink;
    DataWriter writer(sink);

    ASSERT_TRUE(is_ok(writer.write_i8(-1)));
    ASSERT_TRUE(is_ok(writer.write_i16(0x0102)));
    ASSERT_TRUE(is_ok(writer.write_i32(42)));
    ASSERT_TRUE(is_ok(writer.write_i64(-2)));

    EXPECT_EQ(sink.bytes(), (Bytes{0xFF, 0x01, 0x02, 0x00, 0x00, 0x00, 0x2A, 0xFF, 0xFF, 0xFF,
                                   0xFF, 0xFF, 0xFF, 0xFF, 0xFE}));
    EXPECT_EQ(writer.bytes_written(), 15u);
}

TEST(DataWriterTest, WritesIeeeBitPatterns) {
    BufferSink sink;
    DataWriter writer(sink);

    ASSERT_TRUE(is_ok(writer.write_f32(1.0f)));
    ASSERT_TRUE(is_ok(writer.write_f64(-2.0)));

    EXPECT_EQ(sink.bytes(), (Bytes{0x3F, 0x80, 0x00, 0x00, 0xC0, 0x00, 0x00, 0x00, 0x00, 0x00,
                                   0x00, 0x00}));
}

TEST(DataWriterTest, WritesLengthPrefixedUtf) {
    BufferSink sink;
    DataWriter writer(sink);

    ASSERT_TRUE(is_ok(writer.write_utf("hi")));
    ASSERT_TRUE(is_ok(writer.write_utf("")));

    EXPECT_EQ(sink.bytes(), (Bytes{0x00, 0x02, 'h', 'i', 0x00, 0x00}));
}

TEST(DataWriterTest, AcceptsStringAtLengthLimit) {
    BufferSink sink;
    DataWriter writer(sink);

    ASSERT_TRUE(is_ok(writer.write_utf(std::string(MAX_UTF_LENGTH, 'x'))));
    EXPECT_EQ(sink.bytes().size(), MAX_UTF_LENGTH + 2);
    EXPECT_EQ(sink.bytes()[0], 0xFF);
    EXPECT_EQ(sink.bytes()[1], 0xFF);
}

TEST(DataWriterTest, RejectsOverlongStringWithoutWriting) {
    BufferSink sink;
    DataWriter writer(sink);

    auto status = writer.write_utf(std::string(MAX_UTF_LENGTH + 1, 'x'));
    ASSERT_TRUE(is_err(status));
    EXPECT_EQ(unwrap_err(status).kind, TagErrorKind::InvalidData);
    EXPECT_TRUE(sink.bytes().empty());
}

TEST(DataWriterTest, LengthLimitCountsEncodedBytes) {
    BufferSink sink;
    DataWriter writer(sink);

    // 32768 NULs encode to 65536 bytes
    auto status = writer.write_utf(std::string(32768, '\0'));
    ASSERT_TRUE(is_err(status));
    EXPECT_EQ(unwrap_err(status).kind, TagErrorKind::InvalidData);
}

// ============================================================================
// DataReader
// ============================================================================

TEST(DataReaderTest, ReadsWhatWriterWrote) {
    BufferSink sink;
    DataWriter writer(sink);
    ASSERT_TRUE(is_ok(writer.write_u8(200)));
    ASSERT_TRUE(is_ok(writer.write_i16(std::numeric_limits<int16_t>::min())));
    ASSERT_TRUE(is_ok(writer.write_i32(std::numeric_limits<int32_t>::max())));
    ASSERT_TRUE(is_ok(writer.write_i64(std::numeric_limits<int64_t>::min())));
    ASSERT_TRUE(is_ok(writer.write_f32(0.1f)));
    ASSERT_TRUE(is_ok(writer.write_f64(std::numeric_limits<double>::infinity())));
    ASSERT_TRUE(is_ok(writer.write_utf("\xC3\xA9t\xC3\xA9")));

    BufferSource source(sink.bytes());
    DataReader reader(source);
    EXPECT_EQ(unwrap(reader.read_u8()), 200);
    EXPECT_EQ(unwrap(reader.read_i16()), std::numeric_limits<int16_t>::min());
    EXPECT_EQ(unwrap(reader.read_i32()), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(unwrap(reader.read_i64()), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(unwrap(reader.read_f32()), 0.1f);
    EXPECT_TRUE(std::isinf(unwrap(reader.read_f64())));
    EXPECT_EQ(unwrap(reader.read_utf()), "\xC3\xA9t\xC3\xA9");
    EXPECT_EQ(reader.offset(), sink.bytes().size());
    EXPECT_EQ(source.remaining(), 0u);
}

TEST(DataReaderTest, PreservesNanPayload) {
    BufferSink sink;
    DataWriter writer(sink);
    float nan = std::bit_cast<float>(uint32_t{0x7FC00123});
    ASSERT_TRUE(is_ok(writer.write_f32(nan)));

    BufferSource source(sink.bytes());
    DataReader reader(source);
    auto read = reader.read_f32();
    ASSERT_TRUE(is_ok(read));
    EXPECT_EQ(std::bit_cast<uint32_t>(unwrap(read)), 0x7FC00123u);
}

TEST(DataReaderTest, ShortInputIsIoError) {
    Bytes bytes{0x00, 0x01};
    BufferSource source(bytes);
    DataReader reader(source);

    auto value = reader.read_i32();
    ASSERT_TRUE(is_err(value));
    EXPECT_EQ(unwrap_err(value).kind, TagErrorKind::Io);
    EXPECT_EQ(reader.offset(), 0u);
}

TEST(DataReaderTest, TruncatedStringBodyIsIoError) {
    Bytes bytes{0x00, 0x05, 'a', 'b'};
    BufferSource source(bytes);
    DataReader reader(source);

    auto text = reader.read_utf();
    ASSERT_TRUE(is_err(text));
    EXPECT_EQ(unwrap_err(text).kind, TagErrorKind::Io);
}

TEST(DataReaderTest, MalformedStringReportsStreamOffset) {
    // a lone low surrogate after 'a'
    Bytes bytes{0x00, 0x04, 'a', 0xED, 0xB8, 0x80};
    BufferSource source(bytes);
    DataReader reader(source);

    auto text = reader.read_utf();
    ASSERT_TRUE(is_err(text));
    EXPECT_EQ(unwrap_err(text).kind, TagErrorKind::InvalidData);
    // prefix (2) + 'a' (1)
    EXPECT_EQ(unwrap_err(text).offset, 3u);
}

// ============================================================================
// Streams
// ============================================================================

TEST(ByteStreamTest, BufferSinkTakeEmptiesSink) {
    BufferSink sink;
    Bytes data{1, 2, 3};
    ASSERT_TRUE(is_ok(sink.write(data)));

    auto taken = sink.take();
    EXPECT_EQ(taken, data);
    EXPECT_TRUE(sink.bytes().empty());
}

TEST(ByteStreamTest, BufferSourceTracksPosition) {
    Bytes data{1, 2, 3, 4};
    BufferSource source(data);
    std::array<uint8_t, 3> out{};

    ASSERT_TRUE(is_ok(source.read(out)));
    EXPECT_EQ(source.position(), 3u);
    EXPECT_EQ(source.remaining(), 1u);

    auto status = source.read(out);
    ASSERT_TRUE(is_err(status));
    EXPECT_EQ(unwrap_err(status).kind, TagErrorKind::Io);
    EXPECT_EQ(unwrap_err(status).offset, 3u);
    EXPECT_EQ(source.position(), 3u);
}

TEST(ByteStreamTest, StreamSinkAndSourceRoundTrip) {
    std::stringstream buffer;
    StreamSink sink(buffer);
    DataWriter writer(sink);
    ASSERT_TRUE(is_ok(writer.write_i32(-7)));
    ASSERT_TRUE(is_ok(writer.write_utf("stream")));

    StreamSource source(buffer);
    DataReader reader(source);
    EXPECT_EQ(unwrap(reader.read_i32()), -7);
    EXPECT_EQ(unwrap(reader.read_utf()), "stream");

    auto past_end = reader.read_u8();
    ASSERT_TRUE(is_err(past_end));
    EXPECT_EQ(unwrap_err(past_end).kind, TagErrorKind::Io);
}
