//! # Rendering Tests
//!
//! The diagnostic text form of leaves, containers and nodes.

#include "bintag/tag/tag.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace bintag;
using namespace bintag::tag;

// ============================================================================
// Scalars
// ============================================================================

TEST(TagFormatTest, IntegerSuffixes) {
    EXPECT_EQ(BinaryData::of_byte(42).to_string(), "42b");
    EXPECT_EQ(BinaryData::of_byte(-128).to_string(), "-128b");
    EXPECT_EQ(BinaryData::of_short(42).to_string(), "42s");
    EXPECT_EQ(BinaryData::of_int(42).to_string(), "42");
    EXPECT_EQ(BinaryData::of_int(-7).to_string(), "-7");
    EXPECT_EQ(BinaryData::of_long(42).to_string(), "42L");
}

TEST(TagFormatTest, FloatingPointUsesShortestForm) {
    EXPECT_EQ(BinaryData::of_float(1.0f).to_string(), "1.0f");
    EXPECT_EQ(BinaryData::of_float(0.1f).to_string(), "0.1f");
    EXPECT_EQ(BinaryData::of_float(-2.5f).to_string(), "-2.5f");
    EXPECT_EQ(BinaryData::of_double(0.1).to_string(), "0.1d");
    EXPECT_EQ(BinaryData::of_double(100.0).to_string(), "100.0d");
    EXPECT_EQ(BinaryData::of_float(-0.0f).to_string(), "-0.0f");
}

TEST(TagFormatTest, NonFiniteValues) {
    EXPECT_EQ(BinaryData::of_float(std::numeric_limits<float>::quiet_NaN()).to_string(), "NaNf");
    EXPECT_EQ(BinaryData::of_float(std::numeric_limits<float>::infinity()).to_string(),
              "Infinityf");
    EXPECT_EQ(BinaryData::of_double(-std::numeric_limits<double>::infinity()).to_string(),
              "-Infinityd");
}

TEST(TagFormatTest, StringsAreQuotedAndEscaped) {
    EXPECT_EQ(BinaryData::of_string("bin-tag").to_string(), "\"bin-tag\"");
    EXPECT_EQ(BinaryData::of_string("say \"hi\"").to_string(), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(BinaryData::of_string("a\\b").to_string(), "\"a\\\\b\"");
    EXPECT_EQ(BinaryData::of_string("").to_string(), "\"\"");
}

// ============================================================================
// Arrays
// ============================================================================

TEST(TagFormatTest, NumericArraysHavePrefixes) {
    EXPECT_EQ(BinaryData::of_byte_array({1, 2}).to_string(), "[B;1b,2b]");
    EXPECT_EQ(BinaryData::of_short_array({1, 2}).to_string(), "[S;1s,2s]");
    EXPECT_EQ(BinaryData::of_int_array({1, 2}).to_string(), "[I;1,2]");
    EXPECT_EQ(BinaryData::of_long_array({1, 2}).to_string(), "[L;1L,2L]");
    EXPECT_EQ(BinaryData::of_float_array({1.0f, 0.0f}).to_string(), "[F;1.0f,0.0f]");
    EXPECT_EQ(BinaryData::of_double_array({1.0}).to_string(), "[D;1.0d]");
}

TEST(TagFormatTest, StringAndTagArrays) {
    EXPECT_EQ(BinaryData::of_string_array({"a", "b"}).to_string(), "[\"a\",\"b\"]");

    TagArray tags;
    tags.push_back(TagBuilder().field_int("n", 1).build());
    tags.emplace_back();
    EXPECT_EQ(BinaryData::of_tag_array(std::move(tags)).to_string(), "[{n:1},{}]");
}

TEST(TagFormatTest, EmptyArraysKeepPrefix) {
    EXPECT_EQ(BinaryData::of_int_array({}).to_string(), "[I;]");
    EXPECT_EQ(BinaryData::of_double_array({}).to_string(), "[D;]");
    EXPECT_EQ(BinaryData::of_string_array({}).to_string(), "[]");
    EXPECT_EQ(BinaryData::of_tag_array({}).to_string(), "[]");
}

// ============================================================================
// Containers
// ============================================================================

TEST(TagFormatTest, EmptyContainer) {
    EXPECT_EQ(BinaryTag().to_string(), "{}");
}

TEST(TagFormatTest, EntriesInKeyOrder) {
    auto tag = TagBuilder()
                   .field_string("name", "bin-tag")
                   .field_int("number", 42)
                   .field_byte("a", 1)
                   .build();
    EXPECT_EQ(tag.to_string(), "{a:1b,name:\"bin-tag\",number:42}");
}

TEST(TagFormatTest, NestedContainers) {
    auto tag = TagBuilder()
                   .field_tag("subtag")
                       .field_float_array("position", {1.0f, 0.0f, 0.0f, 1.0f})
                   .end()
                   .build();
    EXPECT_EQ(tag.to_string(), "{subtag:{position:[F;1.0f,0.0f,0.0f,1.0f]}}");
}

TEST(TagFormatTest, UnusualKeysAreQuoted) {
    auto tag = TagBuilder()
                   .field_int("subtag-array", 1)
                   .field_int("with space", 2)
                   .field_int("", 3)
                   .field_int("v1.0+rc_2", 4)
                   .build();
    EXPECT_EQ(tag.to_string(), "{\"\":3,subtag-array:1,v1.0+rc_2:4,\"with space\":2}");
}

TEST(TagFormatTest, NodeRendersItsAlternative) {
    BinaryNode leaf = BinaryData::of_long(5);
    BinaryNode tag = TagBuilder().field_short("s", 3).build();
    EXPECT_EQ(leaf.to_string(), "5L");
    EXPECT_EQ(tag.to_string(), "{s:3s}");
}
