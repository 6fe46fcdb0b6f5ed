#include "vecpart/io/byte_stream.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace vecpart;
using namespace vecpart::io;

TEST(ByteStreamTest, integersAreLittleEndian) {
    ByteWriter out;
    out.write_i32(0x01020304);
    out.write_i64(-2);

    const auto& bytes = out.buffer();
    ASSERT_EQ(bytes.size(), 12u);
    EXPECT_EQ(bytes[0], 0x04);
    EXPECT_EQ(bytes[3], 0x01);
    for (size_t i = 5; i < 12; ++i) {
        EXPECT_EQ(bytes[i], 0xff);
    }
    EXPECT_EQ(bytes[4], 0xfe);

    ByteReader in(bytes);
    EXPECT_EQ(in.read_i32(), 0x01020304);
    EXPECT_EQ(in.read_i64(), -2);
    EXPECT_TRUE(in.at_end());
}

TEST(ByteStreamTest, lengthPrefixedBytes) {
    ByteWriter out;
    out.write_string("hello");
    out.write_string("");

    ByteReader in(out.buffer());
    uint32_t length = in.read_length(1024);
    ASSERT_EQ(length, 5u);
    const uint8_t* raw = in.read_raw(length);
    EXPECT_EQ(std::string(raw, raw + length), "hello");
    EXPECT_EQ(in.read_length(1024), 0u);
    EXPECT_TRUE(in.at_end());
}

TEST(ByteStreamTest, shortReadIsCorruption) {
    std::vector<uint8_t> bytes = {1, 2, 3};
    ByteReader in(bytes);
    VECPART_ASSERT_THROWS_KIND(in.read_i32(), ErrorKind::STREAM_CORRUPTION);

    // A failed read does not consume anything
    EXPECT_EQ(in.position(), 0u);
    EXPECT_EQ(in.read_u8(), 1);
}

TEST(ByteStreamTest, lengthPrefixBeyondLimitOrEnd) {
    ByteWriter out;
    out.write_u32(100);
    out.write_u8(7);

    {
        ByteReader in(out.buffer());
        VECPART_ASSERT_THROWS_KIND(in.read_length(10), ErrorKind::STREAM_CORRUPTION);
    }
    {
        ByteReader in(out.buffer());
        VECPART_ASSERT_THROWS_KIND(in.read_length(1000), ErrorKind::STREAM_CORRUPTION);
    }
}

TEST(ByteStreamTest, releaseEmptiesWriter) {
    ByteWriter out(16);
    out.write_u8(9);
    auto bytes = out.release();
    EXPECT_EQ(bytes.size(), 1u);
    EXPECT_EQ(out.size(), 0u);
}
