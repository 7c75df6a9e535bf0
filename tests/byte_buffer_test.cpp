// SPDX-License-Identifier: MIT

// tests/byte_buffer_test.cpp
#include <gtest/gtest.h>

#include "lib/stream/byte_buffer.hpp"

using namespace obj_transport;

TEST(ByteBufferTest, BigEndianWriters) {
    ByteBuffer buf;
    buf.put_uint8(0xAB);
    buf.put_uint16_be(0x0102);
    buf.put_uint32_be(0x03040506);
    buf.put_int64_be(-2);

    auto v = buf.view();
    ASSERT_EQ(v.size(), 15);
    EXPECT_EQ(v[0], std::byte{0xAB});
    EXPECT_EQ(v[1], std::byte{0x01});
    EXPECT_EQ(v[2], std::byte{0x02});
    EXPECT_EQ(v[3], std::byte{0x03});
    EXPECT_EQ(v[6], std::byte{0x06});
    EXPECT_EQ(v[7], std::byte{0xFF});
    EXPECT_EQ(v[14], std::byte{0xFE});
}

TEST(ByteBufferTest, PatchLengthPrefix) {
    ByteBuffer buf;
    buf.put_uint32_be(0);
    buf.put_string("hello");
    buf.patch_uint32_be(0, static_cast<uint32_t>(buf.size() - 4));

    EXPECT_EQ(LoadUint32Be(buf.view().data()), 5u);
}

TEST(ByteBufferTest, ReleaseEmptiesBuffer) {
    ByteBuffer buf;
    buf.put_string("abc");
    auto out = buf.release();
    EXPECT_EQ(out.size(), 3);
    EXPECT_EQ(buf.size(), 0);
}

TEST(ByteReaderTest, ReadsWhatWasWritten) {
    ByteBuffer buf;
    buf.put_uint8(7);
    buf.put_uint16_be(513);
    buf.put_uint32_be(70000);
    buf.put_int64_be(-123456789012);
    buf.put_string("obj");

    ByteReader reader(buf.view());
    EXPECT_EQ(reader.get_uint8(), 7);
    EXPECT_EQ(reader.get_uint16_be(), 513);
    EXPECT_EQ(reader.get_uint32_be(), 70000u);
    EXPECT_EQ(reader.get_int64_be(), -123456789012);
    EXPECT_EQ(reader.get_string(3), "obj");
    EXPECT_EQ(reader.remaining(), 0);
}

TEST(ByteReaderTest, ShortReadDoesNotAdvance) {
    std::byte data[3] = {std::byte{1}, std::byte{2}, std::byte{3}};
    ByteReader reader(data);

    EXPECT_FALSE(reader.get_uint32_be().has_value());
    EXPECT_EQ(reader.position(), 0);
    EXPECT_FALSE(reader.get_bytes(4).has_value());
    EXPECT_EQ(reader.get_uint16_be(), 0x0102);
    EXPECT_FALSE(reader.get_uint16_be().has_value());
    EXPECT_EQ(reader.remaining(), 1);
}
