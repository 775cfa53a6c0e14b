// File: tests/unit/ByteCursorTests.cpp
// Purpose: Check big-endian reads, bounds checks and switch alignment.
// Key invariants: A failed read leaves the position unchanged.
// Ownership/Lifetime: Buffers are local arrays outliving each cursor.
// Links: src/bytecode/ByteCursor.hpp

#include "bytecode/ByteCursor.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>

using classlens::bytecode::ByteCursor;

TEST(ByteCursor, ReadsBigEndian)
{
    const std::array<uint8_t, 7> bytes{0x12, 0x34, 0xFF, 0xFE, 0xFF, 0xFF, 0xFF};
    ByteCursor cursor(bytes);

    uint16_t u2 = 0;
    ASSERT_TRUE(cursor.readU2(u2));
    EXPECT_EQ(u2, 0x1234);

    int16_t s2 = 0;
    ASSERT_TRUE(cursor.readS2(s2));
    EXPECT_EQ(s2, -2);

    EXPECT_EQ(cursor.offset(), 4u);
    EXPECT_EQ(cursor.remaining(), 3u);
}

TEST(ByteCursor, ReadsSigned32)
{
    const std::array<uint8_t, 8> bytes{0x80, 0x00, 0x00, 0x00, 0x00, 0x01, 0x02, 0x03};
    ByteCursor cursor(bytes);

    int32_t value = 0;
    ASSERT_TRUE(cursor.readS4(value));
    EXPECT_EQ(value, INT32_MIN);
    ASSERT_TRUE(cursor.readS4(value));
    EXPECT_EQ(value, 0x00010203);
    EXPECT_TRUE(cursor.atEnd());
}

TEST(ByteCursor, FailedReadDoesNotAdvance)
{
    const std::array<uint8_t, 3> bytes{0x01, 0x02, 0x03};
    ByteCursor cursor(bytes);

    int32_t wide = 0;
    EXPECT_FALSE(cursor.readS4(wide));
    EXPECT_EQ(cursor.offset(), 0u);

    uint8_t byte = 0;
    ASSERT_TRUE(cursor.readU1(byte));
    int8_t sbyte = 0;
    ASSERT_TRUE(cursor.readS1(sbyte));
    EXPECT_EQ(sbyte, 2);

    uint16_t half = 0;
    EXPECT_FALSE(cursor.readU2(half));
    EXPECT_EQ(cursor.offset(), 2u);
    EXPECT_FALSE(cursor.skip(2));
    EXPECT_TRUE(cursor.skip(1));
    EXPECT_TRUE(cursor.atEnd());
}

TEST(ByteCursor, AlignsRelativeToBufferStart)
{
    const std::array<uint8_t, 8> bytes{};
    ByteCursor cursor(bytes);

    EXPECT_TRUE(cursor.alignTo4());
    EXPECT_EQ(cursor.offset(), 0u);

    ASSERT_TRUE(cursor.skip(1));
    EXPECT_TRUE(cursor.alignTo4());
    EXPECT_EQ(cursor.offset(), 4u);

    ASSERT_TRUE(cursor.skip(3));
    EXPECT_TRUE(cursor.alignTo4());
    EXPECT_EQ(cursor.offset(), 8u);
}

TEST(ByteCursor, AlignmentPastEndFails)
{
    const std::array<uint8_t, 2> bytes{};
    ByteCursor cursor(bytes);
    ASSERT_TRUE(cursor.skip(1));
    EXPECT_FALSE(cursor.alignTo4());
    EXPECT_EQ(cursor.offset(), 1u);
}
