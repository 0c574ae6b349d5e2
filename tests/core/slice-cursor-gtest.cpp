#include "l2db/core/slice-cursor.h"
#include "l2db/core/types.h"
#include <gtest/gtest.h>

using namespace l2db;
using namespace l2db::core;

TEST(SliceCursor, ReadsFixedWidthFields)
{
    Bytes data = {0x01, 0x00, 0x00, 0x00, 0x02, 0xAB};
    SliceCursor cursor{Slice(data), 0};

    EXPECT_EQ(cursor.read_u8(), 0x01);
    EXPECT_EQ(cursor.read_uint32_be(), 2u);
    EXPECT_EQ(cursor.remaining_size(), 1u);
    EXPECT_EQ(cursor.read_u8(), 0xAB);
    EXPECT_TRUE(cursor.empty());
    EXPECT_THROW(cursor.read_u8(), SliceCursorError);
}

TEST(SliceCursor, ReadSliceChecksBounds)
{
    Bytes data = {1, 2, 3};
    SliceCursor cursor{Slice(data), 0};
    Slice two = cursor.read_slice(2);
    EXPECT_EQ(two.size(), 2u);
    EXPECT_EQ(two[1], 2);
    EXPECT_THROW(cursor.read_slice(2), SliceCursorError);
    EXPECT_THROW(cursor.read_uint64_be(), SliceCursorError);
}

TEST(SliceCursor, ReadUntilNulConsumesTerminator)
{
    Bytes data = {'a', 'b', 0x00, 'c', 0x00};
    SliceCursor cursor{Slice(data), 0};

    Slice first = cursor.read_until_nul();
    EXPECT_EQ(std::string(first.data(), first.data() + first.size()), "ab");
    EXPECT_EQ(cursor.pos, 3u);

    Slice second = cursor.read_until_nul();
    EXPECT_EQ(second.size(), 1u);
    EXPECT_TRUE(cursor.empty());
}

TEST(SliceCursor, ReadUntilNulThrowsWithoutTerminator)
{
    Bytes data = {'a', 'b'};
    SliceCursor cursor{Slice(data), 0};
    EXPECT_THROW(cursor.read_until_nul(), SliceCursorError);

    SliceCursor empty{Slice(), 0};
    EXPECT_THROW(empty.read_until_nul(), SliceCursorError);
}

TEST(Slice, SubsliceClampsToBounds)
{
    Bytes data = {1, 2, 3, 4};
    Slice slice(data);
    EXPECT_EQ(slice.subslice(1, 2).size(), 2u);
    EXPECT_EQ(slice.subslice(3, 10).size(), 1u);
    EXPECT_TRUE(slice.subslice(9).empty());
    EXPECT_EQ(slice_hex(slice.subslice(2)), "0304");
}
