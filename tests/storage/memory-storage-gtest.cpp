#include "l2db/format/l2db-errors.h"
#include "l2db/format/l2db-header.h"
#include "l2db/storage/memory-storage.h"
#include "l2db/test-utils/test-utils.h"
#include <gtest/gtest.h>

using namespace l2db;

namespace {

Bytes
make_image(uint32_t index_len, const Bytes& index, const Bytes& values)
{
    Header header;
    header.index_len = index_len;
    HeaderBytes hb = encode_header(header);
    Bytes out(hb.begin(), hb.end());
    out.insert(out.end(), index.begin(), index.end());
    out.insert(out.end(), values.begin(), values.end());
    return out;
}

}  // namespace

TEST(MemoryStorage, SplitsImageIntoRegions)
{
    Bytes image = make_image(3, hex_to_vector("AABBCC"), bytes_of("values"));
    auto storage = MemoryStorage::from_image(Slice(image));

    EXPECT_EQ(storage->index_size(), 3u);
    EXPECT_EQ(slice_hex(storage->read_index()), "AABBCC");
    EXPECT_EQ(storage->value_size(), 6u);
    EXPECT_EQ(storage->read_values(1, 3), bytes_of("alu"));
    EXPECT_EQ(storage->image(), image);
    EXPECT_TRUE(storage->buffered());
    EXPECT_FALSE(storage->has_target());
}

TEST(MemoryStorage, ClampsOverlongIndexLength)
{
    Bytes image = make_image(100, hex_to_vector("AABB"), {});
    auto storage = MemoryStorage::from_image(Slice(image));
    EXPECT_EQ(storage->index_size(), 2u);
    EXPECT_EQ(storage->value_size(), 0u);
}

TEST(MemoryStorage, RejectsShortImage)
{
    Bytes image(10, 0);
    EXPECT_THROW(MemoryStorage::from_image(Slice(image)), L2dbSyntaxError);
}

TEST(MemoryStorage, ValueOperations)
{
    MemoryStorage storage(encode_header(Header{}), {}, {});
    EXPECT_EQ(storage.append_values(Slice(bytes_of("abc"))), 0u);
    EXPECT_EQ(storage.append_values(Slice(bytes_of("defg"))), 3u);

    storage.write_values(1, Slice(bytes_of("X")));
    EXPECT_EQ(storage.read_values(0, 7), bytes_of("aXcdefg"));

    storage.move_values(3, 0, 4);
    storage.truncate_values(4);
    EXPECT_EQ(storage.read_values(0, 4), bytes_of("defg"));

    EXPECT_THROW(storage.read_values(2, 5), L2dbIOError);
    EXPECT_THROW(storage.write_values(9, Slice(bytes_of("z"))), L2dbIOError);
}

TEST(MemoryStorage, SyncWithoutLocationFails)
{
    MemoryStorage storage(encode_header(Header{}), {}, {});
    try
    {
        storage.sync();
        FAIL() << "expected an I/O error";
    }
    catch (const L2dbIOError& e)
    {
        EXPECT_STREQ(e.what(), "no file specified");
    }
}

class MemoryStorageFileTest : public TempDirTest
{
};

TEST_F(MemoryStorageFileTest, SyncRewritesLocation)
{
    auto path = path_for("db.l2db");
    MemoryStorage storage(encode_header(Header{}), {}, {}, path);
    storage.append_values(Slice(bytes_of("payload")));
    storage.sync();

    EXPECT_EQ(read_file(path), storage.image());
    EXPECT_EQ(load_file(path), storage.image());
}

TEST_F(MemoryStorageFileTest, RetargetMovesSyncDestination)
{
    auto first = path_for("a.l2db");
    auto second = path_for("b.l2db");
    MemoryStorage storage(encode_header(Header{}), {}, {}, first);

    storage.flush_to(second);
    storage.retarget(second);
    storage.append_values(Slice(bytes_of("x")));
    storage.sync();

    EXPECT_FALSE(boost::filesystem::exists(first));
    EXPECT_EQ(read_file(second).size(), HEADER_SIZE + 1);
    ASSERT_TRUE(storage.location().has_value());
    EXPECT_EQ(*storage.location(), second);
}

TEST_F(MemoryStorageFileTest, LoadFileHandlesEmptyAndMissing)
{
    auto empty = path_for("empty");
    write_file(empty, {});
    EXPECT_TRUE(load_file(empty).empty());
    EXPECT_THROW(load_file(path_for("missing")), L2dbIOError);
}
