#include "l2db/format/l2db-errors.h"
#include "l2db/session/session.h"
#include "l2db/test-utils/test-utils.h"
#include "session-test-helpers.h"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace l2db;
using session_test::build_image;
using session_test::value_block_offset;

namespace {

ValueMap
sample_values()
{
    return ValueMap{
        {"hello", std::string("world")},
        {"n", int64_t{42}},
        {"flag", true}};
}

}  // namespace

TEST(Session, DumpReturnsBootstrapMapping)
{
    auto session = Session::from_map(sample_values());
    ValueMap dumped = session->dump();
    EXPECT_TRUE(dumped == sample_values());
    EXPECT_EQ(session->size(), 3u);
    EXPECT_FALSE(session->dirty());
}

TEST(Session, SerializedBytesReopenIdentically)
{
    auto session = Session::from_map(sample_values());
    Bytes image = session->to_bytes();

    auto reopened = Session::from_bytes(image);
    EXPECT_TRUE(reopened->dump() == sample_values());
    EXPECT_EQ(reopened->to_bytes(), image);
}

TEST(Session, ReadDecodesStoredType)
{
    auto session = Session::from_map(sample_values());
    EXPECT_EQ(std::get<std::string>(session->read("hello")), "world");
    EXPECT_EQ(std::get<int64_t>(session->read("n")), 42);
    EXPECT_TRUE(std::get<bool>(session->read("flag")));
    EXPECT_EQ(session->entry("n").tag, TypeTag::INT);
    EXPECT_EQ(session->entry("n").length(), 1u);
}

TEST(Session, MissingKeyIsKeyNotFound)
{
    auto session = Session::from_map(sample_values());
    try
    {
        session->read("absent");
        FAIL() << "expected KeyNotFound";
    }
    catch (const L2dbKeyNotFoundError& e)
    {
        EXPECT_EQ(e.key(), "absent");
    }
    EXPECT_THROW(session->remove("absent"), L2dbKeyNotFoundError);
    EXPECT_THROW(session->entry("absent"), L2dbKeyNotFoundError);
    EXPECT_FALSE(session->contains("absent"));
}

TEST(Session, ShrinkInPlaceThenRelocateOnGrowth)
{
    auto session = Session::from_map({});
    session->write("k", std::string("0123456789"));
    EXPECT_EQ(session->stats().value_size, 10u);

    session->write("k", std::string("abc"));
    IndexEntry shrunk = session->entry("k");
    EXPECT_EQ(shrunk.value_start, 0u);
    EXPECT_EQ(shrunk.length(), 3u);
    EXPECT_EQ(session->stats().value_size, 10u);

    std::string fifty(50, 'z');
    session->write("k", fifty);
    IndexEntry grown = session->entry("k");
    EXPECT_EQ(grown.value_start, 10u);
    EXPECT_EQ(grown.length(), 50u);
    EXPECT_EQ(session->size(), 1u);
    EXPECT_EQ(std::get<std::string>(session->dump()["k"]), fifty);

    SessionStats stats = session->stats();
    EXPECT_EQ(stats.value_size, 60u);
    EXPECT_EQ(stats.live_bytes, 50u);
    EXPECT_EQ(stats.dead_bytes, 10u);
}

TEST(Session, SameSizeWriteLeavesOtherEntriesAlone)
{
    auto session = Session::from_map(sample_values());
    IndexEntry hello_before = session->entry("hello");
    IndexEntry flag_before = session->entry("flag");
    size_t index_before = session->header().index_len;

    session->write("n", int64_t{-7});

    EXPECT_EQ(session->entry("hello"), hello_before);
    EXPECT_EQ(session->entry("flag"), flag_before);
    EXPECT_EQ(session->header().index_len, index_before);
    EXPECT_EQ(std::get<int64_t>(session->read("n")), -7);
}

TEST(Session, RemoveLeavesDeadSpace)
{
    auto session = Session::from_map(sample_values());
    uint64_t value_size = session->stats().value_size;

    session->remove("hello");
    EXPECT_FALSE(session->contains("hello"));
    EXPECT_EQ(session->size(), 2u);

    SessionStats stats = session->stats();
    EXPECT_EQ(stats.value_size, value_size);
    EXPECT_EQ(stats.dead_bytes, 5u);
    EXPECT_EQ(session->header().index_len, session->to_bytes().size() - 64 - value_size);
}

TEST(Session, KeysFollowIndexOrder)
{
    auto session = Session::from_map({});
    session->write("zeta", true);
    session->write("alpha", false);
    session->update(ValueMap{{"mid", Null{}}, {"alpha", true}});

    std::vector<std::string> expected = {"zeta", "alpha", "mid"};
    EXPECT_EQ(session->keys(), expected);
    EXPECT_TRUE(std::get<bool>(session->read("alpha")));
}

TEST(Session, ConvertsOnReadAndWrite)
{
    auto session = Session::from_map(sample_values());
    EXPECT_EQ(
        std::get<std::string>(session->read("n", TypeTag::STR)), "42");
    EXPECT_EQ(std::get<double>(session->read("n", TypeTag::FLT)), 42.0);
    EXPECT_THROW(session->read("hello", TypeTag::INT), L2dbTypeConversionError);

    session->write("count", std::string("17"), TypeTag::UIN);
    EXPECT_EQ(session->entry("count").tag, TypeTag::UIN);
    EXPECT_EQ(std::get<uint64_t>(session->read("count")), 17u);

    EXPECT_THROW(
        session->write("bad", std::string("x"), TypeTag::INT),
        L2dbTypeConversionError);
    EXPECT_FALSE(session->contains("bad"));

    EXPECT_THROW(
        session->write("text", hex_to_vector("FF"), TypeTag::STR),
        L2dbTypeConversionError);
    EXPECT_FALSE(session->contains("text"));
}

TEST(Session, InvalidKeysAreRejected)
{
    auto session = Session::from_map({});
    EXPECT_THROW(session->write("", true), L2dbInvalidKeyError);
    EXPECT_THROW(
        session->write(std::string("a\0b", 3), true), L2dbInvalidKeyError);
}

TEST(Session, BadMagicIsSyntaxErrorWhenStrict)
{
    Bytes image = Session::from_map(sample_values())->to_bytes();
    image[0] = 0x00;

    EXPECT_THROW(Session::from_bytes(image), L2dbSyntaxError);

    SessionOptions lenient;
    lenient.strict = false;
    auto session = Session::from_bytes(image, lenient);
    EXPECT_TRUE(session->dump() == sample_values());
}

TEST(Session, UnsupportedMajorVersionIsRejected)
{
    Bytes image = build_image({}, {});
    image[HEADER_VERSION_OFFSET + 1] = 2;
    EXPECT_THROW(Session::from_bytes(image), L2dbVersionMismatchError);
}

TEST(Session, TooSmallBufferIsSyntaxError)
{
    EXPECT_THROW(Session::from_bytes(Bytes(20, 0)), L2dbSyntaxError);
}

TEST(Session, OverlongIndexLength)
{
    Bytes image = build_image({}, {}, 0, 500);
    EXPECT_THROW(Session::from_bytes(image), L2dbSyntaxError);

    SessionOptions lenient;
    lenient.strict = false;
    auto session = Session::from_bytes(image, lenient);
    EXPECT_TRUE(session->dirty());
    EXPECT_EQ(session->header().index_len, 0u);
}

TEST(Session, MalformedBooleanMarksDirty)
{
    auto source = Session::from_map(sample_values());
    Bytes image = source->to_bytes();
    image[value_block_offset(image) + source->entry("flag").value_start] = 0x02;

    auto session = Session::from_bytes(image);
    EXPECT_FALSE(session->dirty());

    EXPECT_TRUE(std::get<bool>(session->read("flag")));
    EXPECT_TRUE(session->dirty());
    EXPECT_EQ(session->state(), SessionState::DIRTY);
    EXPECT_TRUE(session->header().dirty());

    // Reads stay available, structural changes do not
    EXPECT_EQ(std::get<int64_t>(session->read("n")), 42);
    EXPECT_THROW(session->write("n", int64_t{1}), L2dbDirtyDatabaseError);
    EXPECT_THROW(session->remove("n"), L2dbDirtyDatabaseError);
    EXPECT_THROW(session->widen_index(), L2dbDirtyDatabaseError);

    CleanupReport report = session->cleanup();
    EXPECT_EQ(report.repaired, 1u);
    EXPECT_EQ(report.discarded, 0u);
    EXPECT_FALSE(session->dirty());
    EXPECT_FALSE(session->header().dirty());

    EXPECT_NO_THROW(session->write("n", int64_t{1}));
    EXPECT_TRUE(std::get<bool>(session->read("flag")));
    EXPECT_FALSE(session->dirty());
}

TEST(Session, DumpMarksDirtyOnAnomaly)
{
    Bytes image =
        build_image({IndexEntry{0, 1, TypeTag::NUL, "nothing"}}, {0x05});
    auto session = Session::from_bytes(image);

    ValueMap dumped = session->dump();
    EXPECT_TRUE(std::holds_alternative<Null>(dumped["nothing"]));
    EXPECT_TRUE(session->dirty());
}

TEST(Session, DirtyFlagFromFileIsHonoured)
{
    Bytes image = build_image(
        {IndexEntry{0, 1, TypeTag::BOL, "b"}}, {0x01}, FLAG_DIRTY);
    auto session = Session::from_bytes(image);
    EXPECT_TRUE(session->dirty());
    EXPECT_THROW(session->write("b", false), L2dbDirtyDatabaseError);

    session->cleanup(true);
    EXPECT_FALSE(session->dirty());
    session->write("b", false);
    EXPECT_FALSE(std::get<bool>(session->read("b")));
}

TEST(Session, NaNIsStoredAsAnomaly)
{
    auto session = Session::from_map({});
    session->write("x", std::numeric_limits<double>::quiet_NaN());
    EXPECT_TRUE(session->dirty());
    EXPECT_EQ(session->entry("x").length(), 0u);
    EXPECT_TRUE(std::isnan(std::get<double>(session->read("x"))));
}

TEST(Session, NaNInBootstrapMappingKeepsLaterKeys)
{
    auto session = Session::from_map(
        {{"a", std::numeric_limits<double>::quiet_NaN()},
         {"b", int64_t{1}},
         {"c", std::string("three")}});
    EXPECT_TRUE(session->dirty());
    EXPECT_TRUE(session->header().dirty());
    EXPECT_EQ(session->size(), 3u);
    EXPECT_EQ(std::get<int64_t>(session->read("b")), 1);
    EXPECT_EQ(std::get<std::string>(session->read("c")), "three");
    EXPECT_THROW(session->write("d", true), L2dbDirtyDatabaseError);
}

TEST(Session, CleanupCompactsDeadSpace)
{
    auto session = Session::from_map(sample_values());
    session->write("hello", std::string("a much longer greeting"));
    session->remove("n");
    ASSERT_GT(session->stats().dead_bytes, 0u);

    ValueMap before = session->dump();
    std::vector<std::string> keys_before = session->keys();
    CleanupReport report = session->cleanup();

    EXPECT_EQ(report.kept, 2u);
    EXPECT_EQ(report.repaired, 0u);
    EXPECT_GT(report.reclaimed_bytes, 0u);

    SessionStats stats = session->stats();
    EXPECT_EQ(stats.dead_bytes, 0u);
    EXPECT_EQ(stats.live_bytes, stats.value_size);
    EXPECT_TRUE(session->dump() == before);
    EXPECT_EQ(session->keys(), keys_before);
}

TEST(Session, CleanupRepairsStructuralDamage)
{
    Bytes values = bytes_of("abcdef");
    Bytes image = build_image(
        {IndexEntry{0, 3, TypeTag::STR, "a"},
         IndexEntry{2, 5, TypeTag::STR, "b"},    // overlaps "a"
         IndexEntry{3, 4, TypeTag::STR, "a"},    // duplicate name
         IndexEntry{4, 10, TypeTag::STR, "c"},   // past the value block
         IndexEntry{5, 6, TypeTag::BOL, "d"}},   // 'f' is not a boolean
        values);

    auto session = Session::from_bytes(image);
    EXPECT_TRUE(session->dirty());

    CleanupReport report = session->cleanup();
    EXPECT_EQ(report.kept, 3u);
    EXPECT_EQ(report.repaired, 2u);
    EXPECT_EQ(report.discarded, 2u);
    EXPECT_FALSE(session->dirty());

    std::vector<std::string> expected_keys = {"a", "b", "d"};
    EXPECT_EQ(session->keys(), expected_keys);
    EXPECT_EQ(std::get<std::string>(session->read("a")), "abc");
    EXPECT_EQ(std::get<std::string>(session->read("b")), "cde");
    EXPECT_TRUE(std::get<bool>(session->read("d")));
    EXPECT_FALSE(session->dirty());
    EXPECT_EQ(session->stats().dead_bytes, 0u);
}

TEST(Session, CleanupCanDiscardCorruptedEntries)
{
    Bytes image = build_image(
        {IndexEntry{0, 3, TypeTag::STR, "a"},
         IndexEntry{2, 5, TypeTag::STR, "b"},
         IndexEntry{5, 6, TypeTag::BOL, "d"}},
        bytes_of("abcdef"),
        FLAG_DIRTY);

    auto session = Session::from_bytes(image);
    CleanupReport report = session->cleanup(false, true);
    EXPECT_EQ(report.kept, 1u);
    EXPECT_EQ(report.discarded, 2u);
    EXPECT_EQ(report.reclaimed_bytes, 3u);

    std::vector<std::string> expected_keys = {"a"};
    EXPECT_EQ(session->keys(), expected_keys);
    EXPECT_EQ(session->stats().value_size, 3u);
}

TEST(Session, CleanupRetagsUndecodableFloatsAsRaw)
{
    Bytes image = build_image(
        {IndexEntry{0, 3, TypeTag::FLT, "f"}, IndexEntry{3, 5, TypeTag::INV, "i"}},
        hex_to_vector("0102030405"));
    auto session = Session::from_bytes(image);

    session->cleanup();
    EXPECT_EQ(session->entry("f").tag, TypeTag::RAW);
    EXPECT_EQ(session->entry("i").tag, TypeTag::RAW);
    EXPECT_EQ(slice_hex(std::get<Bytes>(session->read("f"))), "010203");
    EXPECT_EQ(slice_hex(std::get<Bytes>(session->read("i"))), "0405");
    EXPECT_FALSE(session->dirty());
}

TEST(Session, CleanupDropsMalformedIndexTail)
{
    Bytes image = build_image({IndexEntry{0, 1, TypeTag::BOL, "ok"}}, {0x01});
    // Append garbage to the index and fix up the header length
    size_t index_len = value_block_offset(image) - HEADER_SIZE;
    image.insert(image.begin() + HEADER_SIZE + index_len, {0xDE, 0xAD});
    image[HEADER_INDEX_LEN_OFFSET + 3] = static_cast<uint8_t>(index_len + 2);

    auto session = Session::from_bytes(image);
    EXPECT_TRUE(session->dirty());

    session->cleanup();
    EXPECT_EQ(session->header().index_len, index_len);
    EXPECT_TRUE(std::get<bool>(session->read("ok")));
}

TEST(Session, ModeIsEnforced)
{
    SessionOptions read_only;
    read_only.mode = OpenMode::READ;
    auto reader = Session::from_map(sample_values(), read_only);
    EXPECT_EQ(std::get<int64_t>(reader->read("n")), 42);
    EXPECT_THROW(reader->write("n", int64_t{1}), L2dbReadOnlyError);
    EXPECT_THROW(reader->remove("n"), L2dbReadOnlyError);
    EXPECT_THROW(reader->cleanup(), L2dbReadOnlyError);
    EXPECT_THROW(reader->set_locked(true), L2dbReadOnlyError);

    SessionOptions write_only;
    write_only.mode = OpenMode::WRITE;
    auto writer = Session::from_map(sample_values(), write_only);
    EXPECT_THROW(writer->read("n"), L2dbWriteOnlyError);
    EXPECT_THROW(writer->dump(), L2dbWriteOnlyError);
    EXPECT_NO_THROW(writer->write("n", int64_t{5}));
}

TEST(Session, FlushWithoutFileFails)
{
    auto session = Session::from_map(sample_values());
    try
    {
        session->flush();
        FAIL() << "expected an I/O error";
    }
    catch (const L2dbIOError& e)
    {
        EXPECT_STREQ(e.what(), "no file specified");
    }
}

TEST(Session, ClosedSessionRejectsOperations)
{
    auto session = Session::from_map(sample_values());
    session->close();
    EXPECT_FALSE(session->is_open());
    EXPECT_EQ(session->state(), SessionState::CLOSED);
    EXPECT_NO_THROW(session->close());
    EXPECT_THROW(session->read("n"), L2dbClosedError);
    EXPECT_THROW(session->write("n", int64_t{1}), L2dbClosedError);
    EXPECT_THROW(session->dump(), L2dbClosedError);
}

TEST(Session, LockedFlagIsAdvisory)
{
    auto session = Session::from_map(sample_values());
    session->set_locked(true);
    EXPECT_TRUE(session->locked());
    EXPECT_NO_THROW(session->write("n", int64_t{9}));

    auto reopened = Session::from_bytes(session->to_bytes());
    EXPECT_TRUE(reopened->locked());
    reopened->set_locked(false);
    EXPECT_FALSE(reopened->header().locked());
}

TEST(Session, WidenIndexKeepsEntries)
{
    auto session = Session::from_map(sample_values());
    session->widen_index();
    EXPECT_TRUE(session->header().wide_index());
    EXPECT_EQ(
        session->header().index_len,
        Index::entry_size("hello", true) + Index::entry_size("n", true) +
            Index::entry_size("flag", true));
    EXPECT_TRUE(session->dump() == sample_values());

    auto reopened = Session::from_bytes(session->to_bytes());
    EXPECT_TRUE(reopened->dump() == sample_values());
    reopened->write("extra", std::string("value"));
    EXPECT_EQ(std::get<std::string>(reopened->read("extra")), "value");
}

TEST(Session, WideIndexFromOptions)
{
    SessionOptions options;
    options.flags = FLAG_WIDE_INDEX | FLAG_DIRTY;
    auto session = Session::from_map(sample_values(), options);
    EXPECT_TRUE(session->header().wide_index());
    EXPECT_FALSE(session->dirty());
}
