#include "l2db/format/l2db-index.h"
#include "l2db/core/byte-order.h"
#include "l2db/format/l2db-errors.h"
#include <algorithm>
#include <cstring>
#include <limits>

namespace l2db {

using namespace l2db::core;

namespace {

void
check_narrow(uint64_t offset)
{
    if (offset > std::numeric_limits<uint32_t>::max())
    {
        throw L2dbError(
            "Offset " + std::to_string(offset) +
            " does not fit a 4-byte index; widen the index first");
    }
}

}  // namespace

void
validate_key(std::string_view key)
{
    if (key.empty())
    {
        throw L2dbInvalidKeyError("Key names must not be empty");
    }
    if (key.find('\0') != std::string_view::npos)
    {
        throw L2dbInvalidKeyError("Key names must not contain 0x00 bytes");
    }
}

Index::Index(Bytes block, bool wide) : block_(std::move(block)), wide_(wide)
{
}

Bytes
Index::encode_entry(const IndexEntry& entry, bool wide)
{
    validate_key(entry.key);
    size_t width = offset_width(wide);
    if (!wide)
    {
        check_narrow(entry.value_start);
        check_narrow(entry.value_end);
    }

    Bytes out(entry_size(entry.key, wide));
    put_uint_be(out.data(), entry.value_start, width);
    put_uint_be(out.data() + width, entry.value_end, width);
    auto code = tag_code(entry.tag);
    std::memcpy(out.data() + 2 * width, code.data(), TYPE_TAG_SIZE);
    std::memcpy(
        out.data() + 2 * width + TYPE_TAG_SIZE, entry.key.data(), entry.key.size());
    out.back() = 0x00;
    return out;
}

bool
Index::read_entry(SliceCursor& cursor, EntryLocation& out, std::string& why)
    const
{
    size_t width = offset_width(wide_);
    size_t start = cursor.pos;
    if (cursor.remaining_size() < 2 * width + TYPE_TAG_SIZE + 1)
    {
        why = "truncated entry at index offset " + std::to_string(start);
        return false;
    }

    Slice offsets = cursor.read_slice(2 * width);
    Slice code = cursor.read_slice(TYPE_TAG_SIZE);
    auto tag = parse_tag(code.data());
    if (!tag)
    {
        why = "unrecognized type tag '" +
            std::string(reinterpret_cast<const char*>(code.data()), 3) +
            "' at index offset " + std::to_string(start);
        return false;
    }

    Slice name;
    try
    {
        name = cursor.read_until_nul();
    }
    catch (const SliceCursorError&)
    {
        why = "unterminated key name at index offset " + std::to_string(start);
        return false;
    }
    if (name.empty())
    {
        why = "empty key name at index offset " + std::to_string(start);
        return false;
    }

    out.entry.value_start = get_uint_be(offsets.data(), width);
    out.entry.value_end = get_uint_be(offsets.data() + width, width);
    out.entry.tag = *tag;
    out.entry.key.assign(
        reinterpret_cast<const char*>(name.data()), name.size());
    out.offset = start;
    out.size = cursor.pos - start;
    return true;
}

std::optional<EntryLocation>
Index::find(std::string_view key) const
{
    SliceCursor cursor{Slice(block_), 0};
    EntryLocation location;
    std::string why;
    while (!cursor.empty())
    {
        if (!read_entry(cursor, location, why))
            return std::nullopt;
        if (location.entry.key == key)
            return location;
    }
    return std::nullopt;
}

void
Index::write_offsets(size_t at, uint64_t value_start, uint64_t value_end)
{
    size_t width = offset_width(wide_);
    if (!wide_)
    {
        check_narrow(value_start);
        check_narrow(value_end);
    }
    put_uint_be(block_.data() + at, value_start, width);
    put_uint_be(block_.data() + at + width, value_end, width);
}

void
Index::insert_or_update(
    std::string_view key,
    TypeTag tag,
    uint64_t value_start,
    uint64_t value_end)
{
    validate_key(key);
    if (auto location = find(key))
    {
        write_offsets(location->offset, value_start, value_end);
        auto code = tag_code(tag);
        std::memcpy(
            block_.data() + location->offset + 2 * offset_width(wide_),
            code.data(),
            TYPE_TAG_SIZE);
        return;
    }
    append(IndexEntry{value_start, value_end, tag, std::string(key)});
}

void
Index::append(const IndexEntry& entry)
{
    Bytes encoded = encode_entry(entry, wide_);
    block_.insert(block_.end(), encoded.begin(), encoded.end());
}

bool
Index::remove(std::string_view key)
{
    auto location = find(key);
    if (!location)
        return false;
    auto first = block_.begin() + static_cast<std::ptrdiff_t>(location->offset);
    block_.erase(first, first + static_cast<std::ptrdiff_t>(location->size));
    return true;
}

IndexScan
Index::scan() const
{
    IndexScan result;
    SliceCursor cursor{Slice(block_), 0};
    while (!cursor.empty())
    {
        EntryLocation location;
        if (!read_entry(cursor, location, result.anomaly))
            break;
        result.entries.push_back(std::move(location));
        result.valid_length = cursor.pos;
    }
    return result;
}

std::vector<IndexEntry>
Index::entries() const
{
    std::vector<IndexEntry> out;
    for (auto& location : scan().entries)
    {
        out.push_back(std::move(location.entry));
    }
    return out;
}

Index
Index::rewritten(bool wide) const
{
    Index out(Bytes{}, wide);
    for (const auto& entry : entries())
    {
        out.append(entry);
    }
    return out;
}

}  // namespace l2db
