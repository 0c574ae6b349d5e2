#pragma once

#include "l2db/core/slice-cursor.h"
#include "l2db/core/types.h"
#include "l2db/format/l2db-type-tag.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace l2db {

/**
 * One index record: a key name bound to [value_start, value_end) of the
 * value block plus the tag describing how to decode those bytes.
 */
struct IndexEntry
{
    uint64_t value_start = 0;
    uint64_t value_end = 0;
    TypeTag tag = TypeTag::RAW;
    std::string key;

    uint64_t
    length() const
    {
        return value_end > value_start ? value_end - value_start : 0;
    }

    bool
    operator==(const IndexEntry&) const = default;
};

// An entry together with where its encoding sits inside the index block
struct EntryLocation
{
    IndexEntry entry;
    size_t offset = 0;
    size_t size = 0;
};

/**
 * Result of walking the whole index block
 *
 * `valid_length` is the length of the well-formed prefix; when the walk hit
 * a malformed entry, `anomaly` says why and everything from `valid_length`
 * onwards is unreachable.
 */
struct IndexScan
{
    std::vector<EntryLocation> entries;
    size_t valid_length = 0;
    std::string anomaly;

    bool
    ok() const
    {
        return anomaly.empty();
    }
};

// Throws L2dbInvalidKeyError for empty keys or keys containing 0x00
void
validate_key(std::string_view key);

/**
 * The index block, kept in its wire format
 *
 * Entries are packed back to back as
 *   value_start | value_end | 3-byte tag | key bytes | 0x00
 * with 4-byte offsets, or 8-byte offsets when the index is wide. There is no
 * secondary lookup structure: every operation walks the block from the
 * start, so the in-memory bytes are always exactly what goes to disk.
 */
class Index
{
public:
    Index(Bytes block, bool wide);

    static size_t
    offset_width(bool wide)
    {
        return wide ? 8 : 4;
    }

    // Encoded size of an entry with the given key
    static size_t
    entry_size(std::string_view key, bool wide)
    {
        return 2 * offset_width(wide) + TYPE_TAG_SIZE + key.size() + 1;
    }

    /**
     * Encode a single entry
     *
     * @throws L2dbInvalidKeyError if the key is not storable
     * @throws L2dbError if an offset does not fit a narrow index
     */
    static Bytes
    encode_entry(const IndexEntry& entry, bool wide);

    /**
     * Look up a key by walking entry boundaries
     *
     * @return The first entry whose name equals `key`, or nullopt when the
     * key is absent or only reachable past a malformed entry
     */
    std::optional<EntryLocation>
    find(std::string_view key) const;

    /**
     * Repoint an existing entry or append a new one
     *
     * An existing entry has its offsets and tag rewritten in place; its name
     * bytes are untouched. Otherwise a new entry is appended at the end.
     */
    void
    insert_or_update(
        std::string_view key,
        TypeTag tag,
        uint64_t value_start,
        uint64_t value_end);

    // Append without looking for an existing entry of the same name
    void
    append(const IndexEntry& entry);

    // Splice an entry out of the block; false when the key is absent
    bool
    remove(std::string_view key);

    IndexScan
    scan() const;

    // Entries of the well-formed prefix, in index order
    std::vector<IndexEntry>
    entries() const;

    // Re-encode every well-formed entry with the given offset width
    Index
    rewritten(bool wide) const;

    const Bytes&
    bytes() const
    {
        return block_;
    }

    size_t
    size() const
    {
        return block_.size();
    }

    bool
    wide() const
    {
        return wide_;
    }

private:
    // Decodes the entry at the cursor; false (with `why`) when malformed
    bool
    read_entry(core::SliceCursor& cursor, EntryLocation& out, std::string& why)
        const;

    void
    write_offsets(size_t at, uint64_t value_start, uint64_t value_end);

    Bytes block_;
    bool wide_;
};

}  // namespace l2db
