#pragma once

#include "l2db/core/logger.h"
#include "l2db/format/l2db-index.h"
#include "l2db/format/l2db-structs.h"
#include "l2db/format/l2db-value-codec.h"
#include "l2db/format/l2db-value.h"
#include "l2db/session/session-options.h"
#include "l2db/storage/storage-backend.h"
#include <boost/filesystem.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace l2db {

enum class SessionState { CLOSED, CLEAN, DIRTY };

// Space accounting for the value block
struct SessionStats
{
    size_t entry_count = 0;
    uint64_t value_size = 0;
    uint64_t live_bytes = 0;
    uint64_t dead_bytes = 0;
};

// What a cleanup pass did
struct CleanupReport
{
    size_t kept = 0;
    size_t repaired = 0;
    size_t discarded = 0;
    uint64_t reclaimed_bytes = 0;
};

/**
 * An open l2db database
 *
 * A session owns one header, index block and value block triple through a
 * StorageBackend. It enforces the open mode, keeps the three regions
 * consistent across writes, and runs the dirty protocol: any structural
 * anomaly found while reading sets the DIRTY flag, which blocks structural
 * mutations until cleanup() runs.
 *
 * Sessions are single-threaded. The LOCKED header bit is only stored and
 * reported; it is never enforced here.
 */
class Session
{
public:
    /**
     * Open a session over an already constructed backend
     *
     * @throws L2dbSyntaxError if the header is malformed, or if the index
     * length exceeds the available bytes under strict options
     * @throws L2dbVersionMismatchError if the major version is unsupported
     */
    Session(
        std::unique_ptr<StorageBackend> backend,
        const SessionOptions& options = {});

    ~Session();

    Session(const Session&) = delete;
    Session&
    operator=(const Session&) = delete;

    /**
     * Bootstrap a fresh in-memory database holding `values`
     *
     * The initial writes ignore the READ/WRITE bits of the mode; the
     * resulting session then enforces them.
     */
    static std::unique_ptr<Session>
    from_map(const ValueMap& values, const SessionOptions& options = {});

    /**
     * Open an already serialized database held in memory
     *
     * @throws L2dbSyntaxError if the buffer is too small or malformed
     */
    static std::unique_ptr<Session>
    from_bytes(const Bytes& bytes, const SessionOptions& options = {});

    /**
     * Open a database file, buffered or unbuffered according to the mode
     *
     * A missing file is created when the mode includes WRITE and
     * create_if_missing is set.
     *
     * @throws L2dbIOError if the file is missing or cannot be opened
     */
    static std::unique_ptr<Session>
    for_file(
        const boost::filesystem::path& path,
        const SessionOptions& options = {});

    /**
     * Open a database over a caller-owned seekable stream
     *
     * Access is always unbuffered and the stream is never closed by the
     * session. An empty stream is initialized with a fresh header when the
     * mode includes WRITE and create_if_missing is set.
     */
    static std::unique_ptr<Session>
    for_stream(std::iostream& stream, const SessionOptions& options = {});

    /**
     * Read and decode the value stored under `key`
     *
     * A malformed stored payload does not throw: a best-effort value is
     * returned and the session becomes DIRTY.
     *
     * @param as_type Convert the decoded value to this type
     * @throws L2dbKeyNotFoundError if the key is absent
     * @throws L2dbTypeConversionError if the conversion is not possible
     * @throws L2dbWriteOnlyError if the session was not opened for reading
     */
    Value
    read(std::string_view key, std::optional<TypeTag> as_type = std::nullopt);

    /**
     * Store `value` under `key`
     *
     * An encoding no longer than the existing range is written in place;
     * a longer one is appended and the entry repointed, leaving the old
     * range as dead space.
     *
     * @throws L2dbDirtyDatabaseError while DIRTY
     * @throws L2dbReadOnlyError if the session was not opened for writing
     * @throws L2dbInvalidKeyError for an empty key or one containing 0x00
     * @throws L2dbTypeConversionError if `as_type` cannot be produced
     */
    void
    write(
        std::string_view key,
        const Value& value,
        std::optional<TypeTag> as_type = std::nullopt);

    // Delete `key`; its value bytes become dead space
    void
    remove(std::string_view key);

    // Write every pair of `values`
    void
    update(const ValueMap& values);

    /**
     * Decode every entry
     *
     * When a key appears more than once the first entry wins, as with
     * read(). Anomalies mark the session DIRTY.
     */
    ValueMap
    dump();

    /**
     * Persist the database
     *
     * Without a target the session's own file (or stream) is synced. With a
     * target a complete image is written there; `move` then makes the target
     * the session's own file.
     *
     * @throws L2dbIOError("no file specified") without target or own file
     */
    void
    flush(
        const std::optional<boost::filesystem::path>& target = std::nullopt,
        bool move = false);

    /**
     * Validate, repair and compact the database, then clear DIRTY
     *
     * @param only_flag Skip validation and compaction; only clear DIRTY
     * @param discard_corrupted Drop corrupted entries instead of repairing
     */
    CleanupReport
    cleanup(bool only_flag = false, bool discard_corrupted = false);

    // Flush pending changes and release the backend. Idempotent.
    void
    close();

    bool
    contains(std::string_view key);

    // Key names in index order
    std::vector<std::string>
    keys();

    size_t
    size();

    // The index entry for `key`; throws L2dbKeyNotFoundError if absent
    IndexEntry
    entry(std::string_view key);

    // Complete serialized database
    Bytes
    to_bytes();

    SessionStats
    stats();

    const Header&
    header() const
    {
        return header_;
    }

    SessionState
    state() const
    {
        return state_;
    }

    bool
    is_open() const
    {
        return state_ != SessionState::CLOSED;
    }

    bool
    dirty() const
    {
        return state_ == SessionState::DIRTY;
    }

    bool
    locked() const
    {
        return header_.locked();
    }

    // Advisory only
    void
    set_locked(bool locked);

    // Re-encode the index with 8-byte offsets and set WIDE_INDEX
    void
    widen_index();

    const SessionOptions&
    options() const
    {
        return options_;
    }

    std::optional<boost::filesystem::path>
    location() const;

    static LogPartition&
    get_log_partition()
    {
        return log_partition_;
    }

private:
    void
    open();

    void
    check_open() const;

    void
    require_readable() const;

    void
    require_writable() const;

    void
    require_clean() const;

    Index
    load_index();

    // Replace the index region and record its length in the header
    void
    store_index(const Index& index);

    void
    persist_header();

    void
    mark_dirty(const std::string& reason);

    // Best-effort decode of an entry, clamping its range to the value block
    DecodedValue
    decode_entry(const IndexEntry& entry);

    bool
    in_bounds(const IndexEntry& entry, uint64_t value_size) const
    {
        return entry.value_start <= entry.value_end &&
            entry.value_end <= value_size;
    }

    std::unique_ptr<StorageBackend> backend_;
    SessionOptions options_;
    Header header_;
    SessionState state_ = SessionState::CLOSED;
    bool modified_ = false;
    bool bootstrapping_ = false;

    static LogPartition log_partition_;
};

}  // namespace l2db
