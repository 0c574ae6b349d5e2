#pragma once

#include "l2db/core/types.h"
#include "l2db/format/l2db-structs.h"
#include <boost/filesystem.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace l2db {

/**
 * Access to the three regions of a database: header, index block and value
 * block.
 *
 * Implementations either keep everything in memory (MemoryStorage) or go to
 * the underlying file on every call (FileStorage). The Session only talks to
 * this interface, so its update and recovery logic is the same in both
 * modes. Value offsets are relative to the start of the value block.
 */
class StorageBackend
{
public:
    virtual ~StorageBackend() = default;

    virtual HeaderBytes
    read_header() = 0;

    virtual void
    write_header(const HeaderBytes& header) = 0;

    // Number of bytes currently in the index region
    virtual uint64_t
    index_size() = 0;

    virtual Bytes
    read_index() = 0;

    /**
     * Replace the whole index region
     *
     * When the length changes the value block moves with it; value offsets
     * stay valid because they are relative to the value block.
     */
    virtual void
    write_index(const Bytes& index) = 0;

    virtual uint64_t
    value_size() = 0;

    /**
     * @throws L2dbIOError if [offset, offset + length) is outside the value
     * block
     */
    virtual Bytes
    read_values(uint64_t offset, uint64_t length) = 0;

    // Overwrite inside the value block (may extend it when writing at its end)
    virtual void
    write_values(uint64_t offset, Slice data) = 0;

    // Append to the value block, returning the offset the data landed at
    virtual uint64_t
    append_values(Slice data) = 0;

    // Copy `length` bytes from `source` to `destination`; ranges may overlap
    virtual void
    move_values(uint64_t source, uint64_t destination, uint64_t length) = 0;

    virtual void
    truncate_values(uint64_t size) = 0;

    /**
     * Persist to the backend's own location
     *
     * @throws L2dbIOError("no file specified") when there is none
     */
    virtual void
    sync() = 0;

    // Write a complete image of the database to another file
    virtual void
    flush_to(const boost::filesystem::path& target) = 0;

    // Make `target` the backend's own location (after a moved flush)
    virtual void
    retarget(const boost::filesystem::path& target) = 0;

    // The full serialized database: header, index block, value block
    virtual Bytes
    image() = 0;

    // Path of the file this backend persists to, if it was opened by path
    virtual std::optional<boost::filesystem::path>
    location() const = 0;

    // Whether sync() has somewhere to go (a path or a borrowed stream)
    virtual bool
    has_target() const = 0;

    virtual bool
    buffered() const = 0;

    // Short description for log messages
    virtual std::string
    describe() const = 0;
};

/**
 * Write a complete database image to `target`, replacing any existing file
 *
 * @throws L2dbIOError if the file cannot be written
 */
void
write_image_file(
    const boost::filesystem::path& target,
    Slice header,
    Slice index,
    Slice values);

/**
 * Read an entire file into memory through a memory mapping
 *
 * @return The file contents; empty for an empty file
 * @throws L2dbIOError if the file does not exist or cannot be mapped
 */
Bytes
load_file(const boost::filesystem::path& path);

}  // namespace l2db
