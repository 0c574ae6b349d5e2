#pragma once

#include "l2db/core/logger.h"
#include "l2db/storage/storage-backend.h"
#include <fstream>
#include <iostream>
#include <memory>

namespace l2db {

/**
 * Unbuffered access to a database file
 *
 * Every call seeks and reads or writes the underlying stream; nothing but
 * the region sizes is cached. The stream is either owned (opened by path)
 * or borrowed from the caller, in which case it is never closed here.
 */
class FileStorage : public StorageBackend
{
public:
    // Open an existing file by path
    FileStorage(const boost::filesystem::path& path, bool writable);

    // Borrow a caller-owned seekable stream positioned anywhere
    explicit FileStorage(std::iostream& stream);

    ~FileStorage() override;

    FileStorage(const FileStorage&) = delete;
    FileStorage&
    operator=(const FileStorage&) = delete;

    /**
     * Create a new file holding only `header` and open it
     *
     * @throws L2dbIOError if the file cannot be created
     */
    static std::unique_ptr<FileStorage>
    create(const boost::filesystem::path& path, const HeaderBytes& header);

    HeaderBytes
    read_header() override;

    void
    write_header(const HeaderBytes& header) override;

    uint64_t
    index_size() override;

    Bytes
    read_index() override;

    void
    write_index(const Bytes& index) override;

    uint64_t
    value_size() override;

    Bytes
    read_values(uint64_t offset, uint64_t length) override;

    void
    write_values(uint64_t offset, Slice data) override;

    uint64_t
    append_values(Slice data) override;

    void
    move_values(uint64_t source, uint64_t destination, uint64_t length)
        override;

    void
    truncate_values(uint64_t size) override;

    void
    sync() override;

    void
    flush_to(const boost::filesystem::path& target) override;

    void
    retarget(const boost::filesystem::path& target) override;

    Bytes
    image() override;

    std::optional<boost::filesystem::path>
    location() const override;

    bool
    has_target() const override
    {
        return true;
    }

    bool
    buffered() const override
    {
        return false;
    }

    std::string
    describe() const override;

    static LogPartition&
    get_log_partition()
    {
        return log_partition_;
    }

private:
    void
    load_layout();

    std::iostream&
    stream();

    void
    read_at(uint64_t position, uint8_t* out, uint64_t length);

    void
    write_at(uint64_t position, const uint8_t* data, uint64_t length);

    // Chunked copy between absolute file positions; ranges may overlap
    void
    copy_within(uint64_t source, uint64_t destination, uint64_t length);

    void
    shrink_file(uint64_t new_size);

    uint64_t
    values_start() const
    {
        return HEADER_SIZE + index_len_;
    }

    std::unique_ptr<std::fstream> owned_;
    std::iostream* borrowed_ = nullptr;
    std::optional<boost::filesystem::path> path_;
    bool writable_ = true;
    uint64_t index_len_ = 0;
    uint64_t value_size_ = 0;

    static LogPartition log_partition_;
};

}  // namespace l2db
