#pragma once

#include "l2db/storage/storage-backend.h"
#include <memory>

namespace l2db {

/**
 * Whole database buffered in memory
 *
 * Used for byte-buffer and mapping sources and for buffered file access.
 * Nothing touches the disk until sync() or flush_to().
 */
class MemoryStorage : public StorageBackend
{
public:
    MemoryStorage(
        const HeaderBytes& header,
        Bytes index,
        Bytes values,
        std::optional<boost::filesystem::path> location = std::nullopt);

    /**
     * Split a serialized database into its regions
     *
     * The index length is taken from the header field and clamped to the
     * bytes actually available; the caller compares index_size() with the
     * decoded header to notice the difference.
     *
     * @throws L2dbSyntaxError if the image is shorter than a header
     */
    static std::unique_ptr<MemoryStorage>
    from_image(
        Slice image,
        std::optional<boost::filesystem::path> location = std::nullopt);

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
    has_target() const override;

    bool
    buffered() const override
    {
        return true;
    }

    std::string
    describe() const override;

private:
    void
    check_range(uint64_t offset, uint64_t length) const;

    HeaderBytes header_;
    Bytes index_;
    Bytes values_;
    std::optional<boost::filesystem::path> location_;
};

}  // namespace l2db
