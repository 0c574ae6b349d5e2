#include "l2db/storage/memory-storage.h"
#include "l2db/format/l2db-errors.h"
#include "l2db/format/l2db-header.h"
#include <algorithm>
#include <cstring>

namespace l2db {

MemoryStorage::MemoryStorage(
    const HeaderBytes& header,
    Bytes index,
    Bytes values,
    std::optional<boost::filesystem::path> location)
    : header_(header)
    , index_(std::move(index))
    , values_(std::move(values))
    , location_(std::move(location))
{
}

std::unique_ptr<MemoryStorage>
MemoryStorage::from_image(
    Slice image,
    std::optional<boost::filesystem::path> location)
{
    if (image.size() < HEADER_SIZE)
    {
        throw L2dbSyntaxError(
            "Buffer too small to contain an l2db header: " +
            std::to_string(image.size()) + " bytes");
    }

    HeaderBytes header;
    std::memcpy(header.data(), image.data(), HEADER_SIZE);

    uint64_t available = image.size() - HEADER_SIZE;
    uint64_t index_len =
        std::min<uint64_t>(header_index_length(image), available);

    Slice index = image.subslice(HEADER_SIZE, index_len);
    Slice values = image.subslice(HEADER_SIZE + index_len);
    return std::make_unique<MemoryStorage>(
        header, index.to_bytes(), values.to_bytes(), std::move(location));
}

HeaderBytes
MemoryStorage::read_header()
{
    return header_;
}

void
MemoryStorage::write_header(const HeaderBytes& header)
{
    header_ = header;
}

uint64_t
MemoryStorage::index_size()
{
    return index_.size();
}

Bytes
MemoryStorage::read_index()
{
    return index_;
}

void
MemoryStorage::write_index(const Bytes& index)
{
    index_ = index;
}

uint64_t
MemoryStorage::value_size()
{
    return values_.size();
}

void
MemoryStorage::check_range(uint64_t offset, uint64_t length) const
{
    if (offset > values_.size() || length > values_.size() - offset)
    {
        throw L2dbIOError(
            "Value range [" + std::to_string(offset) + ", " +
            std::to_string(offset + length) + ") is outside the value block of " +
            std::to_string(values_.size()) + " bytes");
    }
}

Bytes
MemoryStorage::read_values(uint64_t offset, uint64_t length)
{
    check_range(offset, length);
    auto first = values_.begin() + static_cast<std::ptrdiff_t>(offset);
    return Bytes(first, first + static_cast<std::ptrdiff_t>(length));
}

void
MemoryStorage::write_values(uint64_t offset, Slice data)
{
    if (offset > values_.size())
    {
        throw L2dbIOError(
            "Write offset " + std::to_string(offset) +
            " is past the end of the value block");
    }
    if (offset + data.size() > values_.size())
    {
        values_.resize(offset + data.size());
    }
    if (!data.empty())
    {
        std::memcpy(values_.data() + offset, data.data(), data.size());
    }
}

uint64_t
MemoryStorage::append_values(Slice data)
{
    uint64_t offset = values_.size();
    values_.insert(values_.end(), data.data(), data.data() + data.size());
    return offset;
}

void
MemoryStorage::move_values(
    uint64_t source,
    uint64_t destination,
    uint64_t length)
{
    check_range(source, length);
    check_range(destination, length);
    if (length > 0 && source != destination)
    {
        std::memmove(
            values_.data() + destination, values_.data() + source, length);
    }
}

void
MemoryStorage::truncate_values(uint64_t size)
{
    if (size < values_.size())
    {
        values_.resize(size);
    }
}

void
MemoryStorage::sync()
{
    if (!location_)
    {
        throw L2dbIOError("no file specified");
    }
    flush_to(*location_);
}

void
MemoryStorage::flush_to(const boost::filesystem::path& target)
{
    write_image_file(
        target,
        Slice(header_.data(), header_.size()),
        Slice(index_),
        Slice(values_));
}

void
MemoryStorage::retarget(const boost::filesystem::path& target)
{
    location_ = target;
}

Bytes
MemoryStorage::image()
{
    Bytes out;
    out.reserve(HEADER_SIZE + index_.size() + values_.size());
    out.insert(out.end(), header_.begin(), header_.end());
    out.insert(out.end(), index_.begin(), index_.end());
    out.insert(out.end(), values_.begin(), values_.end());
    return out;
}

std::optional<boost::filesystem::path>
MemoryStorage::location() const
{
    return location_;
}

bool
MemoryStorage::has_target() const
{
    return location_.has_value();
}

std::string
MemoryStorage::describe() const
{
    return location_ ? "buffered file '" + location_->string() + "'"
                     : std::string("in-memory buffer");
}

}  // namespace l2db
