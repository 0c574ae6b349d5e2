#include "l2db/storage/file-storage.h"
#include "l2db/format/l2db-errors.h"
#include "l2db/format/l2db-header.h"
#include <algorithm>
#include <array>

namespace l2db {

namespace {
constexpr uint64_t COPY_CHUNK_SIZE = 64 * 1024;
}

LogPartition FileStorage::log_partition_("storage");

FileStorage::FileStorage(const boost::filesystem::path& path, bool writable)
    : path_(path), writable_(writable)
{
    auto mode = std::ios::in | std::ios::binary;
    if (writable)
    {
        mode |= std::ios::out;
    }

    owned_ = std::make_unique<std::fstream>(path.string(), mode);
    if (!owned_->is_open())
    {
        throw L2dbIOError("Failed to open file: " + path.string());
    }

    load_layout();
    OLOGD(
        "Opened ",
        path.string(),
        " unbuffered, index ",
        index_len_,
        " bytes, values ",
        value_size_,
        " bytes");
}

FileStorage::FileStorage(std::iostream& stream) : borrowed_(&stream)
{
    load_layout();
    OLOGD(
        "Attached to stream, index ",
        index_len_,
        " bytes, values ",
        value_size_,
        " bytes");
}

FileStorage::~FileStorage()
{
    try
    {
        if (owned_ && owned_->is_open())
        {
            owned_->flush();
            owned_->close();
        }
        else if (borrowed_)
        {
            borrowed_->flush();
        }
    }
    catch (const std::exception& e)
    {
        LOGE("Error closing database file: ", e.what());
    }
}

std::unique_ptr<FileStorage>
FileStorage::create(
    const boost::filesystem::path& path,
    const HeaderBytes& header)
{
    write_image_file(path, Slice(header.data(), header.size()), {}, {});
    return std::make_unique<FileStorage>(path, true);
}

std::iostream&
FileStorage::stream()
{
    if (owned_)
    {
        return *owned_;
    }
    if (borrowed_)
    {
        return *borrowed_;
    }
    throw L2dbIOError("Database file is not open");
}

void
FileStorage::load_layout()
{
    auto& s = stream();
    s.clear();
    s.seekg(0, std::ios::end);
    std::streamoff end = s.tellg();
    if (!s || end < 0)
    {
        throw L2dbIOError("Failed to determine size of " + describe());
    }

    uint64_t file_size = static_cast<uint64_t>(end);
    if (file_size < HEADER_SIZE)
    {
        throw L2dbSyntaxError(
            "File too small to contain an l2db header: " +
            std::to_string(file_size) + " bytes");
    }

    HeaderBytes header = read_header();
    uint64_t available = file_size - HEADER_SIZE;
    index_len_ = std::min<uint64_t>(
        header_index_length(Slice(header.data(), header.size())), available);
    value_size_ = available - index_len_;
}

void
FileStorage::read_at(uint64_t position, uint8_t* out, uint64_t length)
{
    if (length == 0)
    {
        return;
    }
    auto& s = stream();
    s.clear();
    s.seekg(static_cast<std::streamoff>(position), std::ios::beg);
    s.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(length));
    if (s.gcount() != static_cast<std::streamsize>(length))
    {
        s.clear();
        throw L2dbIOError(
            "Short read of " + std::to_string(length) + " bytes at offset " +
            std::to_string(position) + " in " + describe());
    }
}

void
FileStorage::write_at(uint64_t position, const uint8_t* data, uint64_t length)
{
    if (length == 0)
    {
        return;
    }
    if (!writable_)
    {
        throw L2dbIOError("File was opened read-only: " + describe());
    }
    auto& s = stream();
    s.clear();
    s.seekp(static_cast<std::streamoff>(position), std::ios::beg);
    s.write(
        reinterpret_cast<const char*>(data),
        static_cast<std::streamsize>(length));
    if (!s)
    {
        s.clear();
        throw L2dbIOError(
            "Failed to write " + std::to_string(length) + " bytes at offset " +
            std::to_string(position) + " in " + describe());
    }
}

void
FileStorage::copy_within(
    uint64_t source,
    uint64_t destination,
    uint64_t length)
{
    if (length == 0 || source == destination)
    {
        return;
    }

    Bytes chunk(std::min(length, COPY_CHUNK_SIZE));
    if (destination < source)
    {
        // Moving towards the start: copy front to back
        for (uint64_t done = 0; done < length;)
        {
            uint64_t n = std::min(COPY_CHUNK_SIZE, length - done);
            read_at(source + done, chunk.data(), n);
            write_at(destination + done, chunk.data(), n);
            done += n;
        }
    }
    else
    {
        // Moving towards the end: copy back to front
        for (uint64_t left = length; left > 0;)
        {
            uint64_t n = std::min(COPY_CHUNK_SIZE, left);
            left -= n;
            read_at(source + left, chunk.data(), n);
            write_at(destination + left, chunk.data(), n);
        }
    }
}

void
FileStorage::shrink_file(uint64_t new_size)
{
    if (!owned_ || !path_)
    {
        // A borrowed stream cannot be truncated; the tail stays behind as
        // unreferenced bytes
        OLOGD(
            "Cannot truncate borrowed stream to ",
            new_size,
            " bytes, leaving tail in place");
        return;
    }

    owned_->flush();
    try
    {
        boost::filesystem::resize_file(*path_, new_size);
    }
    catch (const boost::filesystem::filesystem_error& e)
    {
        throw L2dbIOError("Failed to truncate file: " + std::string(e.what()));
    }
}

HeaderBytes
FileStorage::read_header()
{
    HeaderBytes header;
    read_at(0, header.data(), header.size());
    return header;
}

void
FileStorage::write_header(const HeaderBytes& header)
{
    write_at(0, header.data(), header.size());
}

uint64_t
FileStorage::index_size()
{
    return index_len_;
}

Bytes
FileStorage::read_index()
{
    Bytes index(index_len_);
    read_at(HEADER_SIZE, index.data(), index.size());
    return index;
}

void
FileStorage::write_index(const Bytes& index)
{
    uint64_t old_start = values_start();
    uint64_t new_start = HEADER_SIZE + index.size();

    if (new_start > old_start)
    {
        // Grow the file first so the shifted values have room
        uint64_t delta = new_start - old_start;
        Bytes zeros(std::min(delta, COPY_CHUNK_SIZE), 0);
        uint64_t end = old_start + value_size_;
        for (uint64_t done = 0; done < delta;)
        {
            uint64_t n = std::min<uint64_t>(zeros.size(), delta - done);
            write_at(end + done, zeros.data(), n);
            done += n;
        }
        copy_within(old_start, new_start, value_size_);
    }
    else if (new_start < old_start)
    {
        copy_within(old_start, new_start, value_size_);
        shrink_file(new_start + value_size_);
    }

    write_at(HEADER_SIZE, index.data(), index.size());
    index_len_ = index.size();
}

uint64_t
FileStorage::value_size()
{
    return value_size_;
}

Bytes
FileStorage::read_values(uint64_t offset, uint64_t length)
{
    if (offset > value_size_ || length > value_size_ - offset)
    {
        throw L2dbIOError(
            "Value range [" + std::to_string(offset) + ", " +
            std::to_string(offset + length) + ") is outside the value block of " +
            std::to_string(value_size_) + " bytes");
    }
    Bytes out(length);
    read_at(values_start() + offset, out.data(), length);
    return out;
}

void
FileStorage::write_values(uint64_t offset, Slice data)
{
    if (offset > value_size_)
    {
        throw L2dbIOError(
            "Write offset " + std::to_string(offset) +
            " is past the end of the value block");
    }
    write_at(values_start() + offset, data.data(), data.size());
    value_size_ = std::max<uint64_t>(value_size_, offset + data.size());
}

uint64_t
FileStorage::append_values(Slice data)
{
    uint64_t offset = value_size_;
    write_values(offset, data);
    return offset;
}

void
FileStorage::move_values(
    uint64_t source,
    uint64_t destination,
    uint64_t length)
{
    if (std::max(source, destination) > value_size_ ||
        length > value_size_ - std::max(source, destination))
    {
        throw L2dbIOError("Value move outside the value block");
    }
    copy_within(values_start() + source, values_start() + destination, length);
}

void
FileStorage::truncate_values(uint64_t size)
{
    if (size >= value_size_)
    {
        return;
    }
    shrink_file(values_start() + size);
    value_size_ = size;
}

void
FileStorage::sync()
{
    auto& s = stream();
    s.flush();
    if (!s)
    {
        s.clear();
        throw L2dbIOError("Failed to flush " + describe());
    }
}

void
FileStorage::flush_to(const boost::filesystem::path& target)
{
    bool same_file = false;
    try
    {
        same_file = path_ && boost::filesystem::exists(target) &&
            boost::filesystem::equivalent(target, *path_);
    }
    catch (const boost::filesystem::filesystem_error& e)
    {
        throw L2dbIOError("Filesystem error: " + std::string(e.what()));
    }

    if (same_file)
    {
        sync();
        return;
    }

    Bytes contents = image();
    Slice all(contents);
    write_image_file(
        target,
        all.subslice(0, HEADER_SIZE),
        all.subslice(HEADER_SIZE, index_len_),
        all.subslice(values_start(), value_size_));
}

void
FileStorage::retarget(const boost::filesystem::path& target)
{
    sync();
    auto reopened = std::make_unique<std::fstream>(
        target.string(), std::ios::in | std::ios::out | std::ios::binary);
    if (!reopened->is_open())
    {
        throw L2dbIOError("Failed to open file: " + target.string());
    }

    if (owned_)
    {
        owned_->close();
    }
    owned_ = std::move(reopened);
    borrowed_ = nullptr;
    path_ = target;
    writable_ = true;
    load_layout();
    OLOGI("Now writing to ", target.string());
}

Bytes
FileStorage::image()
{
    Bytes out(values_start() + value_size_);
    read_at(0, out.data(), out.size());
    return out;
}

std::optional<boost::filesystem::path>
FileStorage::location() const
{
    return path_;
}

std::string
FileStorage::describe() const
{
    return path_ ? "file '" + path_->string() + "'"
                 : std::string("borrowed stream");
}

}  // namespace l2db
