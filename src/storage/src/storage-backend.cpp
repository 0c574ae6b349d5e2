#include "l2db/storage/storage-backend.h"
#include "l2db/core/logger.h"
#include "l2db/format/l2db-errors.h"
#include <boost/iostreams/device/mapped_file.hpp>
#include <fstream>

namespace l2db {

void
write_image_file(
    const boost::filesystem::path& target,
    Slice header,
    Slice index,
    Slice values)
{
    std::ofstream out(
        target.string(), std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out.is_open())
    {
        throw L2dbIOError("Failed to open output file: " + target.string());
    }

    for (const Slice& region : {header, index, values})
    {
        if (!region.empty())
        {
            out.write(
                reinterpret_cast<const char*>(region.data()),
                static_cast<std::streamsize>(region.size()));
        }
    }
    out.flush();

    if (!out.good())
    {
        throw L2dbIOError("Failed to write database to " + target.string());
    }

    LOGD(
        "Wrote ",
        header.size() + index.size() + values.size(),
        " bytes to ",
        target.string());
}

Bytes
load_file(const boost::filesystem::path& path)
{
    try
    {
        if (!boost::filesystem::exists(path))
        {
            throw L2dbIOError("File does not exist: " + path.string());
        }

        boost::uintmax_t file_size = boost::filesystem::file_size(path);
        if (file_size == 0)
        {
            // An empty file cannot be mapped
            return {};
        }

        boost::iostreams::mapped_file_source mapping(path.string());
        if (!mapping.is_open())
        {
            throw L2dbIOError("Failed to memory map file: " + path.string());
        }

        const auto* data = reinterpret_cast<const uint8_t*>(mapping.data());
        Bytes contents(data, data + mapping.size());
        mapping.close();
        return contents;
    }
    catch (const boost::filesystem::filesystem_error& e)
    {
        throw L2dbIOError("Filesystem error: " + std::string(e.what()));
    }
    catch (const std::ios_base::failure& e)
    {
        throw L2dbIOError("I/O error: " + std::string(e.what()));
    }
}

}  // namespace l2db
