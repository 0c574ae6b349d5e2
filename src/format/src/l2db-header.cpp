#include "l2db/format/l2db-header.h"
#include "l2db/core/byte-order.h"
#include "l2db/core/logger.h"
#include "l2db/format/l2db-errors.h"
#include <algorithm>
#include <cstring>

namespace l2db {

using namespace l2db::core;

HeaderBytes
encode_header(const Header& header)
{
    HeaderBytes out{};
    std::copy(L2DB_MAGIC.begin(), L2DB_MAGIC.end(), out.begin());
    put_uint16_be(&out[HEADER_VERSION_OFFSET], header.version.major);
    put_uint16_be(&out[HEADER_VERSION_OFFSET + 2], header.version.minor);
    put_uint16_be(&out[HEADER_VERSION_OFFSET + 4], header.version.patch);
    put_uint32_be(&out[HEADER_INDEX_LEN_OFFSET], header.index_len);
    out[HEADER_FLAGS_OFFSET] = header.flags;
    return out;
}

bool
has_magic(Slice bytes)
{
    return bytes.size() >= L2DB_MAGIC.size() &&
        std::memcmp(bytes.data(), L2DB_MAGIC.data(), L2DB_MAGIC.size()) == 0;
}

uint32_t
header_index_length(Slice bytes)
{
    return get_uint32_be(bytes.data() + HEADER_INDEX_LEN_OFFSET);
}

Header
decode_header(Slice bytes, bool strict)
{
    if (bytes.size() < HEADER_SIZE)
    {
        throw L2dbSyntaxError(
            "Buffer too small to contain an l2db header: " +
            std::to_string(bytes.size()) + " bytes");
    }

    if (!has_magic(bytes))
    {
        if (strict)
        {
            throw L2dbSyntaxError(
                "The magic bytes are incorrect: " +
                slice_hex(bytes.subslice(0, L2DB_MAGIC.size())) +
                " (expected " + slice_hex(Slice(L2DB_MAGIC.data(), 8)) + ")");
        }
        LOGW("Ignoring incorrect magic bytes in non-strict mode");
    }

    Header header;
    const uint8_t* p = bytes.data();
    header.version.major = get_uint16_be(p + HEADER_VERSION_OFFSET);
    header.version.minor = get_uint16_be(p + HEADER_VERSION_OFFSET + 2);
    header.version.patch = get_uint16_be(p + HEADER_VERSION_OFFSET + 4);
    header.index_len = get_uint32_be(p + HEADER_INDEX_LEN_OFFSET);
    header.flags = p[HEADER_FLAGS_OFFSET];

    if (header.version.major != SUPPORTED_MAJOR_VERSION)
    {
        throw L2dbVersionMismatchError(ENGINE_FORMAT_VERSION, header.version);
    }

    if ((header.flags & ~FLAG_KNOWN_MASK) != 0)
    {
        LOGD(
            "Header carries unknown flag bits: ",
            static_cast<int>(header.flags & ~FLAG_KNOWN_MASK));
    }

    return header;
}

}  // namespace l2db
