#pragma once

#include "l2db/core/byte-order.h"
#include "l2db/core/types.h"
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace l2db::core {

class SliceCursorError : public std::runtime_error
{
public:
    explicit SliceCursorError(const std::string& msg)
        : std::runtime_error("SliceCursor: " + msg)
    {
    }
};

// Bounds-checked forward cursor over a Slice
struct SliceCursor
{
    Slice data;
    size_t pos = 0;

    bool
    empty() const
    {
        return pos >= data.size();
    }
    size_t
    remaining_size() const
    {
        return pos >= data.size() ? 0 : data.size() - pos;
    }
    Slice
    remaining() const
    {
        return data.subslice(pos);
    }

    uint8_t
    read_u8()
    {
        if (pos >= data.size())
        {
            throw SliceCursorError("read_u8 past end of data");
        }
        return data.data()[pos++];
    }

    uint32_t
    read_uint32_be()
    {
        if (remaining_size() < 4)
        {
            throw SliceCursorError("read_uint32_be past end of data");
        }
        uint32_t result = get_uint32_be(data.data() + pos);
        pos += 4;
        return result;
    }

    uint64_t
    read_uint64_be()
    {
        if (remaining_size() < 8)
        {
            throw SliceCursorError("read_uint64_be past end of data");
        }
        uint64_t result = get_uint64_be(data.data() + pos);
        pos += 8;
        return result;
    }

    Slice
    read_slice(size_t n)
    {
        if (remaining_size() < n)
        {
            throw SliceCursorError(
                "attempted to read " + std::to_string(n) + " bytes, only " +
                std::to_string(remaining_size()) + " available");
        }
        Slice result(data.data() + pos, n);
        pos += n;
        return result;
    }

    // Reads up to (not including) the next 0x00 and consumes the terminator.
    // Throws when no terminator remains.
    Slice
    read_until_nul()
    {
        if (empty())
        {
            throw SliceCursorError("read_until_nul past end of data");
        }
        const uint8_t* start = data.data() + pos;
        const void* nul = std::memchr(start, 0, remaining_size());
        if (nul == nullptr)
        {
            throw SliceCursorError("unterminated name at offset " +
                                   std::to_string(pos));
        }
        size_t length = static_cast<const uint8_t*>(nul) - start;
        pos += length + 1;
        return Slice(start, length);
    }
};

}  // namespace l2db::core
