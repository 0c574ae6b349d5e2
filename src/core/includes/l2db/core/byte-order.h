#pragma once

#include <cstddef>
#include <cstdint>

namespace l2db::core {

// Every multi-byte integer in an l2db file is big-endian. These helpers are
// platform-independent and never care about the host byte order.

inline void
put_uint16_be(uint8_t* buffer, uint16_t value)
{
    buffer[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buffer[1] = static_cast<uint8_t>(value & 0xFF);
}

/**
 * Write uint32_t to buffer in big-endian format
 * @param buffer Output buffer (must have at least 4 bytes available)
 * @param value Value to write
 */
inline void
put_uint32_be(uint8_t* buffer, uint32_t value)
{
    buffer[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    buffer[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    buffer[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    buffer[3] = static_cast<uint8_t>(value & 0xFF);
}

/**
 * Write uint64_t to buffer in big-endian format
 * @param buffer Output buffer (must have at least 8 bytes available)
 * @param value Value to write
 */
inline void
put_uint64_be(uint8_t* buffer, uint64_t value)
{
    for (int i = 7; i >= 0; --i)
    {
        buffer[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

inline uint16_t
get_uint16_be(const uint8_t* buffer)
{
    return static_cast<uint16_t>(
        (static_cast<uint16_t>(buffer[0]) << 8) | buffer[1]);
}

inline uint32_t
get_uint32_be(const uint8_t* buffer)
{
    return (static_cast<uint32_t>(buffer[0]) << 24) |
        (static_cast<uint32_t>(buffer[1]) << 16) |
        (static_cast<uint32_t>(buffer[2]) << 8) |
        static_cast<uint32_t>(buffer[3]);
}

inline uint64_t
get_uint64_be(const uint8_t* buffer)
{
    uint64_t result = 0;
    for (int i = 0; i < 8; ++i)
    {
        result = (result << 8) | buffer[i];
    }
    return result;
}

/**
 * Read an unsigned big-endian integer of arbitrary width (0-8 bytes),
 * zero-extended to 64 bits.
 */
inline uint64_t
get_uint_be(const uint8_t* buffer, size_t width)
{
    uint64_t result = 0;
    for (size_t i = 0; i < width; ++i)
    {
        result = (result << 8) | buffer[i];
    }
    return result;
}

/**
 * Write the low `width` bytes (0-8) of value in big-endian order.
 */
inline void
put_uint_be(uint8_t* buffer, uint64_t value, size_t width)
{
    for (size_t i = width; i > 0; --i)
    {
        buffer[i - 1] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

}  // namespace l2db::core
