#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace l2db {

// Size of the fixed header that precedes the index block
static constexpr size_t HEADER_SIZE = 64;

// "\x88L2DB\0\0\0"
static constexpr std::array<uint8_t, 8> L2DB_MAGIC =
    {0x88, 'L', '2', 'D', 'B', 0x00, 0x00, 0x00};

// Header field offsets
static constexpr size_t HEADER_MAGIC_OFFSET = 0;
static constexpr size_t HEADER_VERSION_OFFSET = 8;
static constexpr size_t HEADER_INDEX_LEN_OFFSET = 14;
static constexpr size_t HEADER_FLAGS_OFFSET = 18;

// Header flag bits
static constexpr uint8_t FLAG_WIDE_INDEX = 0x01;
static constexpr uint8_t FLAG_DIRTY = 0x02;
static constexpr uint8_t FLAG_LOCKED = 0x04;
static constexpr uint8_t FLAG_KNOWN_MASK =
    FLAG_WIDE_INDEX | FLAG_DIRTY | FLAG_LOCKED;

struct FormatVersion
{
    uint16_t major = 0;
    uint16_t minor = 0;
    uint16_t patch = 0;

    bool
    operator==(const FormatVersion&) const = default;

    std::string
    to_string() const
    {
        return std::to_string(major) + "." + std::to_string(minor) + "." +
            std::to_string(patch);
    }
};

// Version of the file layout this engine writes
static constexpr FormatVersion ENGINE_FORMAT_VERSION{1, 0, 0};
static constexpr uint16_t SUPPORTED_MAJOR_VERSION = ENGINE_FORMAT_VERSION.major;

/**
 * Decoded form of the 64-byte header
 *
 * On disk: magic (8), version major/minor/patch (3 x u16 BE), index length
 * (u32 BE), flags (u8), zero padding up to 64 bytes.
 */
struct Header
{
    FormatVersion version = ENGINE_FORMAT_VERSION;
    uint32_t index_len = 0;
    uint8_t flags = 0;

    bool
    wide_index() const
    {
        return (flags & FLAG_WIDE_INDEX) != 0;
    }
    bool
    dirty() const
    {
        return (flags & FLAG_DIRTY) != 0;
    }
    bool
    locked() const
    {
        return (flags & FLAG_LOCKED) != 0;
    }

    void
    set_flag(uint8_t flag, bool on)
    {
        if (on)
            flags |= flag;
        else
            flags &= static_cast<uint8_t>(~flag);
    }

    bool
    operator==(const Header&) const = default;
};

using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

}  // namespace l2db
