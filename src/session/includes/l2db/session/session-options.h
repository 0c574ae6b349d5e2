#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace l2db {

/**
 * Access mode of a session, as a bitmask
 *
 * READ allows read/dump, WRITE allows every mutation, UNBUFFERED makes a
 * file-backed session go to the file on every operation instead of loading
 * the whole database into memory.
 */
enum class OpenMode : uint8_t {
    NONE = 0,
    READ = 0x01,
    WRITE = 0x02,
    UNBUFFERED = 0x04
};

inline constexpr OpenMode
operator|(OpenMode a, OpenMode b)
{
    return static_cast<OpenMode>(
        static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline constexpr OpenMode
operator&(OpenMode a, OpenMode b)
{
    return static_cast<OpenMode>(
        static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline constexpr bool
has_mode(OpenMode mode, OpenMode bit)
{
    return (mode & bit) != OpenMode::NONE;
}

/**
 * Parse the letter form of a mode: any combination of 'r', 'w' and 'u'
 *
 * @throws L2dbError for an unknown letter
 */
OpenMode
parse_open_mode(std::string_view letters);

// Letter form of a mode, in "rwu" order
std::string
to_string(OpenMode mode);

/**
 * Configuration options for a Session
 */
struct SessionOptions
{
    /** Allowed operations and buffering */
    OpenMode mode = OpenMode::READ | OpenMode::WRITE;

    /** Header flags for a freshly created database (e.g. FLAG_WIDE_INDEX) */
    uint8_t flags = 0;

    /** Treat magic and index length mismatches as fatal */
    bool strict = true;

    /** Create a missing file when opening a path for writing */
    bool create_if_missing = true;

    /** Persist pending changes when the session is closed */
    bool flush_on_close = true;
};

}  // namespace l2db
