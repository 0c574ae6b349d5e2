#pragma once

#include "l2db/core/types.h"
#include "l2db/format/l2db-structs.h"
#include <cstdint>

namespace l2db {

/**
 * Encode a header into its 64-byte on-disk form
 *
 * Writes the magic, the three version components and the index length
 * big-endian, the flag byte, then zero padding.
 */
HeaderBytes
encode_header(const Header& header);

/**
 * Decode and validate the first 64 bytes of `bytes`
 *
 * @param bytes Buffer starting at file offset 0 (may be longer than 64 bytes)
 * @param strict Whether a magic mismatch is fatal
 * @return The decoded header
 * @throws L2dbSyntaxError if the buffer is shorter than a header, or the
 * magic does not match under strict decoding
 * @throws L2dbVersionMismatchError if the major version is not
 * SUPPORTED_MAJOR_VERSION
 */
Header
decode_header(Slice bytes, bool strict = true);

// True when the buffer starts with the l2db magic
bool
has_magic(Slice bytes);

// Reads only the index length field; the caller guarantees 64 bytes
uint32_t
header_index_length(Slice bytes);

}  // namespace l2db
