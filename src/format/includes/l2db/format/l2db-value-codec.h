#pragma once

#include "l2db/core/types.h"
#include "l2db/format/l2db-type-tag.h"
#include "l2db/format/l2db-value.h"
#include <cstdint>
#include <string>

namespace l2db {

/**
 * Result of encoding a value
 *
 * `anomaly` is set when the value has no valid encoding (a NaN float); the
 * bytes are then the zero-length marker and the caller is expected to record
 * the anomaly.
 */
struct EncodedValue
{
    TypeTag tag = TypeTag::RAW;
    Bytes bytes;
    bool anomaly = false;
};

/**
 * Result of decoding a stored payload
 *
 * Decoding never throws on malformed payloads. `value` is always a usable
 * best-effort result; `anomaly` and `reason` describe what was wrong with the
 * stored bytes.
 */
struct DecodedValue
{
    Value value;
    bool anomaly = false;
    std::string reason;
};

// Smallest big-endian two's complement encoding out of 1, 2, 4 or 8 bytes
Bytes
encode_int(int64_t value);

// Smallest big-endian encoding out of 1, 2, 4 or 8 bytes
Bytes
encode_uint(uint64_t value);

/**
 * Single precision (4 bytes) when the value survives the round trip through
 * float exactly, otherwise double precision (8 bytes). NaN produces an empty
 * buffer and sets `nan`.
 */
Bytes
encode_float(double value, bool& nan);

EncodedValue
encode_value(const Value& value);

DecodedValue
decode_value(TypeTag tag, Slice bytes);

}  // namespace l2db
