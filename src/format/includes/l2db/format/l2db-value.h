#pragma once

#include "l2db/core/types.h"
#include "l2db/format/l2db-type-tag.h"
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace l2db {

// The null value; stored as a single 0x00 byte
struct Null
{
    bool
    operator==(const Null&) const = default;
};

/**
 * A typed value as stored in the database
 *
 * Alternatives map one-to-one onto the decodable type tags: Null -> nul,
 * bool -> bol, int64_t -> int, uint64_t -> uin, double -> flt,
 * std::string -> str, Bytes -> raw.
 */
using Value =
    std::variant<Null, bool, int64_t, uint64_t, double, std::string, Bytes>;

using ValueMap = std::map<std::string, Value>;

// The tag a value is stored under when no explicit type is requested
TypeTag
tag_of(const Value& value);

// Human-readable rendering: raw values in hex, strings quoted
std::string
to_display_string(const Value& value);

}  // namespace l2db
