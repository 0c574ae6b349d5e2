#pragma once

#include "l2db/core/types.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace l2db {

// Width of the ASCII type code stored after the offsets of every entry
static constexpr size_t TYPE_TAG_SIZE = 3;

/**
 * How the payload of an index entry is to be decoded.
 *
 * INV marks a payload that must not be decoded; it is still a recognized tag
 * so that the index stays scannable.
 */
enum class TypeTag : uint8_t { RAW, STR, INT, UIN, FLT, BOL, NUL, INV };

// Three-letter wire code ("raw", "str", ...)
std::string_view
tag_code(TypeTag tag);

// Parses the three bytes at `code`; nullopt for anything unrecognized
std::optional<TypeTag>
parse_tag(const uint8_t* code);

std::optional<TypeTag>
parse_tag(std::string_view code);

}  // namespace l2db
