#include "l2db/format/l2db-type-tag.h"
#include <array>
#include <cstring>

namespace l2db {

namespace {
struct TagCode
{
    TypeTag tag;
    const char* code;
};

constexpr std::array<TagCode, 8> TAG_CODES = {{
    {TypeTag::RAW, "raw"},
    {TypeTag::STR, "str"},
    {TypeTag::INT, "int"},
    {TypeTag::UIN, "uin"},
    {TypeTag::FLT, "flt"},
    {TypeTag::BOL, "bol"},
    {TypeTag::NUL, "nul"},
    {TypeTag::INV, "inv"},
}};
}  // namespace

std::string_view
tag_code(TypeTag tag)
{
    for (const auto& entry : TAG_CODES)
    {
        if (entry.tag == tag)
            return std::string_view(entry.code, TYPE_TAG_SIZE);
    }
    return "inv";
}

std::optional<TypeTag>
parse_tag(const uint8_t* code)
{
    for (const auto& entry : TAG_CODES)
    {
        if (std::memcmp(entry.code, code, TYPE_TAG_SIZE) == 0)
            return entry.tag;
    }
    return std::nullopt;
}

std::optional<TypeTag>
parse_tag(std::string_view code)
{
    if (code.size() != TYPE_TAG_SIZE)
        return std::nullopt;
    return parse_tag(reinterpret_cast<const uint8_t*>(code.data()));
}

}  // namespace l2db
