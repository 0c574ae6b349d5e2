#include "l2db/core/types.h"

namespace l2db {

void
slice_hex(Slice sl, std::string& result)
{
    static constexpr char hex_chars[] = "0123456789ABCDEF";
    result.reserve(result.size() + sl.size() * 2);
    for (size_t i = 0; i < sl.size(); ++i)
    {
        uint8_t byte = sl.data()[i];
        result.push_back(hex_chars[(byte >> 4) & 0xF]);
        result.push_back(hex_chars[byte & 0xF]);
    }
}

}  // namespace l2db
