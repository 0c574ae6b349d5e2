#include "l2db/format/l2db-value.h"
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace l2db {

TypeTag
tag_of(const Value& value)
{
    struct Visitor
    {
        TypeTag
        operator()(const Null&) const
        {
            return TypeTag::NUL;
        }
        TypeTag
        operator()(bool) const
        {
            return TypeTag::BOL;
        }
        TypeTag
        operator()(int64_t) const
        {
            return TypeTag::INT;
        }
        TypeTag
        operator()(uint64_t) const
        {
            return TypeTag::UIN;
        }
        TypeTag
        operator()(double) const
        {
            return TypeTag::FLT;
        }
        TypeTag
        operator()(const std::string&) const
        {
            return TypeTag::STR;
        }
        TypeTag
        operator()(const Bytes&) const
        {
            return TypeTag::RAW;
        }
    };
    return std::visit(Visitor{}, value);
}

std::string
to_display_string(const Value& value)
{
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>)
                oss << "null";
            else if constexpr (std::is_same_v<T, bool>)
                oss << (v ? "true" : "false");
            else if constexpr (std::is_same_v<T, double>)
                oss << std::setprecision(17) << v;
            else if constexpr (std::is_same_v<T, std::string>)
                oss << std::quoted(v);
            else if constexpr (std::is_same_v<T, Bytes>)
                oss << "0x" << slice_hex(Slice(v));
            else
                oss << v;
        },
        value);
    return oss.str();
}

}  // namespace l2db
