#include "l2db/format/l2db-value-convert.h"
#include "l2db/format/l2db-errors.h"
#include "l2db/format/l2db-value-codec.h"
#include <charconv>
#include <cmath>
#include <limits>
#include <locale>
#include <sstream>
#include <type_traits>

namespace l2db {

namespace {

[[noreturn]] void
fail(TypeTag target, const Value& value, const std::string& why)
{
    throw L2dbTypeConversionError(
        target,
        "value of type '" + std::string(tag_code(tag_of(value))) + "' " + why);
}

// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF
bool
valid_utf8(const Bytes& bytes)
{
    size_t i = 0;
    while (i < bytes.size())
    {
        uint8_t lead = bytes[i];
        size_t count;
        uint32_t min;
        uint32_t cp;
        if (lead < 0x80)
        {
            ++i;
            continue;
        }
        else if ((lead & 0xE0) == 0xC0)
        {
            count = 1;
            min = 0x80;
            cp = lead & 0x1F;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            count = 2;
            min = 0x800;
            cp = lead & 0x0F;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            count = 3;
            min = 0x10000;
            cp = lead & 0x07;
        }
        else
        {
            return false;
        }

        if (bytes.size() - i <= count)
            return false;
        for (size_t k = 1; k <= count; ++k)
        {
            uint8_t next = bytes[i + k];
            if ((next & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (next & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += count + 1;
    }
    return true;
}

template <typename Int>
bool
parse_integer(const std::string& text, Int& out)
{
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end && begin != end;
}

bool
parse_double(const std::string& text, double& out)
{
    if (text.empty())
        return false;
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    iss >> out;
    return !iss.fail() && iss.eof();
}

// Floats truncate toward zero and must land inside the target range
template <typename Int>
Int
from_double(double v, TypeTag target, const Value& value)
{
    if (!std::isfinite(v))
        fail(target, value, "is not finite");
    double t = std::trunc(v);
    // 2^63 and 2^64 are exact in double; the upper bound is exclusive
    constexpr double upper = std::is_signed_v<Int> ? 9223372036854775808.0
                                                   : 18446744073709551616.0;
    constexpr double lower = std::is_signed_v<Int> ? -9223372036854775808.0 : 0.0;
    if (t < lower || t >= upper)
        fail(target, value, "is out of range");
    return static_cast<Int>(t);
}

Value
to_int(const Value& value)
{
    constexpr TypeTag target = TypeTag::INT;
    return std::visit(
        [&](const auto& v) -> Value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, int64_t>)
                return v;
            else if constexpr (std::is_same_v<T, uint64_t>)
            {
                if (v > static_cast<uint64_t>(
                            std::numeric_limits<int64_t>::max()))
                    fail(target, value, "is out of range");
                return static_cast<int64_t>(v);
            }
            else if constexpr (std::is_same_v<T, bool>)
                return int64_t{v ? 1 : 0};
            else if constexpr (std::is_same_v<T, double>)
                return from_double<int64_t>(v, target, value);
            else if constexpr (std::is_same_v<T, std::string>)
            {
                int64_t out = 0;
                if (!parse_integer(v, out))
                    fail(target, value, "is not a decimal integer");
                return out;
            }
            else
                fail(target, value, "has no integer form");
        },
        value);
}

Value
to_uint(const Value& value)
{
    constexpr TypeTag target = TypeTag::UIN;
    return std::visit(
        [&](const auto& v) -> Value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, uint64_t>)
                return v;
            else if constexpr (std::is_same_v<T, int64_t>)
            {
                if (v < 0)
                    fail(target, value, "is negative");
                return static_cast<uint64_t>(v);
            }
            else if constexpr (std::is_same_v<T, bool>)
                return uint64_t{v ? 1u : 0u};
            else if constexpr (std::is_same_v<T, double>)
                return from_double<uint64_t>(v, target, value);
            else if constexpr (std::is_same_v<T, std::string>)
            {
                uint64_t out = 0;
                if (v.starts_with('-') || !parse_integer(v, out))
                    fail(target, value, "is not an unsigned decimal integer");
                return out;
            }
            else
                fail(target, value, "has no unsigned integer form");
        },
        value);
}

Value
to_float(const Value& value)
{
    constexpr TypeTag target = TypeTag::FLT;
    return std::visit(
        [&](const auto& v) -> Value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>)
                return v;
            else if constexpr (
                std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>)
                return static_cast<double>(v);
            else if constexpr (std::is_same_v<T, bool>)
                return v ? 1.0 : 0.0;
            else if constexpr (std::is_same_v<T, std::string>)
            {
                double out = 0;
                if (!parse_double(v, out))
                    fail(target, value, "is not a number");
                return out;
            }
            else
                fail(target, value, "has no floating point form");
        },
        value);
}

Value
to_bool(const Value& value)
{
    constexpr TypeTag target = TypeTag::BOL;
    return std::visit(
        [&](const auto& v) -> Value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>)
                return v;
            else if constexpr (std::is_same_v<T, Null>)
                return false;
            else if constexpr (
                std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t> ||
                std::is_same_v<T, double>)
                return v != 0;
            else if constexpr (std::is_same_v<T, std::string>)
            {
                if (v == "true")
                    return true;
                if (v == "false")
                    return false;
                fail(target, value, "is neither 'true' nor 'false'");
            }
            else
                fail(target, value, "has no boolean form");
        },
        value);
}

Value
to_str(const Value& value)
{
    return std::visit(
        [&](const auto& v) -> Value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>)
                return v;
            else if constexpr (std::is_same_v<T, Bytes>)
            {
                if (!valid_utf8(v))
                    fail(TypeTag::STR, value, "is not valid UTF-8");
                return std::string(v.begin(), v.end());
            }
            else if constexpr (std::is_same_v<T, Null>)
                return std::string("null");
            else if constexpr (std::is_same_v<T, bool>)
                return std::string(v ? "true" : "false");
            else if constexpr (std::is_same_v<T, double>)
            {
                std::ostringstream oss;
                oss.imbue(std::locale::classic());
                oss.precision(17);
                oss << v;
                return oss.str();
            }
            else
                return std::to_string(v);
        },
        value);
}

Value
to_raw(const Value& value)
{
    if (const auto* text = std::get_if<std::string>(&value))
        return Bytes(text->begin(), text->end());
    EncodedValue encoded = encode_value(value);
    if (encoded.anomaly)
        fail(TypeTag::RAW, value, "has no binary encoding");
    return encoded.bytes;
}

}  // namespace

Value
convert_value(const Value& value, TypeTag target)
{
    switch (target)
    {
        case TypeTag::RAW:
            return to_raw(value);
        case TypeTag::STR:
            return to_str(value);
        case TypeTag::INT:
            return to_int(value);
        case TypeTag::UIN:
            return to_uint(value);
        case TypeTag::FLT:
            return to_float(value);
        case TypeTag::BOL:
            return to_bool(value);
        case TypeTag::NUL:
            if (std::holds_alternative<Null>(value))
                return value;
            fail(target, value, "is not null");
        case TypeTag::INV:
            break;
    }
    fail(target, value, "cannot be stored as invalid");
}

}  // namespace l2db
