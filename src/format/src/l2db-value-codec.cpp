#include "l2db/format/l2db-value-codec.h"
#include "l2db/core/byte-order.h"
#include <bit>
#include <cmath>
#include <limits>
#include <type_traits>

namespace l2db {

using namespace l2db::core;

namespace {

Bytes
be_bytes(uint64_t bits, size_t width)
{
    Bytes out(width);
    put_uint_be(out.data(), bits, width);
    return out;
}

// Sign-extends a big-endian payload of up to 8 bytes
int64_t
sign_extend(Slice bytes)
{
    if (bytes.empty())
        return 0;
    size_t width = bytes.size();
    uint64_t bits = get_uint_be(bytes.data(), width);
    if (width < 8 && (bytes[0] & 0x80) != 0)
    {
        bits |= ~uint64_t{0} << (width * 8);
    }
    return static_cast<int64_t>(bits);
}

// The last 8 bytes of an over-long payload, the payload itself otherwise
Slice
low_bytes(Slice bytes)
{
    return bytes.size() > 8 ? bytes.subslice(bytes.size() - 8) : bytes;
}

DecodedValue
anomaly(Value value, std::string reason)
{
    return DecodedValue{std::move(value), true, std::move(reason)};
}

std::string
length_reason(TypeTag tag, size_t length)
{
    return "unsupported payload length " + std::to_string(length) +
        " for type '" + std::string(tag_code(tag)) + "'";
}

}  // namespace

Bytes
encode_int(int64_t value)
{
    if (value >= std::numeric_limits<int8_t>::min() &&
        value <= std::numeric_limits<int8_t>::max())
        return be_bytes(static_cast<uint64_t>(value), 1);
    if (value >= std::numeric_limits<int16_t>::min() &&
        value <= std::numeric_limits<int16_t>::max())
        return be_bytes(static_cast<uint64_t>(value), 2);
    if (value >= std::numeric_limits<int32_t>::min() &&
        value <= std::numeric_limits<int32_t>::max())
        return be_bytes(static_cast<uint64_t>(value), 4);
    return be_bytes(static_cast<uint64_t>(value), 8);
}

Bytes
encode_uint(uint64_t value)
{
    if (value < (uint64_t{1} << 8))
        return be_bytes(value, 1);
    if (value < (uint64_t{1} << 16))
        return be_bytes(value, 2);
    if (value < (uint64_t{1} << 32))
        return be_bytes(value, 4);
    return be_bytes(value, 8);
}

Bytes
encode_float(double value, bool& nan)
{
    nan = std::isnan(value);
    if (nan)
        return {};

    bool fits_single = std::isinf(value) ||
        (std::fabs(value) <= std::numeric_limits<float>::max() &&
         static_cast<double>(static_cast<float>(value)) == value);
    if (fits_single)
    {
        return be_bytes(std::bit_cast<uint32_t>(static_cast<float>(value)), 4);
    }
    return be_bytes(std::bit_cast<uint64_t>(value), 8);
}

EncodedValue
encode_value(const Value& value)
{
    EncodedValue out;
    out.tag = tag_of(value);
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>)
                out.bytes = {0x00};
            else if constexpr (std::is_same_v<T, bool>)
                out.bytes = {static_cast<uint8_t>(v ? 0x01 : 0x00)};
            else if constexpr (std::is_same_v<T, int64_t>)
                out.bytes = encode_int(v);
            else if constexpr (std::is_same_v<T, uint64_t>)
                out.bytes = encode_uint(v);
            else if constexpr (std::is_same_v<T, double>)
                out.bytes = encode_float(v, out.anomaly);
            else if constexpr (std::is_same_v<T, std::string>)
                out.bytes.assign(v.begin(), v.end());
            else
                out.bytes = v;
        },
        value);
    return out;
}

DecodedValue
decode_value(TypeTag tag, Slice bytes)
{
    switch (tag)
    {
        case TypeTag::RAW:
            return {bytes.to_bytes()};

        case TypeTag::STR:
            return {std::string(
                reinterpret_cast<const char*>(bytes.data()), bytes.size())};

        case TypeTag::INT: {
            size_t n = bytes.size();
            int64_t v = sign_extend(low_bytes(bytes));
            if (n == 1 || n == 2 || n == 4 || n == 8)
                return {v};
            return anomaly(v, length_reason(tag, n));
        }

        case TypeTag::UIN: {
            size_t n = bytes.size();
            Slice low = low_bytes(bytes);
            uint64_t v = get_uint_be(low.data(), low.size());
            if (n >= 1 && n <= 8)
                return {v};
            return anomaly(v, length_reason(tag, n));
        }

        case TypeTag::FLT:
            if (bytes.size() == 4)
                return {static_cast<double>(std::bit_cast<float>(
                    get_uint32_be(bytes.data())))};
            if (bytes.size() == 8)
                return {std::bit_cast<double>(get_uint64_be(bytes.data()))};
            return anomaly(
                std::numeric_limits<double>::quiet_NaN(),
                length_reason(tag, bytes.size()));

        case TypeTag::BOL:
            if (bytes.size() == 1 && bytes[0] <= 0x01)
                return {bytes[0] == 0x01};
            return anomaly(
                true,
                bytes.size() == 1
                    ? "invalid boolean byte " + slice_hex(bytes)
                    : length_reason(tag, bytes.size()));

        case TypeTag::NUL:
            if (bytes.size() == 1 && bytes[0] == 0x00)
                return {Null{}};
            return anomaly(
                Null{},
                bytes.size() == 1 ? "invalid null byte " + slice_hex(bytes)
                                  : length_reason(tag, bytes.size()));

        case TypeTag::INV:
            break;
    }
    return anomaly(bytes.to_bytes(), "payload tagged as invalid");
}

}  // namespace l2db
