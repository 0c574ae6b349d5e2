#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace l2db {

using Bytes = std::vector<uint8_t>;

/**
 * Zero-copy reference to a data buffer.
 * Used to hand index and value regions around without copying them.
 */
class Slice
{
private:
    const uint8_t* data_;
    size_t size_;

public:
    Slice() : data_(nullptr), size_(0)
    {
    }
    Slice(const uint8_t* data, size_t size) : data_(data), size_(size)
    {
    }
    Slice(const Bytes& bytes) : data_(bytes.data()), size_(bytes.size())
    {
    }

    const uint8_t*
    data() const
    {
        return data_;
    }
    size_t
    size() const
    {
        return size_;
    }
    bool
    empty() const
    {
        return size_ == 0;
    }

    uint8_t
    operator[](size_t i) const
    {
        return data_[i];
    }

    // Sub-range [offset, offset + length), clamped to the slice bounds
    Slice
    subslice(size_t offset, size_t length = std::string_view::npos) const
    {
        if (offset >= size_)
            return Slice(data_ + size_, 0);
        size_t available = size_ - offset;
        return Slice(data_ + offset, length < available ? length : available);
    }

    Bytes
    to_bytes() const
    {
        return Bytes(data_, data_ + size_);
    }
};

/**
 * Utility function to convert a data slice to hexadecimal representation
 */
void
slice_hex(Slice sl, std::string& result);

inline std::string
slice_hex(Slice sl)
{
    std::string result;
    slice_hex(sl, result);
    return result;
}

}  // namespace l2db
