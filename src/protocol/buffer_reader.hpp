#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <vector>

namespace strata::protocol {

// Bounds-checked reader over a byte span
class BufferReader {
    std::span<const uint8_t> data_;
    size_t offset_ = 0;

    void check_bounds(size_t n) const {
        if (offset_ + n > data_.size()) {
            throw std::out_of_range("BufferReader: read past end of buffer");
        }
    }

public:
    BufferReader(std::span<const uint8_t> data) : data_(data) {}

    template<typename T>
    T read() {
        check_bounds(sizeof(T));
        T val;
        std::memcpy(&val, data_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return val;
    }

    std::vector<uint8_t> read_blob() {
        uint32_t len = read<uint32_t>();
        check_bounds(len);
        auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset_);
        std::vector<uint8_t> bytes(first, first + len);
        offset_ += len;
        return bytes;
    }

    size_t offset() const { return offset_; }
    size_t remaining_size() const { return data_.size() - offset_; }
    std::span<const uint8_t> remaining() const { return data_.subspan(offset_); }
};

} // namespace strata::protocol
