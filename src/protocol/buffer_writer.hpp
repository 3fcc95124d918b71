#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <vector>

namespace strata::protocol {

// Buffer writer with two modes:
//   BufferWriter(span) - fixed buffer, bounds-checked, no allocations
//   BufferWriter(vec)  - append mode, grows the vector on each write
class BufferWriter {
    uint8_t* data_ = nullptr;
    size_t capacity_ = 0;
    size_t offset_ = 0;
    std::vector<uint8_t>* vec_ = nullptr;  // null for span mode

    void ensure(size_t n) {
        if (vec_) {
            if (vec_->size() < offset_ + n) {
                vec_->resize(offset_ + n);
            }
            data_ = vec_->data();
            capacity_ = vec_->size();
        } else if (offset_ + n > capacity_) {
            throw std::out_of_range("BufferWriter: write past end of buffer");
        }
    }

public:
    explicit BufferWriter(std::span<uint8_t> buf)
        : data_(buf.data()), capacity_(buf.size()) {}

    explicit BufferWriter(std::vector<uint8_t>& buf)
        : data_(buf.data()), capacity_(buf.size()), offset_(buf.size()), vec_(&buf) {}

    template<typename T>
    void write(const T& val) {
        ensure(sizeof(T));
        std::memcpy(data_ + offset_, &val, sizeof(T));
        offset_ += sizeof(T);
    }

    void write_bytes(std::span<const uint8_t> bytes) {
        if (bytes.empty()) return;
        ensure(bytes.size());
        std::memcpy(data_ + offset_, bytes.data(), bytes.size());
        offset_ += bytes.size();
    }

    // uint32_t length prefix followed by the raw bytes
    void write_blob(std::span<const uint8_t> bytes) {
        write<uint32_t>(static_cast<uint32_t>(bytes.size()));
        write_bytes(bytes);
    }

    size_t offset() const { return offset_; }
};

} // namespace strata::protocol
