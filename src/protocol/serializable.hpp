#pragma once

#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include <cstdint>
#include <span>

namespace strata::protocol {

// CRTP base for protocol messages.
// Derived must implement:
//   size_t serialized_size() const  (or static constexpr)
//   void serialize_impl(BufferWriter& w) const
//   void deserialize_impl(BufferReader& r)
template<typename Derived>
struct Serializable {
    void serialize(BufferWriter& w) const {
        static_cast<const Derived*>(this)->serialize_impl(w);
    }

    void deserialize(std::span<const uint8_t> data) {
        BufferReader r(data);
        static_cast<Derived*>(this)->deserialize_impl(r);
    }

    void deserialize(BufferReader& r) {
        static_cast<Derived*>(this)->deserialize_impl(r);
    }
};

} // namespace strata::protocol
