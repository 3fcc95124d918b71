#pragma once

#include "serializable.hpp"
#include <cstdint>
#include <vector>

namespace strata::protocol {

// Server -> Client: full column of chunk data, opaque to the protocol layer
struct FullChunkDataMsg : Serializable<FullChunkDataMsg> {
    int32_t chunk_x = 0;
    int32_t chunk_z = 0;
    std::vector<uint8_t> payload;

    size_t serialized_size() const {
        return sizeof(int32_t) * 2 + sizeof(uint32_t) + payload.size();
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(chunk_x);
        w.write(chunk_z);
        w.write_blob(payload);
    }

    void deserialize_impl(BufferReader& r) {
        chunk_x = r.read<int32_t>();
        chunk_z = r.read<int32_t>();
        payload = r.read_blob();
    }
};

// Server -> Client: single block changed inside a chunk
struct BlockUpdateMsg : Serializable<BlockUpdateMsg> {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;
    uint16_t block_id = 0;

    static constexpr size_t serialized_size() { return sizeof(int32_t) * 3 + sizeof(uint16_t); }

    void serialize_impl(BufferWriter& w) const {
        w.write(x); w.write(y); w.write(z);
        w.write(block_id);
    }

    void deserialize_impl(BufferReader& r) {
        x = r.read<int32_t>();
        y = r.read<int32_t>();
        z = r.read<int32_t>();
        block_id = r.read<uint16_t>();
    }
};

} // namespace strata::protocol
