#pragma once

#include "chunk_hash.hpp"
#include "protocol/packet.hpp"
#include <initializer_list>
#include <span>
#include <unordered_map>
#include <vector>

namespace strata::world {

using ChunkBatches = std::unordered_map<ChunkHash, std::vector<protocol::PacketData>>;

// Outbound messages waiting for the next flush, batched per chunk in arrival order.
// Unbounded; the transport is expected to drain once per tick.
class PacketBroadcastQueue {
public:
    void enqueue(int32_t chunk_x, int32_t chunk_z, protocol::PacketData message);
    void enqueue(int32_t chunk_x, int32_t chunk_z, std::span<const protocol::PacketData> messages);
    void enqueue(int32_t chunk_x, int32_t chunk_z, std::initializer_list<protocol::PacketData> messages);

    // Returns every batch and leaves the queue empty
    ChunkBatches drain_all();

    bool empty() const { return batches_.empty(); }
    size_t pending_chunks() const { return batches_.size(); }
    size_t pending_messages() const;

private:
    ChunkBatches batches_;
};

// Last compiled full-chunk packet per chunk. An entry only exists while nothing
// in that chunk changed since it was compiled.
class ChunkPacketCache {
public:
    const protocol::PacketData* find(int32_t chunk_x, int32_t chunk_z) const;
    const protocol::PacketData& store(int32_t chunk_x, int32_t chunk_z, protocol::PacketData packet);
    void invalidate(int32_t chunk_x, int32_t chunk_z);
    bool contains(int32_t chunk_x, int32_t chunk_z) const;
    void clear() { packets_.clear(); }
    size_t size() const { return packets_.size(); }

private:
    std::unordered_map<ChunkHash, protocol::PacketData> packets_;
};

} // namespace strata::world
