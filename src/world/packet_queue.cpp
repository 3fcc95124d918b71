#include "packet_queue.hpp"
#include <utility>

namespace strata::world {

void PacketBroadcastQueue::enqueue(int32_t chunk_x, int32_t chunk_z, protocol::PacketData message) {
    batches_[chunk_hash(chunk_x, chunk_z)].push_back(std::move(message));
}

void PacketBroadcastQueue::enqueue(int32_t chunk_x, int32_t chunk_z,
                                   std::span<const protocol::PacketData> messages) {
    if (messages.empty()) {
        return;
    }
    auto& batch = batches_[chunk_hash(chunk_x, chunk_z)];
    batch.insert(batch.end(), messages.begin(), messages.end());
}

void PacketBroadcastQueue::enqueue(int32_t chunk_x, int32_t chunk_z,
                                   std::initializer_list<protocol::PacketData> messages) {
    enqueue(chunk_x, chunk_z, std::span<const protocol::PacketData>(messages.begin(), messages.size()));
}

ChunkBatches PacketBroadcastQueue::drain_all() {
    return std::exchange(batches_, {});
}

size_t PacketBroadcastQueue::pending_messages() const {
    size_t total = 0;
    for (const auto& [hash, batch] : batches_) {
        total += batch.size();
    }
    return total;
}

const protocol::PacketData* ChunkPacketCache::find(int32_t chunk_x, int32_t chunk_z) const {
    auto it = packets_.find(chunk_hash(chunk_x, chunk_z));
    if (it != packets_.end()) {
        return &it->second;
    }
    return nullptr;
}

const protocol::PacketData& ChunkPacketCache::store(int32_t chunk_x, int32_t chunk_z,
                                                    protocol::PacketData packet) {
    auto& slot = packets_[chunk_hash(chunk_x, chunk_z)];
    slot = std::move(packet);
    return slot;
}

void ChunkPacketCache::invalidate(int32_t chunk_x, int32_t chunk_z) {
    packets_.erase(chunk_hash(chunk_x, chunk_z));
}

bool ChunkPacketCache::contains(int32_t chunk_x, int32_t chunk_z) const {
    return packets_.find(chunk_hash(chunk_x, chunk_z)) != packets_.end();
}

} // namespace strata::world
