#pragma once

#include <cstdint>

namespace strata::world {

// Packed (chunkX, chunkZ) key shared by every chunk-scoped map in a dimension
using ChunkHash = int64_t;

constexpr ChunkHash chunk_hash(int32_t x, int32_t z) {
    return static_cast<ChunkHash>((static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) |
                                  static_cast<uint64_t>(static_cast<uint32_t>(z)));
}

constexpr int32_t chunk_hash_x(ChunkHash hash) {
    return static_cast<int32_t>(static_cast<uint32_t>(static_cast<uint64_t>(hash) >> 32));
}

constexpr int32_t chunk_hash_z(ChunkHash hash) {
    return static_cast<int32_t>(static_cast<uint32_t>(static_cast<uint64_t>(hash) & 0xFFFFFFFFu));
}

// Block coordinate -> chunk coordinate (16x16 columns)
constexpr int32_t block_to_chunk(int32_t block) { return block >> 4; }

} // namespace strata::world
