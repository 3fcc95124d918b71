#pragma once

#include "chunk_hash.hpp"
#include <entt/entity/entity.hpp>
#include <entt/entity/fwd.hpp>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace strata::world {

// One resident 16xHx16 column. Terrain is carried as an opaque payload owned by
// the ChunkStore; the dimension only tracks which entities and tiles live here.
class Chunk {
public:
    Chunk(int32_t x, int32_t z, std::vector<uint8_t> payload = {});

    int32_t x() const { return x_; }
    int32_t z() const { return z_; }
    ChunkHash hash() const { return chunk_hash(x_, z_); }

    const std::vector<uint8_t>& payload() const { return payload_; }
    void set_payload(std::vector<uint8_t> payload) { payload_ = std::move(payload); }

    // Entities, in insertion order
    void add_entity(entt::entity entity);
    void remove_entity(entt::entity entity);
    bool has_entity(entt::entity entity) const;
    const std::vector<entt::entity>& entities() const { return entities_; }

    // Tiles keyed by position local to the chunk (x & 0xF, y, z & 0xF)
    void add_tile(entt::entity tile, int32_t local_x, int32_t y, int32_t local_z);
    void remove_tile(int32_t local_x, int32_t y, int32_t local_z);
    entt::entity get_tile(int32_t local_x, int32_t y, int32_t local_z) const;
    std::vector<entt::entity> tiles() const;
    size_t tile_count() const { return tiles_.size(); }

private:
    static uint32_t local_index(int32_t local_x, int32_t y, int32_t local_z);

    int32_t x_;
    int32_t z_;
    std::vector<uint8_t> payload_;
    std::vector<entt::entity> entities_;
    std::unordered_map<uint32_t, entt::entity> tiles_;
};

} // namespace strata::world
