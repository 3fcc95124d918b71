#include "chunk.hpp"
#include <algorithm>
#include <utility>

namespace strata::world {

Chunk::Chunk(int32_t x, int32_t z, std::vector<uint8_t> payload)
    : x_(x)
    , z_(z)
    , payload_(std::move(payload)) {
}

void Chunk::add_entity(entt::entity entity) {
    if (!has_entity(entity)) {
        entities_.push_back(entity);
    }
}

void Chunk::remove_entity(entt::entity entity) {
    auto it = std::find(entities_.begin(), entities_.end(), entity);
    if (it != entities_.end()) {
        entities_.erase(it);
    }
}

bool Chunk::has_entity(entt::entity entity) const {
    return std::find(entities_.begin(), entities_.end(), entity) != entities_.end();
}

uint32_t Chunk::local_index(int32_t local_x, int32_t y, int32_t local_z) {
    return (static_cast<uint32_t>(y & 0xFFFFFF) << 8) |
           (static_cast<uint32_t>(local_z & 0x0F) << 4) |
           static_cast<uint32_t>(local_x & 0x0F);
}

void Chunk::add_tile(entt::entity tile, int32_t local_x, int32_t y, int32_t local_z) {
    tiles_[local_index(local_x, y, local_z)] = tile;
}

void Chunk::remove_tile(int32_t local_x, int32_t y, int32_t local_z) {
    tiles_.erase(local_index(local_x, y, local_z));
}

entt::entity Chunk::get_tile(int32_t local_x, int32_t y, int32_t local_z) const {
    auto it = tiles_.find(local_index(local_x, y, local_z));
    if (it != tiles_.end()) {
        return it->second;
    }
    return entt::null;
}

std::vector<entt::entity> Chunk::tiles() const {
    std::vector<entt::entity> result;
    result.reserve(tiles_.size());
    for (const auto& [index, tile] : tiles_) {
        result.push_back(tile);
    }
    return result;
}

} // namespace strata::world
