#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>

namespace strata::world::ecs {

// Coordinate system: Y-up. x,z form the horizontal plane chunks are keyed on
struct Transform {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float yaw = 0.0f;
};

struct NetworkId {
    uint32_t id = 0;
};

enum class EntityKind : uint8_t {
    Player = 0,
    Mob = 1,
    Item = 2,
    Projectile = 3,
    Other = 4,
};

// kind == Player is the only thing that makes an entity a player
struct EntityInfo {
    EntityKind kind = EntityKind::Other;
    std::string name;
};

struct SleepState {
    bool sleeping = false;
};

// Chunks the client of this player currently has loaded
struct ChunkWatch {
    std::unordered_set<int64_t> chunks;
};

// ============================================================================
// Tiles (block entities)
// ============================================================================

struct TileId {
    uint32_t id = 0;
};

struct BlockPosition {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;
};

struct TileInfo {
    std::string type;  // "chest", "sign", "furnace", ...
};

} // namespace strata::world::ecs
