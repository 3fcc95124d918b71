#pragma once

#include "chunk.hpp"
#include "chunk_encoder.hpp"
#include "chunk_hash.hpp"
#include "chunk_index.hpp"
#include "dimension_type.hpp"
#include "packet_queue.hpp"
#include "weather_state.hpp"
#include "protocol/packet.hpp"
#include <entt/entity/fwd.hpp>
#include <entt/signal/sigh.hpp>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace strata::world {

class Level;

// One spatial layer of a Level (overworld, nether, ...). Owns the chunk, entity,
// tile and player indexes of that layer, its weather and its outbound packet queue.
//
// A dimension is constructed detached and becomes usable once attach() succeeded.
// Entities and tiles are handles into the parent Level's registry; the dimension
// indexes them but never destroys them.
//
// Not thread-safe: all calls must occur on the tick thread.
class Dimension {
public:
    static constexpr int ID_RESERVED = -1;
    static constexpr int ID_OVERWORLD = 0;
    static constexpr int ID_NETHER = 1;
    static constexpr int ID_THE_END = 2;

    explicit Dimension(int type_id = DimensionTypeRegistry::OVERWORLD);
    virtual ~Dimension();

    Dimension(const Dimension&) = delete;
    Dimension& operator=(const Dimension&) = delete;

    // Attaches to a level, which assigns the id. One-shot: false if already attached
    // (even to a level that is gone since) or the level refused.
    // A dimension destroyed before its level removes itself from it.
    bool attach(Level& level, std::optional<int> preferred_id = std::nullopt);
    Level* level() const { return level_; }
    bool is_attached() const { return level_ != nullptr; }
    int id() const { return dimension_id_; }

    virtual std::string dimension_name() const = 0;

    const DimensionType& dimension_type() const { return *dimension_type_; }
    // Throws InvalidDimensionType if the id is unknown
    void set_dimension_type(int type_id);
    SkyColor sky_color() const { return dimension_type_->sky_color(); }
    int max_build_height() const { return dimension_type_->max_build_height(); }

    // Horizontal scale of one block here relative to the overworld (nether: 8)
    float distance_multiplier() const;
    // Throws std::invalid_argument for a multiplier that is not positive
    void set_distance_multiplier(std::optional<float> multiplier);

    // ---- Chunks ----
    ChunkIndex& chunks() { return chunks_; }
    const ChunkIndex& chunks() const { return chunks_; }
    std::shared_ptr<Chunk> get_chunk(int32_t x, int32_t z, bool generate = false);
    void request_chunk(int32_t x, int32_t z, bool generate, ChunkIndex::LoadCallback callback);
    // Refuses while a player still watches the chunk
    bool unload_chunk(int32_t x, int32_t z);

    // ---- Entities ----
    void add_entity(entt::entity entity);
    void remove_entity(entt::entity entity);
    entt::entity get_entity(uint32_t entity_id) const;
    const std::unordered_map<uint32_t, entt::entity>& entities() const { return entities_; }
    std::vector<entt::entity> chunk_entities(int32_t x, int32_t z);
    // Re-homes an indexed entity after its Transform changed. Until then the entity
    // stays in the chunk it was last placed in.
    void move_entity(entt::entity entity);
    // Moves an entity from another dimension of the same level into this one
    bool transfer_entity(entt::entity entity, Dimension& from);

    void schedule_entity_update(entt::entity entity);
    const std::unordered_set<uint32_t>& scheduled_entity_updates() const { return update_entities_; }

    // ---- Players ----
    const std::unordered_map<uint32_t, entt::entity>& players() const { return players_; }
    entt::entity get_player(uint32_t player_id) const;
    std::vector<uint32_t> player_ids() const;
    bool watch_chunk(entt::entity player, int32_t x, int32_t z);
    bool unwatch_chunk(entt::entity player, int32_t x, int32_t z);
    std::vector<entt::entity> chunk_players(int32_t x, int32_t z) const;
    std::vector<uint32_t> chunk_player_ids(int32_t x, int32_t z) const;

    // ---- Tiles ----
    void add_tile(entt::entity tile);
    void remove_tile(entt::entity tile);
    entt::entity get_tile_by_id(uint32_t tile_id) const;
    const std::unordered_map<uint32_t, entt::entity>& tiles() const { return tiles_; }
    std::vector<entt::entity> chunk_tiles(int32_t x, int32_t z);
    entt::entity tile_at(int32_t x, int32_t y, int32_t z);

    void schedule_tile_update(entt::entity tile);
    const std::unordered_set<uint32_t>& scheduled_tile_updates() const { return update_tiles_; }

    // ---- Outbound packets ----
    void add_chunk_packet(int32_t chunk_x, int32_t chunk_z, protocol::PacketData packet);
    void add_chunk_packet(int32_t chunk_x, int32_t chunk_z, std::initializer_list<protocol::PacketData> packets);
    void add_chunk_packet(int32_t chunk_x, int32_t chunk_z, std::span<const protocol::PacketData> packets);
    ChunkBatches drain_chunk_packets() { return packet_queue_.drain_all(); }
    const PacketBroadcastQueue& packet_queue() const { return packet_queue_; }

    // Compiled full-chunk packet; nullptr if the chunk is not resident
    const protocol::PacketData* chunk_packet(int32_t chunk_x, int32_t chunk_z);
    const ChunkPacketCache& chunk_packet_cache() const { return chunk_cache_; }
    void clear_chunk_cache(int32_t chunk_x, int32_t chunk_z) { chunk_cache_.invalidate(chunk_x, chunk_z); }
    void set_chunk_encoder(std::unique_ptr<ChunkEncoder> encoder) { encoder_ = std::move(encoder); }

    // A block changed: drop the compiled chunk and queue the update for watchers
    void block_changed(int32_t x, int32_t y, int32_t z, uint16_t block_id);

    // ---- Weather ----
    WeatherState& weather() { return weather_; }
    const WeatherState& weather() const { return weather_; }
    int32_t rain_level() const { return weather_.rain_level(); }
    int32_t thunder_level() const { return weather_.thunder_level(); }
    void set_rain_level(int32_t level) { weather_.set_rain_level(level); }
    void set_thunder_level(int32_t level) { weather_.set_thunder_level(level); }

    // Sends the current weather to the given players, or to every player here if empty
    void send_weather(std::span<const uint32_t> targets = {});

    void do_tick(int64_t current_tick);

    // Raised whenever a player leaves; the level re-evaluates its sleep condition
    entt::sink<entt::sigh<void(Dimension&)>> on_sleep_check() { return entt::sink{sleep_check_}; }

protected:
    virtual void do_weather_tick(int64_t current_tick);

private:
    friend class Level;

    // Called by a level that is being destroyed
    void detach();

    entt::registry& registry() const;
    bool is_player(entt::entity entity) const;
    uint32_t network_id_of(entt::entity entity) const;
    uint32_t tile_id_of(entt::entity tile) const;
    ChunkHash entity_chunk(entt::entity entity) const;

    void place_entity(uint32_t entity_id, entt::entity entity);
    void unplace_entity(uint32_t entity_id, entt::entity entity);
    void place_tile(uint32_t tile_id, entt::entity tile);
    void unplace_tile(uint32_t tile_id);
    void park_chunk_contents(Chunk& chunk);
    void clear_watches(uint32_t player_id, entt::entity player);

    void on_chunk_loaded(Chunk& chunk);
    void on_weather_changed(const WeatherState& weather);

    struct TileSlot {
        entt::entity tile;
        int32_t x;
        int32_t y;
        int32_t z;
    };

    Level* level_ = nullptr;
    int dimension_id_ = ID_RESERVED;
    const DimensionType* dimension_type_ = nullptr;
    std::optional<float> distance_multiplier_;

    ChunkIndex chunks_;
    ChunkPacketCache chunk_cache_;
    PacketBroadcastQueue packet_queue_;
    std::unique_ptr<ChunkEncoder> encoder_;

    std::unordered_map<uint32_t, entt::entity> entities_;
    // Chunk each indexed entity belongs to, resident or not
    std::unordered_map<uint32_t, ChunkHash> entity_chunks_;
    // Entities and tiles whose chunk is not resident, placed when it loads
    std::unordered_map<ChunkHash, std::unordered_set<uint32_t>> waiting_entities_;
    std::unordered_map<ChunkHash, std::unordered_set<uint32_t>> waiting_tiles_;
    std::unordered_map<uint32_t, entt::entity> players_;
    std::unordered_map<ChunkHash, std::unordered_map<uint32_t, entt::entity>> chunk_watchers_;
    std::unordered_map<uint32_t, entt::entity> tiles_;
    std::unordered_map<uint32_t, TileSlot> tile_slots_;

    std::unordered_set<uint32_t> update_entities_;
    std::unordered_set<uint32_t> update_tiles_;

    WeatherState weather_;
    entt::sigh<void(Dimension&)> sleep_check_;
};

} // namespace strata::world
