#include "dimension.hpp"
#include "components.hpp"
#include "level.hpp"
#include "packet_sink.hpp"
#include "protocol/chunk_data_msg.hpp"
#include "protocol/entity_exit_msg.hpp"
#include <entt/entity/registry.hpp>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace strata::world {

using namespace strata::protocol;

Dimension::Dimension(int type_id)
    : encoder_(std::make_unique<FullChunkEncoder>()) {
    set_dimension_type(type_id);
    chunks_.on_loaded().connect<&Dimension::on_chunk_loaded>(*this);
    weather_.on_changed().connect<&Dimension::on_weather_changed>(*this);
}

Dimension::~Dimension() {
    if (level_ != nullptr) {
        level_->remove_dimension(*this);
    }
}

bool Dimension::attach(Level& level, std::optional<int> preferred_id) {
    if (level_ != nullptr || dimension_id_ != ID_RESERVED) {
        return false;
    }

    auto assigned = level.add_dimension(*this, preferred_id);
    if (!assigned) {
        return false;
    }

    level_ = &level;
    dimension_id_ = *assigned;
    if (auto store = level.make_chunk_store(*this)) {
        chunks_.set_store(std::move(store));
    }
    level.configure_chunk_loading(chunks_);
    weather_.configure(level.weather_config());

    std::cout << "[Dimension] '" << dimension_name() << "' attached to level '"
              << level.name() << "' with id " << dimension_id_ << std::endl;
    return true;
}

void Dimension::detach() {
    level_ = nullptr;
}

void Dimension::set_dimension_type(int type_id) {
    dimension_type_ = &DimensionTypeRegistry::get(type_id);
}

float Dimension::distance_multiplier() const {
    if (distance_multiplier_) {
        return *distance_multiplier_;
    }
    return dimension_type_->distance_multiplier();
}

void Dimension::set_distance_multiplier(std::optional<float> multiplier) {
    if (multiplier && !(*multiplier > 0.0f)) {
        throw std::invalid_argument("Distance multiplier must be positive");
    }
    distance_multiplier_ = multiplier;
}

entt::registry& Dimension::registry() const {
    if (level_ == nullptr) {
        throw std::logic_error("Dimension is not attached to a level");
    }
    return level_->registry();
}

bool Dimension::is_player(entt::entity entity) const {
    const auto* info = registry().try_get<ecs::EntityInfo>(entity);
    return info != nullptr && info->kind == ecs::EntityKind::Player;
}

uint32_t Dimension::network_id_of(entt::entity entity) const {
    const auto* net_id = registry().try_get<ecs::NetworkId>(entity);
    if (net_id == nullptr) {
        throw std::invalid_argument("Entity has no NetworkId component");
    }
    return net_id->id;
}

uint32_t Dimension::tile_id_of(entt::entity tile) const {
    const auto* tile_id = registry().try_get<ecs::TileId>(tile);
    if (tile_id == nullptr) {
        throw std::invalid_argument("Tile has no TileId component");
    }
    return tile_id->id;
}

ChunkHash Dimension::entity_chunk(entt::entity entity) const {
    const auto* transform = registry().try_get<ecs::Transform>(entity);
    if (transform == nullptr) {
        return chunk_hash(0, 0);
    }
    return chunk_hash(block_to_chunk(static_cast<int32_t>(std::floor(transform->x))),
                      block_to_chunk(static_cast<int32_t>(std::floor(transform->z))));
}

// ============================================================================
// Chunks
// ============================================================================

std::shared_ptr<Chunk> Dimension::get_chunk(int32_t x, int32_t z, bool generate) {
    return chunks_.get(x, z, generate);
}

void Dimension::request_chunk(int32_t x, int32_t z, bool generate, ChunkIndex::LoadCallback callback) {
    chunks_.request(x, z, generate, std::move(callback));
}

bool Dimension::unload_chunk(int32_t x, int32_t z) {
    auto watchers = chunk_watchers_.find(chunk_hash(x, z));
    if (watchers != chunk_watchers_.end() && !watchers->second.empty()) {
        return false;
    }
    auto chunk = chunks_.find(x, z);
    if (!chunk) {
        return false;
    }
    park_chunk_contents(*chunk);
    chunk_cache_.invalidate(x, z);
    return chunks_.unload(x, z);
}

void Dimension::park_chunk_contents(Chunk& chunk) {
    // Indexed entities and tiles outlive the chunk and are placed again on reload
    ChunkHash hash = chunk.hash();
    for (entt::entity entity : chunk.entities()) {
        waiting_entities_[hash].insert(network_id_of(entity));
    }
    for (entt::entity tile : chunk.tiles()) {
        waiting_tiles_[hash].insert(tile_id_of(tile));
    }
}

void Dimension::on_chunk_loaded(Chunk& chunk) {
    ChunkHash hash = chunk.hash();

    auto entities = waiting_entities_.extract(hash);
    if (!entities.empty()) {
        for (uint32_t id : entities.mapped()) {
            chunk.add_entity(entities_.at(id));
        }
    }

    auto tiles = waiting_tiles_.extract(hash);
    if (!tiles.empty()) {
        for (uint32_t id : tiles.mapped()) {
            const auto& slot = tile_slots_.at(id);
            chunk.add_tile(slot.tile, slot.x & 0x0F, slot.y, slot.z & 0x0F);
        }
    }
}

// ============================================================================
// Entities
// ============================================================================

void Dimension::add_entity(entt::entity entity) {
    uint32_t id = network_id_of(entity);

    auto existing = entities_.find(id);
    if (existing != entities_.end()) {
        unplace_entity(id, existing->second);
    }
    entities_[id] = entity;

    if (is_player(entity)) {
        players_[id] = entity;
    } else {
        players_.erase(id);
    }

    place_entity(id, entity);
}

void Dimension::remove_entity(entt::entity entity) {
    uint32_t id = network_id_of(entity);
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return;
    }

    if (players_.erase(id) > 0) {
        clear_watches(id, it->second);
        sleep_check_.publish(*this);
    }

    unplace_entity(id, it->second);
    entities_.erase(id);
    update_entities_.erase(id);
}

entt::entity Dimension::get_entity(uint32_t entity_id) const {
    auto it = entities_.find(entity_id);
    if (it != entities_.end()) {
        return it->second;
    }
    return entt::null;
}

std::vector<entt::entity> Dimension::chunk_entities(int32_t x, int32_t z) {
    auto chunk = chunks_.find(x, z);
    if (!chunk) {
        return {};
    }
    return chunk->entities();
}

void Dimension::move_entity(entt::entity entity) {
    uint32_t id = network_id_of(entity);
    if (entities_.find(id) == entities_.end()) {
        return;
    }

    auto current = entity_chunks_.find(id);
    if (current != entity_chunks_.end() && current->second == entity_chunk(entity)) {
        return;
    }
    unplace_entity(id, entity);
    place_entity(id, entity);
}

bool Dimension::transfer_entity(entt::entity entity, Dimension& from) {
    if (&from == this || from.level_ == nullptr || from.level_ != level_) {
        return false;
    }
    uint32_t id = network_id_of(entity);
    if (from.get_entity(id) != entity) {
        return false;
    }

    ChunkHash old_chunk = from.entity_chunk(entity);
    from.remove_entity(entity);

    EntityExitMsg exit_msg;
    exit_msg.entity_id = id;
    exit_msg.reason = ExitReason::ChangedDimension;
    exit_msg.target_dimension = dimension_id_;
    from.add_chunk_packet(chunk_hash_x(old_chunk), chunk_hash_z(old_chunk),
                          build_packet(MessageType::EntityExit, exit_msg));

    if (auto* transform = registry().try_get<ecs::Transform>(entity)) {
        float scale = from.distance_multiplier() / distance_multiplier();
        transform->x *= scale;
        transform->z *= scale;
    }

    add_entity(entity);
    return true;
}

void Dimension::schedule_entity_update(entt::entity entity) {
    uint32_t id = network_id_of(entity);
    if (entities_.find(id) != entities_.end()) {
        update_entities_.insert(id);
    }
}

void Dimension::place_entity(uint32_t entity_id, entt::entity entity) {
    ChunkHash hash = entity_chunk(entity);
    entity_chunks_[entity_id] = hash;
    if (auto chunk = chunks_.find(chunk_hash_x(hash), chunk_hash_z(hash))) {
        chunk->add_entity(entity);
    } else {
        waiting_entities_[hash].insert(entity_id);
    }
}

void Dimension::unplace_entity(uint32_t entity_id, entt::entity entity) {
    auto it = entity_chunks_.find(entity_id);
    if (it == entity_chunks_.end()) {
        return;
    }
    ChunkHash hash = it->second;
    entity_chunks_.erase(it);

    if (auto chunk = chunks_.find(chunk_hash_x(hash), chunk_hash_z(hash))) {
        chunk->remove_entity(entity);
    }
    auto waiting = waiting_entities_.find(hash);
    if (waiting != waiting_entities_.end()) {
        waiting->second.erase(entity_id);
        if (waiting->second.empty()) {
            waiting_entities_.erase(waiting);
        }
    }
}

// ============================================================================
// Players
// ============================================================================

entt::entity Dimension::get_player(uint32_t player_id) const {
    auto it = players_.find(player_id);
    if (it != players_.end()) {
        return it->second;
    }
    return entt::null;
}

std::vector<uint32_t> Dimension::player_ids() const {
    std::vector<uint32_t> ids;
    ids.reserve(players_.size());
    for (const auto& [id, player] : players_) {
        ids.push_back(id);
    }
    return ids;
}

bool Dimension::watch_chunk(entt::entity player, int32_t x, int32_t z) {
    uint32_t id = network_id_of(player);
    if (get_player(id) != player) {
        return false;
    }
    ChunkHash hash = chunk_hash(x, z);
    registry().get_or_emplace<ecs::ChunkWatch>(player).chunks.insert(hash);
    chunk_watchers_[hash][id] = player;
    return true;
}

bool Dimension::unwatch_chunk(entt::entity player, int32_t x, int32_t z) {
    uint32_t id = network_id_of(player);
    ChunkHash hash = chunk_hash(x, z);

    if (auto* watch = registry().try_get<ecs::ChunkWatch>(player)) {
        watch->chunks.erase(hash);
    }

    auto it = chunk_watchers_.find(hash);
    if (it == chunk_watchers_.end() || it->second.erase(id) == 0) {
        return false;
    }
    if (it->second.empty()) {
        chunk_watchers_.erase(it);
    }
    return true;
}

std::vector<entt::entity> Dimension::chunk_players(int32_t x, int32_t z) const {
    std::vector<entt::entity> result;
    auto it = chunk_watchers_.find(chunk_hash(x, z));
    if (it != chunk_watchers_.end()) {
        result.reserve(it->second.size());
        for (const auto& [id, player] : it->second) {
            result.push_back(player);
        }
    }
    return result;
}

std::vector<uint32_t> Dimension::chunk_player_ids(int32_t x, int32_t z) const {
    std::vector<uint32_t> result;
    auto it = chunk_watchers_.find(chunk_hash(x, z));
    if (it != chunk_watchers_.end()) {
        result.reserve(it->second.size());
        for (const auto& [id, player] : it->second) {
            result.push_back(id);
        }
    }
    return result;
}

void Dimension::clear_watches(uint32_t player_id, entt::entity player) {
    auto* watch = registry().try_get<ecs::ChunkWatch>(player);
    if (watch == nullptr) {
        return;
    }
    for (ChunkHash hash : watch->chunks) {
        auto it = chunk_watchers_.find(hash);
        if (it == chunk_watchers_.end()) {
            continue;
        }
        it->second.erase(player_id);
        if (it->second.empty()) {
            chunk_watchers_.erase(it);
        }
    }
    watch->chunks.clear();
}

// ============================================================================
// Tiles
// ============================================================================

void Dimension::add_tile(entt::entity tile) {
    uint32_t id = tile_id_of(tile);
    const auto& pos = registry().get<ecs::BlockPosition>(tile);

    // Re-adding under the same id replaces the previous placement
    unplace_tile(id);
    tiles_[id] = tile;
    tile_slots_[id] = TileSlot{tile, pos.x, pos.y, pos.z};
    place_tile(id, tile);

    clear_chunk_cache(block_to_chunk(pos.x), block_to_chunk(pos.z));
}

void Dimension::remove_tile(entt::entity tile) {
    uint32_t id = tile_id_of(tile);
    auto slot = tile_slots_.find(id);
    if (slot == tile_slots_.end()) {
        return;
    }
    int32_t chunk_x = block_to_chunk(slot->second.x);
    int32_t chunk_z = block_to_chunk(slot->second.z);

    unplace_tile(id);
    tiles_.erase(id);
    tile_slots_.erase(id);
    update_tiles_.erase(id);

    clear_chunk_cache(chunk_x, chunk_z);
}

entt::entity Dimension::get_tile_by_id(uint32_t tile_id) const {
    auto it = tiles_.find(tile_id);
    if (it != tiles_.end()) {
        return it->second;
    }
    return entt::null;
}

std::vector<entt::entity> Dimension::chunk_tiles(int32_t x, int32_t z) {
    auto chunk = chunks_.find(x, z);
    if (!chunk) {
        return {};
    }
    return chunk->tiles();
}

entt::entity Dimension::tile_at(int32_t x, int32_t y, int32_t z) {
    auto chunk = chunks_.find(block_to_chunk(x), block_to_chunk(z));
    if (!chunk) {
        return entt::null;
    }
    return chunk->get_tile(x & 0x0F, y, z & 0x0F);
}

void Dimension::schedule_tile_update(entt::entity tile) {
    uint32_t id = tile_id_of(tile);
    if (tiles_.find(id) != tiles_.end()) {
        update_tiles_.insert(id);
    }
}

void Dimension::place_tile(uint32_t tile_id, entt::entity tile) {
    const auto& slot = tile_slots_.at(tile_id);
    int32_t chunk_x = block_to_chunk(slot.x);
    int32_t chunk_z = block_to_chunk(slot.z);
    if (auto chunk = chunks_.find(chunk_x, chunk_z)) {
        chunk->add_tile(tile, slot.x & 0x0F, slot.y, slot.z & 0x0F);
    } else {
        waiting_tiles_[chunk_hash(chunk_x, chunk_z)].insert(tile_id);
    }
}

void Dimension::unplace_tile(uint32_t tile_id) {
    auto it = tile_slots_.find(tile_id);
    if (it == tile_slots_.end()) {
        return;
    }
    const auto& slot = it->second;
    int32_t chunk_x = block_to_chunk(slot.x);
    int32_t chunk_z = block_to_chunk(slot.z);
    if (auto chunk = chunks_.find(chunk_x, chunk_z)) {
        if (chunk->get_tile(slot.x & 0x0F, slot.y, slot.z & 0x0F) == slot.tile) {
            chunk->remove_tile(slot.x & 0x0F, slot.y, slot.z & 0x0F);
        }
    }
    auto waiting = waiting_tiles_.find(chunk_hash(chunk_x, chunk_z));
    if (waiting != waiting_tiles_.end()) {
        waiting->second.erase(tile_id);
        if (waiting->second.empty()) {
            waiting_tiles_.erase(waiting);
        }
    }
    clear_chunk_cache(chunk_x, chunk_z);
}

// ============================================================================
// Outbound packets
// ============================================================================

void Dimension::add_chunk_packet(int32_t chunk_x, int32_t chunk_z, PacketData packet) {
    packet_queue_.enqueue(chunk_x, chunk_z, std::move(packet));
}

void Dimension::add_chunk_packet(int32_t chunk_x, int32_t chunk_z, std::initializer_list<PacketData> packets) {
    packet_queue_.enqueue(chunk_x, chunk_z, packets);
}

void Dimension::add_chunk_packet(int32_t chunk_x, int32_t chunk_z, std::span<const PacketData> packets) {
    packet_queue_.enqueue(chunk_x, chunk_z, packets);
}

const PacketData* Dimension::chunk_packet(int32_t chunk_x, int32_t chunk_z) {
    if (const auto* cached = chunk_cache_.find(chunk_x, chunk_z)) {
        return cached;
    }
    auto chunk = chunks_.find(chunk_x, chunk_z);
    if (!chunk) {
        return nullptr;
    }
    return &chunk_cache_.store(chunk_x, chunk_z, encoder_->encode(*chunk));
}

void Dimension::block_changed(int32_t x, int32_t y, int32_t z, uint16_t block_id) {
    int32_t chunk_x = block_to_chunk(x);
    int32_t chunk_z = block_to_chunk(z);
    clear_chunk_cache(chunk_x, chunk_z);

    BlockUpdateMsg update;
    update.x = x;
    update.y = y;
    update.z = z;
    update.block_id = block_id;
    add_chunk_packet(chunk_x, chunk_z, build_packet(MessageType::BlockUpdate, update));
}

// ============================================================================
// Weather / tick
// ============================================================================

void Dimension::send_weather(std::span<const uint32_t> targets) {
    PacketSink* sink = level_ != nullptr ? level_->packet_sink() : nullptr;
    if (sink == nullptr) {
        return;
    }

    auto packets = weather_.compose();
    if (targets.empty()) {
        for (const auto& packet : packets) {
            for (const auto& [id, player] : players_) {
                sink->send(id, packet);
            }
        }
        return;
    }

    for (const auto& packet : packets) {
        for (uint32_t id : targets) {
            sink->send(id, packet);
        }
    }
}

void Dimension::on_weather_changed(const WeatherState&) {
    send_weather();
}

void Dimension::do_tick(int64_t current_tick) {
    do_weather_tick(current_tick);
}

void Dimension::do_weather_tick(int64_t current_tick) {
    weather_.tick(current_tick);
}

} // namespace strata::world
