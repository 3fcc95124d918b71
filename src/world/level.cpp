#include "level.hpp"
#include <iostream>
#include <utility>

namespace strata::world {

Level::Level(std::string name, DimensionClassRegistry& classes)
    : name_(std::move(name))
    , classes_(classes) {
}

Level::~Level() {
    for (auto& [id, dimension] : dimensions_) {
        dimension->on_sleep_check().disconnect(*this);
        dimension->detach();
    }
    dimensions_.clear();
    owned_.clear();
}

std::shared_ptr<ChunkStore> Level::make_chunk_store(const Dimension& dimension) const {
    if (!store_factory_) {
        return nullptr;
    }
    return store_factory_(dimension);
}

void Level::enable_async_chunk_loading(asio::any_io_executor owner, asio::any_io_executor worker) {
    async_owner_ = owner;
    async_worker_ = worker;
    for (auto& [id, dimension] : dimensions_) {
        dimension->chunks().enable_async(owner, worker);
    }
}

void Level::configure_chunk_loading(ChunkIndex& chunks) const {
    if (async_owner_ && async_worker_) {
        chunks.enable_async(*async_owner_, *async_worker_);
    }
}

std::optional<int> Level::add_dimension(Dimension& dimension, std::optional<int> preferred_id) {
    for (const auto& [id, existing] : dimensions_) {
        if (existing == &dimension) {
            return std::nullopt;
        }
    }

    int assigned;
    if (preferred_id && *preferred_id >= 0 && dimensions_.find(*preferred_id) == dimensions_.end()) {
        assigned = *preferred_id;
    } else {
        assigned = 0;
        while (dimensions_.find(assigned) != dimensions_.end()) {
            ++assigned;
        }
    }

    dimensions_[assigned] = &dimension;
    dimension.on_sleep_check().connect<&Level::check_sleep>(*this);
    return assigned;
}

void Level::remove_dimension(Dimension& dimension) {
    auto it = dimensions_.find(dimension.id());
    if (it == dimensions_.end() || it->second != &dimension) {
        return;
    }
    dimension.on_sleep_check().disconnect(*this);
    dimensions_.erase(it);
}

Dimension* Level::create_dimension(int kind_id) {
    auto dimension = classes_.create(kind_id);
    if (!dimension) {
        std::cerr << "[Level] No dimension class registered with id " << kind_id << std::endl;
        return nullptr;
    }
    if (!dimension->attach(*this, kind_id)) {
        return nullptr;
    }
    owned_.push_back(std::move(dimension));
    return owned_.back().get();
}

Dimension* Level::get_dimension(int id) const {
    auto it = dimensions_.find(id);
    if (it != dimensions_.end()) {
        return it->second;
    }
    return nullptr;
}

entt::entity Level::create_entity(ecs::EntityKind kind, const ecs::Transform& transform, const std::string& name) {
    auto entity = registry_.create();
    registry_.emplace<ecs::NetworkId>(entity, next_entity_id_++);
    registry_.emplace<ecs::Transform>(entity, transform);

    ecs::EntityInfo info;
    info.kind = kind;
    info.name = name;
    registry_.emplace<ecs::EntityInfo>(entity, info);

    if (kind == ecs::EntityKind::Player) {
        registry_.emplace<ecs::SleepState>(entity);
        registry_.emplace<ecs::ChunkWatch>(entity);
    }
    return entity;
}

entt::entity Level::create_player(const std::string& name, const ecs::Transform& transform) {
    return create_entity(ecs::EntityKind::Player, transform, name);
}

entt::entity Level::create_tile(const std::string& type, const ecs::BlockPosition& position) {
    auto tile = registry_.create();
    registry_.emplace<ecs::TileId>(tile, next_tile_id_++);
    registry_.emplace<ecs::BlockPosition>(tile, position);
    registry_.emplace<ecs::TileInfo>(tile, type);
    return tile;
}

void Level::set_sleeping(Dimension& dimension, entt::entity player, bool sleeping) {
    if (auto* state = registry_.try_get<ecs::SleepState>(player)) {
        state->sleeping = sleeping;
    }
    if (sleeping) {
        check_sleep(dimension);
    }
}

void Level::check_sleep(Dimension& dimension) {
    const auto& players = dimension.players();
    if (players.empty()) {
        return;
    }

    for (const auto& [id, player] : players) {
        const auto* state = registry_.try_get<ecs::SleepState>(player);
        if (state == nullptr || !state->sleeping) {
            return;
        }
    }

    int64_t morning = (time_ / ticks_per_day_ + 1) * ticks_per_day_;
    std::cout << "[Level] All players in '" << dimension.dimension_name()
              << "' are asleep, skipping to tick " << morning << std::endl;
    time_ = morning;

    for (const auto& [id, player] : players) {
        registry_.get<ecs::SleepState>(player).sleeping = false;
    }
}

void Level::do_tick(int64_t current_tick) {
    ++time_;
    for (auto& [id, dimension] : dimensions_) {
        dimension->do_tick(current_tick);
    }
}

size_t Level::flush() {
    size_t sent = 0;
    for (auto& [id, dimension] : dimensions_) {
        auto batches = dimension->drain_chunk_packets();
        if (sink_ == nullptr) {
            continue;
        }
        for (const auto& [hash, batch] : batches) {
            auto watchers = dimension->chunk_player_ids(chunk_hash_x(hash), chunk_hash_z(hash));
            for (const auto& packet : batch) {
                for (uint32_t player_id : watchers) {
                    sink_->send(player_id, packet);
                    ++sent;
                }
            }
        }
    }
    return sent;
}

} // namespace strata::world
