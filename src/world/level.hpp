#pragma once

#include "chunk_index.hpp"
#include "chunk_store.hpp"
#include "components.hpp"
#include "dimension.hpp"
#include "dimension_registry.hpp"
#include "packet_sink.hpp"
#include "weather_state.hpp"
#include <asio/any_io_executor.hpp>
#include <entt/entity/registry.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata::world {

// A world: the set of dimensions sharing one entity registry and one clock.
// Dimensions created through create_dimension() are owned by the level. A dimension
// attached directly leaves the level when destroyed, or is detached when the level
// goes first.
class Level {
public:
    using ChunkStoreFactory = std::function<std::shared_ptr<ChunkStore>(const Dimension&)>;

    static constexpr int64_t DEFAULT_TICKS_PER_DAY = 24000;

    Level(std::string name, DimensionClassRegistry& classes);
    ~Level();

    Level(const Level&) = delete;
    Level& operator=(const Level&) = delete;

    const std::string& name() const { return name_; }
    entt::registry& registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }
    DimensionClassRegistry& dimension_classes() { return classes_; }

    // Collaborators handed to dimensions when they attach
    void set_packet_sink(PacketSink* sink) { sink_ = sink; }
    PacketSink* packet_sink() const { return sink_; }
    void set_chunk_store_factory(ChunkStoreFactory factory) { store_factory_ = std::move(factory); }
    std::shared_ptr<ChunkStore> make_chunk_store(const Dimension& dimension) const;
    void enable_async_chunk_loading(asio::any_io_executor owner, asio::any_io_executor worker);
    void configure_chunk_loading(ChunkIndex& chunks) const;
    void set_weather_config(const WeatherConfig& config) { weather_config_ = config; }
    const WeatherConfig& weather_config() const { return weather_config_; }

    // Instantiates the class registered under kind_id and attaches it, preferring kind_id
    // as the dimension id. nullptr if the kind is unknown or attaching failed.
    Dimension* create_dimension(int kind_id);
    Dimension* get_dimension(int id) const;
    const std::map<int, Dimension*>& dimensions() const { return dimensions_; }

    // Entity/tile construction in the shared registry; ids are unique per level.
    // EntityKind::Player is what makes an entity a player.
    entt::entity create_entity(ecs::EntityKind kind, const ecs::Transform& transform, const std::string& name = "");
    entt::entity create_player(const std::string& name, const ecs::Transform& transform);
    entt::entity create_tile(const std::string& type, const ecs::BlockPosition& position);

    // Marks a player (not) sleeping and re-evaluates the dimension's sleep condition
    void set_sleeping(Dimension& dimension, entt::entity player, bool sleeping);
    // Skips to the next morning when every player of the dimension sleeps
    void check_sleep(Dimension& dimension);

    int64_t time() const { return time_; }
    void set_time(int64_t time) { time_ = time; }
    int64_t ticks_per_day() const { return ticks_per_day_; }
    void set_ticks_per_day(int64_t ticks) { ticks_per_day_ = ticks > 0 ? ticks : DEFAULT_TICKS_PER_DAY; }

    void do_tick(int64_t current_tick);

    // Drains every dimension's queued chunk packets to the players watching those chunks.
    // Returns the number of packets handed to the sink.
    size_t flush();

private:
    friend class Dimension;

    // Called from Dimension::attach
    std::optional<int> add_dimension(Dimension& dimension, std::optional<int> preferred_id);
    // Called from Dimension::~Dimension
    void remove_dimension(Dimension& dimension);

    std::string name_;
    DimensionClassRegistry& classes_;
    entt::registry registry_;
    PacketSink* sink_ = nullptr;
    ChunkStoreFactory store_factory_;
    std::optional<asio::any_io_executor> async_owner_;
    std::optional<asio::any_io_executor> async_worker_;
    WeatherConfig weather_config_;

    std::map<int, Dimension*> dimensions_;
    uint32_t next_entity_id_ = 1;
    uint32_t next_tile_id_ = 1;
    int64_t time_ = 0;
    int64_t ticks_per_day_ = DEFAULT_TICKS_PER_DAY;

    // Destroyed before the registry they index into
    std::vector<std::unique_ptr<Dimension>> owned_;
};

} // namespace strata::world
