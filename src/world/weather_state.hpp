#pragma once

#include "protocol/packet.hpp"
#include <entt/signal/sigh.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <random>

namespace strata::world {

struct WeatherConfig {
    bool auto_cycle = false;
    int64_t min_clear_ticks = 12000;
    int64_t max_clear_ticks = 180000;
    int64_t min_rain_ticks = 12000;
    int64_t max_rain_ticks = 24000;
    int32_t max_intensity = 65535;
    float thunder_chance = 0.25f;
};

struct WeatherChange {
    int64_t at_tick = 0;
    int32_t rain_level = 0;
    int32_t thunder_level = 0;
};

// Rain/thunder intensity of one dimension. Changes are published through
// on_changed(); the owning dimension turns them into client broadcasts.
class WeatherState {
public:
    explicit WeatherState(const WeatherConfig& config = {}, uint32_t seed = std::random_device{}());

    void configure(const WeatherConfig& config) { config_ = config; }
    const WeatherConfig& config() const { return config_; }

    int32_t rain_level() const { return rain_level_; }
    int32_t thunder_level() const { return thunder_level_; }
    bool is_raining() const { return rain_level_ > 0; }
    bool is_thundering() const { return thunder_level_ > 0; }

    // Publish only if the value actually changes
    void set_rain_level(int32_t level);
    void set_thunder_level(int32_t level);

    void schedule_change(int64_t at_tick, int32_t rain_level, int32_t thunder_level);
    const std::optional<WeatherChange>& next_change() const { return next_change_; }

    // Applies a due scheduled change. Returns true if one was applied.
    bool tick(int64_t current_tick);

    // Rain message first, thunder second
    std::array<protocol::PacketData, 2> compose() const;

    entt::sink<entt::sigh<void(const WeatherState&)>> on_changed() { return entt::sink{changed_}; }

private:
    void schedule_next(int64_t current_tick);
    int64_t random_ticks(int64_t min_ticks, int64_t max_ticks);

    WeatherConfig config_;
    int32_t rain_level_ = 0;
    int32_t thunder_level_ = 0;
    std::optional<WeatherChange> next_change_;
    std::mt19937 rng_;
    entt::sigh<void(const WeatherState&)> changed_;
};

} // namespace strata::world
