#include "weather_state.hpp"
#include "protocol/level_event_msg.hpp"
#include <algorithm>

namespace strata::world {

using namespace strata::protocol;

WeatherState::WeatherState(const WeatherConfig& config, uint32_t seed)
    : config_(config)
    , rng_(seed) {
}

void WeatherState::set_rain_level(int32_t level) {
    level = std::max(level, 0);
    if (level == rain_level_) {
        return;
    }
    rain_level_ = level;
    changed_.publish(*this);
}

void WeatherState::set_thunder_level(int32_t level) {
    level = std::max(level, 0);
    if (level == thunder_level_) {
        return;
    }
    thunder_level_ = level;
    changed_.publish(*this);
}

void WeatherState::schedule_change(int64_t at_tick, int32_t rain_level, int32_t thunder_level) {
    next_change_ = WeatherChange{at_tick, std::max(rain_level, 0), std::max(thunder_level, 0)};
}

bool WeatherState::tick(int64_t current_tick) {
    if (!next_change_) {
        if (config_.auto_cycle) {
            schedule_next(current_tick);
        }
        return false;
    }
    if (current_tick < next_change_->at_tick) {
        return false;
    }

    WeatherChange change = *next_change_;
    next_change_.reset();
    rain_level_ = change.rain_level;
    thunder_level_ = change.thunder_level;

    if (config_.auto_cycle) {
        schedule_next(current_tick);
    }

    changed_.publish(*this);
    return true;
}

void WeatherState::schedule_next(int64_t current_tick) {
    if (rain_level_ > 0) {
        // Raining: next change clears the sky
        schedule_change(current_tick + random_ticks(config_.min_rain_ticks, config_.max_rain_ticks), 0, 0);
        return;
    }

    std::uniform_int_distribution<int32_t> intensity(1, std::max(config_.max_intensity, 1));
    std::bernoulli_distribution thunder(std::clamp(config_.thunder_chance, 0.0f, 1.0f));
    int32_t rain = intensity(rng_);
    int32_t storm = thunder(rng_) ? intensity(rng_) : 0;
    schedule_change(current_tick + random_ticks(config_.min_clear_ticks, config_.max_clear_ticks), rain, storm);
}

int64_t WeatherState::random_ticks(int64_t min_ticks, int64_t max_ticks) {
    min_ticks = std::max<int64_t>(min_ticks, 1);
    max_ticks = std::max(max_ticks, min_ticks);
    std::uniform_int_distribution<int64_t> dist(min_ticks, max_ticks);
    return dist(rng_);
}

std::array<PacketData, 2> WeatherState::compose() const {
    LevelEventMsg rain;
    if (rain_level_ > 0) {
        rain.event_id = LevelEventId::StartRain;
        rain.data = rain_level_;
    } else {
        rain.event_id = LevelEventId::StopRain;
    }

    LevelEventMsg thunder;
    if (thunder_level_ > 0) {
        thunder.event_id = LevelEventId::StartThunder;
        thunder.data = thunder_level_;
    } else {
        thunder.event_id = LevelEventId::StopThunder;
    }

    return {build_packet(MessageType::LevelEvent, rain),
            build_packet(MessageType::LevelEvent, thunder)};
}

} // namespace strata::world
