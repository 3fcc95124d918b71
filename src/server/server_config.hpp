#pragma once

#include "world/weather_state.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata::server {

struct ServerConfig {
    float tick_rate = 20.0f;
    int64_t ticks_per_day = 24000;
    std::string level_name = "world";
    unsigned worker_threads = 2;
    // Chunks around the origin loaded at startup, per dimension
    int32_t spawn_radius = 2;
};

struct CustomDimensionConfig {
    std::string name;
    int type = 0;
    std::optional<int> id;
    bool override_existing = false;
    std::optional<float> distance_multiplier;
};

class HostConfig {
public:
    bool load(const std::string& data_dir);

    const ServerConfig& server() const { return server_; }
    int custom_id_seed() const { return custom_id_seed_; }
    const world::WeatherConfig& weather() const { return weather_; }
    const std::vector<CustomDimensionConfig>& custom_dimensions() const { return custom_dimensions_; }

    bool load_server(const std::string& path);
    bool load_dimensions(const std::string& path);

private:
    ServerConfig server_;
    int custom_id_seed_ = 1000;
    world::WeatherConfig weather_;
    std::vector<CustomDimensionConfig> custom_dimensions_;
};

} // namespace strata::server
