#include "server_config.hpp"
#include "world/dimension_type.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace strata::server {

bool HostConfig::load(const std::string& data_dir) {
    bool ok = true;
    ok = load_server(data_dir + "/server.json") && ok;
    ok = load_dimensions(data_dir + "/dimensions.json") && ok;
    return ok;
}

bool HostConfig::load_server(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[Config] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        server_.tick_rate = j.value("tick_rate", 20.0f);
        server_.ticks_per_day = j.value("ticks_per_day", int64_t{24000});
        server_.level_name = j.value("level_name", "world");
        server_.worker_threads = j.value("worker_threads", 2u);
        server_.spawn_radius = j.value("spawn_radius", 2);
        if (server_.tick_rate <= 0.0f) {
            std::cerr << "[Config] tick_rate must be positive in " << path << std::endl;
            return false;
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[Config] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool HostConfig::load_dimensions(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[Config] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        custom_id_seed_ = j.value("custom_id_seed", 1000);

        if (j.contains("weather")) {
            const auto& w = j["weather"];
            weather_.auto_cycle = w.value("auto_cycle", false);
            weather_.min_clear_ticks = w.value("min_clear_ticks", int64_t{12000});
            weather_.max_clear_ticks = w.value("max_clear_ticks", int64_t{180000});
            weather_.min_rain_ticks = w.value("min_rain_ticks", int64_t{12000});
            weather_.max_rain_ticks = w.value("max_rain_ticks", int64_t{24000});
            weather_.max_intensity = w.value("max_intensity", 65535);
            weather_.thunder_chance = w.value("thunder_chance", 0.25f);
        }

        custom_dimensions_.clear();
        if (j.contains("custom")) {
            for (const auto& d : j["custom"]) {
                CustomDimensionConfig dim;
                dim.name = d.value("name", "Custom");
                dim.type = d.value("type", 0);
                if (d.contains("id")) {
                    dim.id = d["id"].get<int>();
                }
                dim.override_existing = d.value("override", false);
                if (d.contains("distance_multiplier")) {
                    dim.distance_multiplier = d["distance_multiplier"].get<float>();
                    if (!(*dim.distance_multiplier > 0.0f)) {
                        std::cerr << "[Config] Dimension '" << dim.name
                                  << "' needs a positive distance_multiplier in " << path << std::endl;
                        return false;
                    }
                }
                if (!world::DimensionTypeRegistry::contains(dim.type)) {
                    std::cerr << "[Config] Dimension '" << dim.name << "' uses unknown type "
                              << dim.type << " in " << path << std::endl;
                    return false;
                }
                custom_dimensions_.push_back(std::move(dim));
            }
        }

        std::cout << "[Config] Loaded " << custom_dimensions_.size() << " custom dimensions" << std::endl;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[Config] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace strata::server
