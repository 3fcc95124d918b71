#include "server.hpp"
#include "world/dimensions.hpp"
#include "world/memory_chunk_store.hpp"
#include <asio/error_code.hpp>
#include <algorithm>
#include <iostream>
#include <memory>

namespace strata::server {

using namespace strata::world;

void PacketCounter::send(uint32_t, const protocol::PacketData& data) {
    ++packets_;
    bytes_ += data.size();
}

Server::Server(asio::io_context& io_context, const HostConfig& config)
    : io_context_(io_context)
    , config_(config)
    , classes_(config.custom_id_seed())
    , level_(config.server().level_name, classes_)
    , chunk_workers_(std::max(config.server().worker_threads, 1u))
    , tick_timer_(io_context)
    , last_report_(std::chrono::steady_clock::now()) {
    level_.set_ticks_per_day(config.server().ticks_per_day);
    level_.set_weather_config(config.weather());
    level_.set_packet_sink(&counter_);
    level_.set_chunk_store_factory([](const Dimension&) {
        return std::make_shared<MemoryChunkStore>();
    });
    level_.enable_async_chunk_loading(io_context_.get_executor(), chunk_workers_.get_executor());

    register_custom_dimensions();
    create_dimensions();
}

Server::~Server() {
    stop();
    chunk_workers_.join();
}

void Server::register_custom_dimensions() {
    for (const auto& custom : config_.custom_dimensions()) {
        auto result = classes_.register_dimension<ConfiguredDimension>(
            custom.id, custom.override_existing, custom.name, custom.type, custom.distance_multiplier);
        if (!result) {
            std::cerr << "[Server] Could not register dimension '" << custom.name << "': "
                      << (result.error == RegisterError::IdAlreadyBound ? "id already bound" : "invalid class")
                      << std::endl;
            continue;
        }
        std::cout << "[Server] Dimension '" << custom.name << "' registered as id " << result.id << std::endl;
        custom_ids_.push_back(result.id);
    }
}

void Server::create_dimensions() {
    level_.create_dimension(Dimension::ID_OVERWORLD);
    level_.create_dimension(Dimension::ID_NETHER);
    level_.create_dimension(Dimension::ID_THE_END);
    for (int id : custom_ids_) {
        // An override of a built-in id replaced the class before the built-in was created
        if (level_.get_dimension(id) == nullptr) {
            level_.create_dimension(id);
        }
    }
}

void Server::preload_spawn_chunks() {
    int32_t radius = config_.server().spawn_radius;
    for (auto& [id, dimension] : level_.dimensions()) {
        for (int32_t x = -radius; x <= radius; ++x) {
            for (int32_t z = -radius; z <= radius; ++z) {
                dimension->request_chunk(x, z, true, [x, z, name = dimension->dimension_name()](auto chunk) {
                    if (!chunk) {
                        std::cerr << "[Server] Spawn chunk " << x << "," << z << " of '" << name
                                  << "' could not be loaded" << std::endl;
                    }
                });
            }
        }
    }
}

void Server::start() {
    running_ = true;
    preload_spawn_chunks();
    game_loop();
    std::cout << "[Server] Level '" << level_.name() << "' running with "
              << level_.dimensions().size() << " dimensions at "
              << config_.server().tick_rate << " ticks/s" << std::endl;
}

void Server::stop() {
    running_ = false;
    tick_timer_.cancel();
}

void Server::set_packet_sink(PacketSink* sink) {
    level_.set_packet_sink(sink != nullptr ? sink : &counter_);
}

void Server::tick() {
    level_.do_tick(current_tick_);
    level_.flush();
    ++current_tick_;
}

void Server::game_loop() {
    if (!running_) return;

    tick();
    report_stats();

    float tick_duration = 1.0f / config_.server().tick_rate;
    tick_timer_.expires_after(std::chrono::milliseconds(static_cast<int>(tick_duration * 1000)));
    tick_timer_.async_wait([this](asio::error_code ec) {
        if (!ec && running_) {
            game_loop();
        }
    });
}

void Server::report_stats() {
    auto now = std::chrono::steady_clock::now();
    if (now - last_report_ < std::chrono::seconds(30)) {
        return;
    }
    last_report_ = now;

    size_t chunks = 0;
    size_t entities = 0;
    for (const auto& [id, dimension] : level_.dimensions()) {
        chunks += dimension->chunks().size();
        entities += dimension->entities().size();
    }
    std::cout << "[Server] tick " << current_tick_ << ", " << chunks << " chunks, "
              << entities << " entities, " << counter_.packets() << " packets ("
              << counter_.bytes() << " bytes) sent" << std::endl;
}

} // namespace strata::server
