#pragma once

#include "server_config.hpp"
#include "world/dimension_registry.hpp"
#include "world/level.hpp"
#include "world/packet_sink.hpp"
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace strata::server {

// Counts outbound traffic when no transport is plugged in
class PacketCounter : public world::PacketSink {
public:
    void send(uint32_t player_id, const protocol::PacketData& data) override;

    uint64_t packets() const { return packets_; }
    uint64_t bytes() const { return bytes_; }

private:
    uint64_t packets_ = 0;
    uint64_t bytes_ = 0;
};

// Hosts one level and drives it at a fixed tick rate on the io_context thread.
// Chunk loads run on a worker pool and complete back on the io_context.
class Server {
public:
    Server(asio::io_context& io_context, const HostConfig& config);
    ~Server();

    void start();
    void stop();

    // Replaces the default PacketCounter; the sink must outlive the server
    void set_packet_sink(world::PacketSink* sink);

    // Runs a single tick: dimensions first, then the per-chunk packet flush
    void tick();

    world::Level& level() { return level_; }
    world::DimensionClassRegistry& dimension_classes() { return classes_; }
    int64_t current_tick() const { return current_tick_; }

private:
    void game_loop();
    void register_custom_dimensions();
    void create_dimensions();
    void preload_spawn_chunks();
    void report_stats();

    asio::io_context& io_context_;
    const HostConfig& config_;
    world::DimensionClassRegistry classes_;
    world::Level level_;
    asio::thread_pool chunk_workers_;
    PacketCounter counter_;
    std::vector<int> custom_ids_;

    asio::steady_timer tick_timer_;
    std::atomic<bool> running_{false};
    int64_t current_tick_ = 0;
    std::chrono::steady_clock::time_point last_report_;
};

} // namespace strata::server
