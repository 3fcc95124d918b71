#pragma once

#include "protocol/protocol.hpp"
#include "world/dimension.hpp"
#include "world/dimension_registry.hpp"
#include "world/level.hpp"
#include "world/memory_chunk_store.hpp"
#include "world/packet_sink.hpp"
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace strata::test {

// Captures everything a level or dimension hands to the transport
class RecordingSink : public world::PacketSink {
public:
    void send(uint32_t player_id, const protocol::PacketData& data) override {
        sent.emplace_back(player_id, data);
    }

    std::vector<protocol::PacketData> packets_for(uint32_t player_id) const {
        std::vector<protocol::PacketData> result;
        for (const auto& [id, data] : sent) {
            if (id == player_id) {
                result.push_back(data);
            }
        }
        return result;
    }

    std::vector<std::pair<uint32_t, protocol::PacketData>> sent;
};

inline protocol::MessageType packet_type(const protocol::PacketData& data) {
    protocol::BufferReader r(data);
    return protocol::read_header(r).type;
}

template<typename T>
T decode_packet(const protocol::PacketData& data) {
    protocol::BufferReader r(data);
    protocol::read_header(r);
    T msg;
    msg.deserialize(r);
    return msg;
}

// A level with the built-in dimensions backed by one shared in-memory store
struct LevelFixture {
    LevelFixture() {
        level.set_packet_sink(&sink);
        level.set_chunk_store_factory([this](const world::Dimension&) { return store; });
        overworld = level.create_dimension(world::Dimension::ID_OVERWORLD);
        nether = level.create_dimension(world::Dimension::ID_NETHER);
    }

    uint32_t id_of(entt::entity entity) const {
        return level.registry().get<world::ecs::NetworkId>(entity).id;
    }

    RecordingSink sink;
    std::shared_ptr<world::MemoryChunkStore> store = std::make_shared<world::MemoryChunkStore>();
    world::DimensionClassRegistry classes;
    world::Level level{"test", classes};
    world::Dimension* overworld = nullptr;
    world::Dimension* nether = nullptr;
};

} // namespace strata::test
