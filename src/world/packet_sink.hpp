#pragma once

#include "protocol/packet.hpp"
#include <cstdint>

namespace strata::world {

// Outbound side of the transport: delivers one packet to one connected player
class PacketSink {
public:
    virtual ~PacketSink() = default;

    virtual void send(uint32_t player_id, const protocol::PacketData& data) = 0;
};

} // namespace strata::world
