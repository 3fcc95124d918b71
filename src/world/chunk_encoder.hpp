#pragma once

#include "chunk.hpp"
#include "protocol/packet.hpp"

namespace strata::world {

// Turns a resident chunk into the packet sent to clients that load it
class ChunkEncoder {
public:
    virtual ~ChunkEncoder() = default;

    virtual protocol::PacketData encode(const Chunk& chunk) = 0;
};

// Wraps the chunk payload in a FullChunkData message
class FullChunkEncoder : public ChunkEncoder {
public:
    protocol::PacketData encode(const Chunk& chunk) override;
};

} // namespace strata::world
