#include "chunk_encoder.hpp"
#include "protocol/chunk_data_msg.hpp"

namespace strata::world {

protocol::PacketData FullChunkEncoder::encode(const Chunk& chunk) {
    protocol::FullChunkDataMsg msg;
    msg.chunk_x = chunk.x();
    msg.chunk_z = chunk.z();
    msg.payload = chunk.payload();
    return protocol::build_packet(protocol::MessageType::FullChunkData, msg);
}

} // namespace strata::world
