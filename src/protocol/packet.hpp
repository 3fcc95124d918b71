#pragma once

#include "serializable.hpp"
#include "message_type.hpp"
#include <cstdint>
#include <vector>

namespace strata::protocol {

// A ready-to-send message: header followed by payload
using PacketData = std::vector<uint8_t>;

struct PacketHeader : Serializable<PacketHeader> {
    MessageType type = MessageType::LevelEvent;
    uint32_t payload_size = 0;

    static constexpr size_t serialized_size() { return sizeof(MessageType) + sizeof(uint32_t); }

    void serialize_impl(BufferWriter& w) const {
        w.write(static_cast<uint8_t>(type));
        w.write(payload_size);
    }

    void deserialize_impl(BufferReader& r) {
        type = static_cast<MessageType>(r.read<uint8_t>());
        payload_size = r.read<uint32_t>();
    }
};

// Build a ready-to-send packet from a Serializable message
template<typename T>
PacketData build_packet(MessageType type, const T& msg) {
    PacketData data;
    data.reserve(PacketHeader::serialized_size() + msg.serialized_size());
    BufferWriter w(data);
    PacketHeader hdr;
    hdr.type = type;
    hdr.payload_size = static_cast<uint32_t>(msg.serialized_size());
    hdr.serialize(w);
    msg.serialize(w);
    return data;
}

// Split a packet into header and payload reader. Throws std::out_of_range on truncation.
inline PacketHeader read_header(BufferReader& r) {
    PacketHeader hdr;
    hdr.deserialize(r);
    if (r.remaining_size() < hdr.payload_size) {
        throw std::out_of_range("packet payload truncated");
    }
    return hdr;
}

} // namespace strata::protocol
