#pragma once

#include "serializable.hpp"
#include "message_type.hpp"

namespace strata::protocol {

// Server -> Client: dimension-wide event (weather start/stop, ...)
struct LevelEventMsg : Serializable<LevelEventMsg> {
    LevelEventId event_id = LevelEventId::StopRain;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    int32_t data = 0;

    static constexpr size_t serialized_size() {
        return sizeof(uint16_t) + sizeof(float) * 3 + sizeof(int32_t);
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(static_cast<uint16_t>(event_id));
        w.write(x); w.write(y); w.write(z);
        w.write(data);
    }

    void deserialize_impl(BufferReader& r) {
        event_id = static_cast<LevelEventId>(r.read<uint16_t>());
        x = r.read<float>();
        y = r.read<float>();
        z = r.read<float>();
        data = r.read<int32_t>();
    }
};

} // namespace strata::protocol
