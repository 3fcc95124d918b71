#pragma once

#include "serializable.hpp"
#include <cstdint>

namespace strata::protocol {

enum class ExitReason : uint8_t {
    Despawned = 0,
    ChangedDimension = 1,
};

// Server -> Client: entity is gone from the chunk it was last seen in.
// target_dimension is the id it moved to, -1 unless reason is ChangedDimension.
struct EntityExitMsg : Serializable<EntityExitMsg> {
    uint32_t entity_id = 0;
    ExitReason reason = ExitReason::Despawned;
    int32_t target_dimension = -1;

    static constexpr size_t serialized_size() {
        return sizeof(uint32_t) + sizeof(uint8_t) + sizeof(int32_t);
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(entity_id);
        w.write(static_cast<uint8_t>(reason));
        w.write(target_dimension);
    }

    void deserialize_impl(BufferReader& r) {
        entity_id = r.read<uint32_t>();
        reason = static_cast<ExitReason>(r.read<uint8_t>());
        target_dimension = r.read<int32_t>();
    }
};

} // namespace strata::protocol
