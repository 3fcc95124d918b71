#pragma once

#include <cstdint>

namespace strata::protocol {

enum class MessageType : uint8_t {
    LevelEvent = 1,
    FullChunkData = 2,
    BlockUpdate = 3,
    EntityExit = 4,
};

// Event ids carried by LevelEvent messages
enum class LevelEventId : uint16_t {
    StartRain = 3001,
    StartThunder = 3002,
    StopRain = 3003,
    StopThunder = 3004,
};

} // namespace strata::protocol
