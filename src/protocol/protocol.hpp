#pragma once

// Umbrella header for the wire messages owned by this repo
#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include "protocol/serializable.hpp"
#include "protocol/message_type.hpp"
#include "protocol/packet.hpp"
#include "protocol/level_event_msg.hpp"
#include "protocol/chunk_data_msg.hpp"
#include "protocol/entity_exit_msg.hpp"
