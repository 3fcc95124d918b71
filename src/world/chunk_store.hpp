#pragma once

#include "chunk.hpp"
#include <memory>

namespace strata::world {

// Persistence and generation backend for one dimension's chunks.
// Both calls return nullptr when the chunk cannot be produced.
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    virtual std::shared_ptr<Chunk> load(int32_t x, int32_t z) = 0;
    virtual std::shared_ptr<Chunk> generate(int32_t x, int32_t z) = 0;
};

} // namespace strata::world
