#pragma once

#include "chunk_store.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>

namespace strata::world {

// Keeps saved chunks in memory and generates empty columns on demand.
// Safe to call from the async loader thread.
class MemoryChunkStore : public ChunkStore {
public:
    std::shared_ptr<Chunk> load(int32_t x, int32_t z) override;
    std::shared_ptr<Chunk> generate(int32_t x, int32_t z) override;

    // Makes (x, z) loadable with the given payload
    void save(int32_t x, int32_t z, std::vector<uint8_t> payload);
    void set_generation_enabled(bool enabled);

    size_t load_calls() const;
    size_t generate_calls() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ChunkHash, std::vector<uint8_t>> saved_;
    bool generation_enabled_ = true;
    size_t load_calls_ = 0;
    size_t generate_calls_ = 0;
};

} // namespace strata::world
