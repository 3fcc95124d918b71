#include "memory_chunk_store.hpp"
#include <utility>

namespace strata::world {

std::shared_ptr<Chunk> MemoryChunkStore::load(int32_t x, int32_t z) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++load_calls_;
    auto it = saved_.find(chunk_hash(x, z));
    if (it == saved_.end()) {
        return nullptr;
    }
    return std::make_shared<Chunk>(x, z, it->second);
}

std::shared_ptr<Chunk> MemoryChunkStore::generate(int32_t x, int32_t z) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generate_calls_;
    if (!generation_enabled_) {
        return nullptr;
    }
    return std::make_shared<Chunk>(x, z);
}

void MemoryChunkStore::save(int32_t x, int32_t z, std::vector<uint8_t> payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    saved_[chunk_hash(x, z)] = std::move(payload);
}

void MemoryChunkStore::set_generation_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    generation_enabled_ = enabled;
}

size_t MemoryChunkStore::load_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_calls_;
}

size_t MemoryChunkStore::generate_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generate_calls_;
}

} // namespace strata::world
