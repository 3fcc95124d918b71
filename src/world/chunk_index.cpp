#include "chunk_index.hpp"
#include <asio/post.hpp>
#include <exception>
#include <iostream>
#include <utility>

namespace strata::world {

ChunkIndex::ChunkIndex()
    : lifetime_token_(std::make_shared<int>(0)) {
}

void ChunkIndex::enable_async(asio::any_io_executor owner, asio::any_io_executor worker) {
    owner_ = std::move(owner);
    worker_ = std::move(worker);
}

ChunkIndex::ChunkPtr ChunkIndex::get(int32_t x, int32_t z, bool generate) {
    ChunkHash hash = chunk_hash(x, z);
    auto it = chunks_.find(hash);
    if (it != chunks_.end()) {
        return it->second;
    }

    auto chunk = load_from_store(x, z, generate);
    if (!chunk) {
        return nullptr;
    }
    return insert(hash, std::move(chunk));
}

ChunkIndex::ChunkPtr ChunkIndex::find(int32_t x, int32_t z) const {
    auto it = chunks_.find(chunk_hash(x, z));
    if (it != chunks_.end()) {
        return it->second;
    }
    return nullptr;
}

ChunkIndex::ChunkPtr ChunkIndex::load_from_store(int32_t x, int32_t z, bool generate) {
    if (!store_) {
        return nullptr;
    }
    auto chunk = store_->load(x, z);
    if (!chunk && generate) {
        chunk = store_->generate(x, z);
    }
    return chunk;
}

ChunkIndex::ChunkPtr ChunkIndex::insert(ChunkHash hash, ChunkPtr chunk) {
    auto [it, inserted] = chunks_.emplace(hash, std::move(chunk));
    if (inserted) {
        loaded_signal_.publish(*it->second);
    }
    return it->second;
}

void ChunkIndex::request(int32_t x, int32_t z, bool generate, LoadCallback callback) {
    ChunkHash hash = chunk_hash(x, z);

    auto it = chunks_.find(hash);
    if (it != chunks_.end()) {
        callback(it->second);
        return;
    }

    auto pending = in_flight_.find(hash);
    if (pending != in_flight_.end()) {
        pending->second.push_back(std::move(callback));
        return;
    }

    if (!owner_ || !worker_ || !store_) {
        callback(get(x, z, generate));
        return;
    }

    in_flight_[hash].push_back(std::move(callback));

    std::weak_ptr<int> alive = lifetime_token_;
    asio::post(*worker_, [this, alive, store = store_, owner = *owner_, x, z, generate]() {
        ChunkPtr chunk;
        try {
            chunk = store->load(x, z);
            if (!chunk && generate) {
                chunk = store->generate(x, z);
            }
        } catch (const std::exception& e) {
            std::cerr << "[ChunkIndex] Load of chunk " << x << "," << z
                      << " failed: " << e.what() << std::endl;
            chunk = nullptr;
        }

        asio::post(owner, [this, alive, hash = chunk_hash(x, z), chunk = std::move(chunk)]() mutable {
            if (alive.expired()) {
                return;
            }
            finish_request(hash, std::move(chunk));
        });
    });
}

void ChunkIndex::finish_request(ChunkHash hash, ChunkPtr chunk) {
    // A synchronous get() may have made the chunk resident while the load was in flight
    auto resident = chunks_.find(hash);
    if (resident != chunks_.end()) {
        chunk = resident->second;
    } else if (chunk) {
        chunk = insert(hash, std::move(chunk));
    }

    auto node = in_flight_.extract(hash);
    if (node.empty()) {
        return;
    }
    for (auto& waiter : node.mapped()) {
        waiter(chunk);
    }
}

bool ChunkIndex::is_loaded(int32_t x, int32_t z) const {
    return chunks_.find(chunk_hash(x, z)) != chunks_.end();
}

bool ChunkIndex::is_loading(int32_t x, int32_t z) const {
    return in_flight_.find(chunk_hash(x, z)) != in_flight_.end();
}

bool ChunkIndex::unload(int32_t x, int32_t z) {
    return chunks_.erase(chunk_hash(x, z)) > 0;
}

} // namespace strata::world
