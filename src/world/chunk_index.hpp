#pragma once

#include "chunk.hpp"
#include "chunk_hash.hpp"
#include "chunk_store.hpp"
#include <asio/any_io_executor.hpp>
#include <entt/signal/sigh.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace strata::world {

// Resident chunks of one dimension keyed by packed coordinate.
// Not thread-safe: all calls must come from the owning tick thread. With async
// loading enabled the ChunkStore is also called from the worker executor, so
// the store must tolerate calls from that thread.
class ChunkIndex {
public:
    using ChunkPtr = std::shared_ptr<Chunk>;
    using LoadCallback = std::function<void(ChunkPtr)>;

    ChunkIndex();

    void set_store(std::shared_ptr<ChunkStore> store) { store_ = std::move(store); }
    bool has_store() const { return store_ != nullptr; }

    // Store calls for request() run on `worker`, completions are posted to `owner`
    void enable_async(asio::any_io_executor owner, asio::any_io_executor worker);

    // Resident chunk, or load (and optionally generate) on miss. nullptr if neither produced one.
    ChunkPtr get(int32_t x, int32_t z, bool generate = false);

    // Resident chunk only, never touches the store
    ChunkPtr find(int32_t x, int32_t z) const;

    // Asynchronous variant of get(). At most one load per coordinate is in flight;
    // later requests for the same coordinate join it and receive the same instance.
    void request(int32_t x, int32_t z, bool generate, LoadCallback callback);

    bool is_loaded(int32_t x, int32_t z) const;
    bool is_loading(int32_t x, int32_t z) const;
    bool unload(int32_t x, int32_t z);

    const std::unordered_map<ChunkHash, ChunkPtr>& loaded() const { return chunks_; }
    size_t size() const { return chunks_.size(); }

    // Fired once for every chunk that becomes resident
    entt::sink<entt::sigh<void(Chunk&)>> on_loaded() { return entt::sink{loaded_signal_}; }

private:
    ChunkPtr load_from_store(int32_t x, int32_t z, bool generate);
    ChunkPtr insert(ChunkHash hash, ChunkPtr chunk);
    void finish_request(ChunkHash hash, ChunkPtr chunk);

    std::shared_ptr<ChunkStore> store_;
    std::unordered_map<ChunkHash, ChunkPtr> chunks_;
    std::unordered_map<ChunkHash, std::vector<LoadCallback>> in_flight_;
    entt::sigh<void(Chunk&)> loaded_signal_;

    std::optional<asio::any_io_executor> owner_;
    std::optional<asio::any_io_executor> worker_;

    // Completions posted after this index is gone see an expired token
    std::shared_ptr<int> lifetime_token_;
};

} // namespace strata::world
