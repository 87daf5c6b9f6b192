#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_set>
#include <vector>

#include "chunk_key.hpp"

namespace chunkcache {

/**
 * @brief Deduplicated set of keys waiting for, or undergoing, a fetch.
 *
 * A key is either pending (queued, FIFO order) or in flight (dispatched by
 * TakeBatch and not yet finished). Enqueue refuses keys in either state, which
 * gives at most one outstanding fetch per key. Not synchronised; the owning
 * cache guards it with its own mutex.
 */
class LoadQueue {
public:
    LoadQueue() = default;

    // False when the key is already pending or in flight.
    bool Enqueue(const ChunkKey& key);

    bool IsPending(const ChunkKey& key) const { return pending_.count(key) != 0; }
    bool IsInFlight(const ChunkKey& key) const { return in_flight_.count(key) != 0; }
    bool Contains(const ChunkKey& key) const { return IsPending(key) || IsInFlight(key); }

    // Moves up to max_keys pending keys, oldest first, into the in-flight set.
    std::vector<ChunkKey> TakeBatch(size_t max_keys);

    // Marks a dispatched fetch as resolved. False if the key was not in flight.
    bool Finish(const ChunkKey& key);

    bool RemovePending(const ChunkKey& key);

    // Drops pending keys of one owner; in-flight keys are untouched.
    size_t ClearPending(const std::string& owner_id);
    size_t ClearAllPending();

    size_t PendingCount() const { return pending_.size(); }
    size_t InFlightCount() const { return in_flight_.size(); }
    bool HasPending() const { return !pending_.empty(); }

private:
    void Compact();

    // FIFO order of pending keys; always the same key set as pending_.
    std::deque<ChunkKey> order_;
    std::unordered_set<ChunkKey, ChunkKeyHash> pending_;
    std::unordered_set<ChunkKey, ChunkKeyHash> in_flight_;
};

} // namespace chunkcache
