#include "load_queue.hpp"

#include <algorithm>

namespace chunkcache {

bool LoadQueue::Enqueue(const ChunkKey& key) {
    if (Contains(key)) {
        return false;
    }
    pending_.insert(key);
    order_.push_back(key);
    return true;
}

std::vector<ChunkKey> LoadQueue::TakeBatch(size_t max_keys) {
    std::vector<ChunkKey> batch;
    batch.reserve(std::min(max_keys, pending_.size()));
    while (batch.size() < max_keys && !order_.empty()) {
        ChunkKey key = std::move(order_.front());
        order_.pop_front();
        pending_.erase(key);
        in_flight_.insert(key);
        batch.push_back(std::move(key));
    }
    return batch;
}

bool LoadQueue::Finish(const ChunkKey& key) {
    return in_flight_.erase(key) != 0;
}

bool LoadQueue::RemovePending(const ChunkKey& key) {
    if (pending_.erase(key) == 0) {
        return false;
    }
    Compact();
    return true;
}

size_t LoadQueue::ClearPending(const std::string& owner_id) {
    size_t removed = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->OwnerId() == owner_id) {
            it = pending_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed != 0) {
        Compact();
    }
    return removed;
}

size_t LoadQueue::ClearAllPending() {
    size_t removed = pending_.size();
    pending_.clear();
    order_.clear();
    return removed;
}

void LoadQueue::Compact() {
    order_.erase(std::remove_if(order_.begin(), order_.end(),
                                [this](const ChunkKey& key) { return pending_.count(key) == 0; }),
                 order_.end());
}

} // namespace chunkcache
