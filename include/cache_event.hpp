#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "chunk_key.hpp"
#include "logger.hpp"

namespace chunkcache {

enum class CacheEventType {
    kChunkLoaded,
    kChunkEvicted,
    kChunkSaved,
    kChunkError,
    kCacheCleared,
    kQueueProcessed,
};

const char* CacheEventTypeName(CacheEventType type);

/**
 * @brief Lifecycle notification. Carries snapshots only; nothing in an event
 *        can be used to change cache state.
 */
template <typename Chunk>
struct CacheEvent {
    CacheEventType type;
    ChunkKey key{std::string(), 0, 0};
    std::shared_ptr<const Chunk> chunk;  // kChunkLoaded
    std::error_code error;               // kChunkError
    std::string message;                 // kChunkError
    size_t count = 0;                    // kCacheCleared, kQueueProcessed (processed)
    size_t remaining = 0;                // kQueueProcessed

    static CacheEvent Loaded(const ChunkKey& key, std::shared_ptr<const Chunk> chunk) {
        CacheEvent e{CacheEventType::kChunkLoaded, key};
        e.chunk = std::move(chunk);
        return e;
    }
    static CacheEvent Evicted(const ChunkKey& key) {
        return CacheEvent{CacheEventType::kChunkEvicted, key};
    }
    static CacheEvent Saved(const ChunkKey& key) {
        return CacheEvent{CacheEventType::kChunkSaved, key};
    }
    static CacheEvent Error(const ChunkKey& key, std::error_code ec, std::string message) {
        CacheEvent e{CacheEventType::kChunkError, key};
        e.error = ec;
        e.message = std::move(message);
        return e;
    }
    static CacheEvent Cleared(size_t count) {
        CacheEvent e{CacheEventType::kCacheCleared};
        e.count = count;
        return e;
    }
    static CacheEvent QueueProcessed(size_t processed, size_t remaining) {
        CacheEvent e{CacheEventType::kQueueProcessed};
        e.count = processed;
        e.remaining = remaining;
        return e;
    }
};

/**
 * @brief Fan-out of cache events to subscribers plus a bounded mailbox that an
 *        owner without callbacks can Drain().
 *
 * Listeners run on the publishing thread, outside the bus lock, so they may
 * subscribe, unsubscribe or call back into the cache.
 */
template <typename Chunk>
class EventBus {
public:
    using Event = CacheEvent<Chunk>;
    using Listener = std::function<void(const Event&)>;
    using ListenerHandle = uint64_t;

    explicit EventBus(size_t buffer_limit = 1024) : buffer_limit_(buffer_limit) {}
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    ListenerHandle Subscribe(Listener listener) {
        std::lock_guard<std::mutex> lock(mu_);
        ListenerHandle handle = next_handle_++;
        listeners_.emplace_back(handle, std::make_shared<Listener>(std::move(listener)));
        return handle;
    }

    bool Unsubscribe(ListenerHandle handle) {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == handle) {
                listeners_.erase(it);
                return true;
            }
        }
        return false;
    }

    void Publish(const Event& event) {
        std::vector<std::shared_ptr<Listener>> targets;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (buffer_limit_ != 0) {
                if (mailbox_.size() >= buffer_limit_) {
                    mailbox_.pop_front();
                    ++dropped_;
                }
                mailbox_.push_back(event);
            }
            targets.reserve(listeners_.size());
            for (const auto& entry : listeners_) {
                targets.push_back(entry.second);
            }
        }
        for (const auto& listener : targets) {
            try {
                (*listener)(event);
            } catch (const std::exception& e) {
                LOG_ERROR("listener failed on %s for %s: %s", CacheEventTypeName(event.type),
                          event.key.ToString().c_str(), e.what());
            }
        }
    }

    void Publish(const std::vector<Event>& events) {
        for (const auto& event : events) {
            Publish(event);
        }
    }

    // Removes and returns every buffered event, oldest first.
    std::vector<Event> Drain() {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<Event> out(std::make_move_iterator(mailbox_.begin()),
                               std::make_move_iterator(mailbox_.end()));
        mailbox_.clear();
        return out;
    }

    // Events discarded because the mailbox was full.
    size_t DroppedCount() const {
        std::lock_guard<std::mutex> lock(mu_);
        return dropped_;
    }

    size_t ListenerCount() const {
        std::lock_guard<std::mutex> lock(mu_);
        return listeners_.size();
    }

private:
    mutable std::mutex mu_;
    std::vector<std::pair<ListenerHandle, std::shared_ptr<Listener>>> listeners_;
    std::deque<Event> mailbox_;
    size_t buffer_limit_;
    size_t dropped_ = 0;
    ListenerHandle next_handle_ = 1;
};

} // namespace chunkcache
