#pragma once

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "cache_error.hpp"
#include "cache_event.hpp"
#include "chunk_key.hpp"
#include "eviction_policy.hpp"
#include "load_queue.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "priority.hpp"
#include "resource_backend.hpp"

namespace chunkcache {

enum class LoadStatus {
    kHit,     // chunk returned from the table
    kQueued,  // miss; key newly queued for fetch
    kPending  // miss; key was already queued or in flight
};

// Per-key lifecycle state.
enum class ChunkState {
    kAbsent,
    kQueued,
    kLoading,
    kClean,
    kDirty,
};

template <typename Chunk>
struct LoadResult {
    LoadStatus status;
    std::shared_ptr<const Chunk> chunk;  // set on kHit only

    bool hit() const { return status == LoadStatus::kHit; }

    // CacheErrc::kAlreadyLoading for kPending, empty otherwise.
    std::error_code error() const {
        return status == LoadStatus::kPending ? make_error_code(CacheErrc::kAlreadyLoading)
                                              : std::error_code();
    }
};

// Metadata snapshot of one entry.
struct EntryInfo {
    int priority = 0;
    CacheClock::time_point last_accessed;
    bool dirty = false;
    bool active = false;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t loads = 0;
    uint64_t load_failures = 0;
    uint64_t evictions = 0;
    uint64_t saves = 0;
    uint64_t save_failures = 0;
};

struct BatchReport {
    size_t processed = 0;
    size_t remaining = 0;
    std::vector<KeyResult> results;
};

struct PrefetchReport {
    size_t enqueued = 0;
    size_t already_cached = 0;
    size_t already_loading = 0;
    size_t cleared = 0;  // pending keys of the same owner dropped first
};

/**
 * @brief Bounded chunk cache with prefetch, batched loading and write-back.
 *
 * The entry table and the load queue sit behind one mutex. Backend fetches
 * run outside that mutex (ProcessBatch dispatches a batch concurrently);
 * write-backs forced by eviction run under it, Save() releases it while
 * persisting. Events are published after the mutex is released.
 *
 * Chunks are held as shared_ptr<const Chunk>. Readers get immutable
 * snapshots; Update() replaces the stored chunk with a modified copy.
 *
 * Anything driving ProcessBatch() from another thread (LoadScheduler) must be
 * stopped before the cache is destroyed.
 */
template <typename Chunk>
class ChunkCache {
public:
    using ChunkPtr = std::shared_ptr<const Chunk>;
    using Backend = ResourceBackend<Chunk>;
    using Event = CacheEvent<Chunk>;
    using ClockFn = std::function<CacheClock::time_point()>;

    ChunkCache(std::shared_ptr<Backend> backend, ChunkCacheOptions options = {},
               ClockFn clock = nullptr)
        : backend_(std::move(backend)),
          options_(std::move(options)),
          clock_(clock ? std::move(clock) : ClockFn(&CacheClock::now)),
          events_(options_.event_buffer_limit) {
        if (!backend_) {
            throw std::invalid_argument("chunk cache requires a resource backend");
        }
        options_.Validate();
    }

    ~ChunkCache() {
        std::lock_guard<std::mutex> lock(mu_);
        size_t dirty = 0;
        for (const auto& kv : table_) {
            if (kv.second.dirty) ++dirty;
        }
        if (dirty != 0) {
            LOG_WARNING("destroying chunk cache with %zu unsaved chunks", dirty);
        }
    }

    ChunkCache(const ChunkCache&) = delete;
    ChunkCache& operator=(const ChunkCache&) = delete;

    /**
     * @brief Cache hit returns the chunk and refreshes its recency. A miss
     *        queues the key unless a fetch for it is already queued or in
     *        flight.
     */
    LoadResult<Chunk> GetOrLoad(const ChunkKey& key) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = table_.find(key);
            if (it != table_.end()) {
                it->second.last_accessed = clock_();
                ++stats_.hits;
                return {LoadStatus::kHit, it->second.chunk};
            }
            ++stats_.misses;
            if (!queue_.Enqueue(key)) {
                return {LoadStatus::kPending, nullptr};
            }
            LOG_DEBUG("miss on %s, queued for fetch", key.ToString().c_str());
        }
        NotifyEnqueued();
        return {LoadStatus::kQueued, nullptr};
    }

    // Snapshot without touching recency; nullptr when not cached.
    ChunkPtr Peek(const ChunkKey& key) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = table_.find(key);
        return it == table_.end() ? nullptr : it->second.chunk;
    }

    /**
     * @brief Applies a fetch outcome for key.
     *
     * Success inserts a clean entry and evicts down to max_cached_chunks; if
     * that is impossible without losing dirty data the fresh entry is dropped
     * again and kCacheExhausted is returned. Failure clears the key from the
     * queue and returns kFetchFailed; nothing is retried.
     */
    std::error_code CompleteLoad(const ChunkKey& key, FetchResult<Chunk> result) {
        std::vector<Event> events;
        std::string message;
        std::error_code ec;
        {
            std::lock_guard<std::mutex> lock(mu_);
            ec = CompleteLoadLocked(key, std::move(result), events, message);
        }
        events_.Publish(events);
        return ec;
    }

    /**
     * @brief One drain step of the load queue.
     *
     * Takes up to loading_batch_size pending keys, fetches them concurrently
     * and completes each. A key stays in flight from dispatch to completion,
     * so it cannot be fetched twice at once.
     */
    BatchReport ProcessBatch() {
        BatchReport report;
        std::vector<ChunkKey> batch;
        {
            std::lock_guard<std::mutex> lock(mu_);
            batch = queue_.TakeBatch(options_.loading_batch_size);
            if (batch.empty()) {
                report.remaining = queue_.PendingCount();
                return report;
            }
        }

        LOG_DEBUG("dispatching %zu chunk fetches", batch.size());
        std::vector<std::future<FetchResult<Chunk>>> fetches;
        fetches.reserve(batch.size());
        for (const auto& key : batch) {
            auto task = [backend = backend_, key]() { return FetchSafely(*backend, key); };
            try {
                fetches.push_back(std::async(std::launch::async, task));
            } catch (const std::system_error& e) {
                LOG_WARNING("no thread for fetch of %s, running inline: %s",
                            key.ToString().c_str(), e.what());
                fetches.push_back(std::async(std::launch::deferred, task));
            }
        }

        std::vector<FetchResult<Chunk>> fetched;
        fetched.reserve(fetches.size());
        for (auto& f : fetches) {
            fetched.push_back(f.get());
        }

        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(mu_);
            for (size_t i = 0; i < batch.size(); ++i) {
                std::string message;
                auto ec = CompleteLoadLocked(batch[i], std::move(fetched[i]), events, message);
                report.results.push_back(KeyResult{batch[i], ec, std::move(message)});
            }
            report.processed = batch.size();
            report.remaining = queue_.PendingCount();
        }
        events.push_back(Event::QueueProcessed(report.processed, report.remaining));
        events_.Publish(events);
        return report;
    }

    // Flags an existing entry for write-back.
    std::error_code MarkDirty(const ChunkKey& key) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = table_.find(key);
        if (it == table_.end()) {
            return make_error_code(CacheErrc::kNotFound);
        }
        it->second.dirty = true;
        it->second.version = ++next_version_;
        return {};
    }

    /**
     * @brief Mutation accessor. mutator(Chunk&) runs on a private copy under
     *        the cache lock and must not call back into the cache. The copy
     *        replaces the stored chunk and the entry becomes dirty. If mutator
     *        throws, the entry is left unchanged and the exception propagates.
     */
    template <typename Mutator>
    std::error_code Update(const ChunkKey& key, Mutator&& mutator) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = table_.find(key);
        if (it == table_.end()) {
            return make_error_code(CacheErrc::kNotFound);
        }
        auto copy = std::make_shared<Chunk>(*it->second.chunk);
        std::forward<Mutator>(mutator)(*copy);
        Entry& entry = it->second;
        entry.chunk = std::move(copy);
        entry.dirty = true;
        entry.version = ++next_version_;
        entry.last_accessed = clock_();
        return {};
    }

    /**
     * @brief Persists one cached chunk. The entry is marked clean only if it
     *        was not modified (or dropped and reloaded) while the backend call
     *        was running. While the call runs the key is not an eviction
     *        candidate and other saves of it wait.
     */
    std::error_code Save(const ChunkKey& key) {
        std::vector<Event> events;
        std::string message;
        auto ec = SaveOne(key, events, message);
        events_.Publish(events);
        return ec;
    }

    // Saves every dirty entry; one result per key, failures included.
    std::vector<KeyResult> SaveAllDirty() {
        std::vector<KeyResult> results;
        std::vector<Event> events;
        for (const auto& key : DirtyKeys()) {
            std::string message;
            auto ec = SaveOne(key, events, message);
            if (ec == CacheErrc::kNotFound) {
                continue;  // evicted, and therefore written back, meanwhile
            }
            results.push_back(KeyResult{key, ec, std::move(message)});
        }
        events_.Publish(events);
        return results;
    }

    // Removes one entry, writing it back first if dirty. Waits for a Save()
    // of the same key that is still running.
    std::error_code Evict(const ChunkKey& key) {
        std::vector<Event> events;
        std::error_code ec;
        {
            std::unique_lock<std::mutex> lock(mu_);
            persist_cv_.wait(lock, [this, &key]() { return persisting_.count(key) == 0; });
            auto it = table_.find(key);
            if (it == table_.end()) {
                ec = make_error_code(CacheErrc::kNotFound);
            } else {
                std::string message;
                ec = EvictEntryLocked(it, events, message);
            }
        }
        events_.Publish(events);
        return ec;
    }

    // Evicts by policy until the table fits max_cached_chunks.
    std::error_code EvictUntilUnderCapacity() {
        std::vector<Event> events;
        std::error_code ec;
        {
            std::lock_guard<std::mutex> lock(mu_);
            ec = EvictUntilUnderCapacityLocked(events, nullptr);
        }
        events_.Publish(events);
        return ec;
    }

    /**
     * @brief Queues the square neighbourhood of radius chunks around the
     *        chunk containing center.
     *
     * Pending keys of the same owner queued by earlier requests are dropped
     * first (newest intent wins); other owners' pending keys and in-flight
     * fetches are kept. The reference point moves to the centre chunk;
     * existing priorities are refreshed only by RecomputePriorities().
     */
    PrefetchReport PrefetchRadius(const std::string& owner_id, const WorldPos& center, int radius) {
        PrefetchReport report;
        if (radius < 0) {
            LOG_WARNING("ignoring prefetch for %s with negative radius %d", owner_id.c_str(), radius);
            return report;
        }
        if (std::isnan(center.x) || std::isnan(center.y)) {
            LOG_WARNING("ignoring prefetch for %s around a NaN position", owner_id.c_str());
            return report;
        }
        {
            std::lock_guard<std::mutex> lock(mu_);
            ChunkCoord center_chunk = WorldToChunk(center, options_.chunk_size);
            reference_ = center_chunk;
            report.cleared = queue_.ClearPending(owner_id);
            for (const auto& coord : SquareNeighborhood(center_chunk, radius)) {
                ChunkKey key(owner_id, coord);
                if (table_.count(key) != 0) {
                    ++report.already_cached;
                } else if (queue_.Enqueue(key)) {
                    ++report.enqueued;
                } else {
                    ++report.already_loading;
                }
            }
            LOG_DEBUG("prefetch %s around (%d,%d) r=%d: %zu queued, %zu cached, %zu loading, %zu dropped",
                      owner_id.c_str(), center_chunk.x, center_chunk.y, radius, report.enqueued,
                      report.already_cached, report.already_loading, report.cleared);
        }
        if (report.enqueued != 0) {
            NotifyEnqueued();
        }
        return report;
    }

    void SetReferencePoint(const ChunkCoord& reference) {
        std::lock_guard<std::mutex> lock(mu_);
        reference_ = reference;
    }

    ChunkCoord ReferencePoint() const {
        std::lock_guard<std::mutex> lock(mu_);
        return reference_;
    }

    // Re-derives every entry's tier from the current reference point.
    size_t RecomputePriorities() {
        std::lock_guard<std::mutex> lock(mu_);
        size_t changed = 0;
        for (auto& kv : table_) {
            int priority = PriorityForLocked(kv.first);
            if (priority != kv.second.priority) {
                kv.second.priority = priority;
                ++changed;
            }
        }
        return changed;
    }

    // Active chunks are pinned: never chosen by eviction or stale unloading.
    std::error_code Activate(const ChunkKey& key) { return SetActive(key, true); }
    std::error_code Deactivate(const ChunkKey& key) { return SetActive(key, false); }

    bool IsActive(const ChunkKey& key) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = table_.find(key);
        return it != table_.end() && it->second.active;
    }

    /**
     * @brief Evicts inactive entries in policy order until at most keep
     *        entries remain. Dirty entries are written back first; one that
     *        cannot be written back is reported and kept.
     */
    std::vector<KeyResult> CleanupInactive(size_t keep) {
        std::vector<KeyResult> results;
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (table_.size() > keep) {
                for (const auto& key : EvictionOrderLocked()) {
                    if (table_.size() <= keep) break;
                    auto it = table_.find(key);
                    std::string message;
                    auto ec = EvictEntryLocked(it, events, message);
                    results.push_back(KeyResult{key, ec, std::move(message)});
                }
            }
        }
        events_.Publish(events);
        return results;
    }

    // Evicts inactive entries idle for at least unload_threshold_ms.
    std::vector<KeyResult> UnloadStale() {
        std::vector<KeyResult> results;
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(mu_);
            auto now = clock_();
            auto threshold = options_.UnloadThreshold();
            for (const auto& key : EvictionOrderLocked()) {
                auto it = table_.find(key);
                if (now - it->second.last_accessed < threshold) continue;
                std::string message;
                auto ec = EvictEntryLocked(it, events, message);
                results.push_back(KeyResult{key, ec, std::move(message)});
            }
        }
        events_.Publish(events);
        return results;
    }

    /**
     * @brief Drops every entry and every pending load. Dirty entries are
     *        discarded without write-back and each one is logged. In-flight
     *        fetches still complete and insert their result.
     */
    size_t ForceClear() {
        size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(mu_);
            for (const auto& kv : table_) {
                if (kv.second.dirty) {
                    LOG_WARNING("force clear discards unsaved chunk %s", kv.first.ToString().c_str());
                }
            }
            count = table_.size();
            table_.clear();
            size_t dropped = queue_.ClearAllPending();
            LOG_INFO("cleared %zu chunks and %zu pending loads", count, dropped);
        }
        events_.Publish(Event::Cleared(count));
        return count;
    }

    ChunkState State(const ChunkKey& key) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = table_.find(key);
        if (it != table_.end()) {
            return it->second.dirty ? ChunkState::kDirty : ChunkState::kClean;
        }
        if (queue_.IsInFlight(key)) return ChunkState::kLoading;
        if (queue_.IsPending(key)) return ChunkState::kQueued;
        return ChunkState::kAbsent;
    }

    std::optional<EntryInfo> Inspect(const ChunkKey& key) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = table_.find(key);
        if (it == table_.end()) {
            return std::nullopt;
        }
        const Entry& e = it->second;
        return EntryInfo{e.priority, e.last_accessed, e.dirty, e.active};
    }

    bool Contains(const ChunkKey& key) const {
        std::lock_guard<std::mutex> lock(mu_);
        return table_.count(key) != 0;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return table_.size();
    }

    // Dirty keys in key order.
    std::vector<ChunkKey> DirtyKeys() const {
        std::vector<ChunkKey> keys;
        {
            std::lock_guard<std::mutex> lock(mu_);
            for (const auto& kv : table_) {
                if (kv.second.dirty) keys.push_back(kv.first);
            }
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.PendingCount();
    }

    size_t InFlightCount() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.InFlightCount();
    }

    CacheStats Stats() const {
        std::lock_guard<std::mutex> lock(mu_);
        return stats_;
    }

    const ChunkCacheOptions& Options() const { return options_; }

    EventBus<Chunk>& Events() { return events_; }

    // Called, outside the cache lock, whenever new keys enter the load queue.
    // The hook must not call SetEnqueueHook().
    void SetEnqueueHook(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(hook_mu_);
        enqueue_hook_ = std::move(hook);
    }

private:
    struct Entry {
        ChunkPtr chunk;
        CacheClock::time_point last_accessed;
        bool dirty = false;
        bool active = false;
        int priority = 0;
        uint64_t sequence = 0;
        uint64_t version = 0;  // cache-wide modification stamp, unique per change
    };
    using Table = std::unordered_map<ChunkKey, Entry, ChunkKeyHash>;

    static FetchResult<Chunk> FetchSafely(Backend& backend, const ChunkKey& key) {
        try {
            return backend.Fetch(key);
        } catch (const std::exception& e) {
            return FetchResult<Chunk>::Failure(make_error_code(CacheErrc::kFetchFailed), e.what());
        }
    }

    // Returns the backend's error; message receives a description on failure.
    std::error_code PersistSafely(const ChunkKey& key, const Chunk& chunk, std::string& message) {
        std::error_code ec;
        try {
            ec = backend_->Persist(key, chunk);
        } catch (const std::exception& e) {
            message = e.what();
            return make_error_code(CacheErrc::kPersistFailed);
        }
        if (ec) {
            message = ec.message();
        }
        return ec;
    }

    int PriorityForLocked(const ChunkKey& key) const {
        return ComputePriority(key.Coord(), reference_, options_.preload_radius,
                               options_.priority_levels);
    }

    std::error_code CompleteLoadLocked(const ChunkKey& key, FetchResult<Chunk>&& result,
                                       std::vector<Event>& events, std::string& message) {
        queue_.Finish(key);
        queue_.RemovePending(key);

        if (!result.ok()) {
            ++stats_.load_failures;
            if (!result.message.empty()) {
                message = result.message;
            } else if (result.error) {
                message = result.error.message();
            } else {
                message = "backend returned no chunk";
            }
            LOG_WARNING("fetch of %s failed: %s", key.ToString().c_str(), message.c_str());
            events.push_back(Event::Error(key, make_error_code(CacheErrc::kFetchFailed), message));
            return make_error_code(CacheErrc::kFetchFailed);
        }

        auto existing = table_.find(key);
        if (existing != table_.end()) {
            // The cached copy may hold unsaved changes; it stays authoritative.
            existing->second.last_accessed = clock_();
            LOG_DEBUG("fetched %s is already cached, keeping cached copy", key.ToString().c_str());
            return {};
        }

        Entry entry;
        entry.chunk = std::make_shared<const Chunk>(std::move(*result.chunk));
        entry.last_accessed = clock_();
        entry.priority = PriorityForLocked(key);
        entry.sequence = next_sequence_++;
        entry.version = ++next_version_;
        ChunkPtr loaded = entry.chunk;
        table_.emplace(key, std::move(entry));
        ++stats_.loads;

        if (table_.size() > options_.max_cached_chunks) {
            auto ec = EvictUntilUnderCapacityLocked(events, &key);
            if (ec) {
                // The fresh copy is clean and can be fetched again; dropping it
                // keeps the capacity bound without losing data.
                table_.erase(key);
                ++stats_.load_failures;
                message = "cache exhausted while inserting " + key.ToString();
                events.push_back(Event::Error(key, ec, message));
                return ec;
            }
        }

        LOG_DEBUG("loaded %s (priority %d, %zu cached)", key.ToString().c_str(),
                  PriorityForLocked(key), table_.size());
        events.push_back(Event::Loaded(key, std::move(loaded)));
        return {};
    }

    std::vector<EvictionCandidate> CandidatesLocked(const ChunkKey* protected_key) const {
        std::vector<EvictionCandidate> candidates;
        candidates.reserve(table_.size());
        for (const auto& kv : table_) {
            if (kv.second.active) continue;
            if (persisting_.count(kv.first) != 0) continue;
            if (protected_key != nullptr && kv.first == *protected_key) continue;
            const Entry& e = kv.second;
            candidates.push_back(EvictionCandidate{kv.first, e.priority, e.last_accessed,
                                                   e.sequence, e.dirty});
        }
        return candidates;
    }

    // Inactive keys, clean ones first, each group in eviction order.
    std::vector<ChunkKey> EvictionOrderLocked() const {
        auto candidates = CandidatesLocked(nullptr);
        std::vector<ChunkKey> clean;
        std::vector<ChunkKey> dirty;
        for (size_t idx : RankEvictionCandidates(candidates)) {
            (candidates[idx].dirty ? dirty : clean).push_back(candidates[idx].key);
        }
        clean.insert(clean.end(), dirty.begin(), dirty.end());
        return clean;
    }

    std::error_code WriteBackLocked(const ChunkKey& key, Entry& entry, std::vector<Event>& events,
                                    std::string& message) {
        auto ec = PersistSafely(key, *entry.chunk, message);
        if (ec) {
            ++stats_.save_failures;
            LOG_WARNING("write-back of %s failed: %s", key.ToString().c_str(), message.c_str());
            events.push_back(Event::Error(key, make_error_code(CacheErrc::kPersistFailed), message));
            return make_error_code(CacheErrc::kPersistFailed);
        }
        entry.dirty = false;
        ++stats_.saves;
        LOG_INFO("wrote back %s before eviction", key.ToString().c_str());
        events.push_back(Event::Saved(key));
        return {};
    }

    // Write-back if dirty, then removal. On kPersistFailed the entry stays.
    std::error_code EvictEntryLocked(typename Table::iterator it, std::vector<Event>& events,
                                     std::string& message) {
        ChunkKey key = it->first;
        if (it->second.dirty) {
            auto ec = WriteBackLocked(key, it->second, events, message);
            if (ec) {
                return ec;
            }
        }
        table_.erase(it);
        ++stats_.evictions;
        LOG_INFO("evicted %s (%zu cached)", key.ToString().c_str(), table_.size());
        events.push_back(Event::Evicted(key));
        return {};
    }

    std::error_code EvictUntilUnderCapacityLocked(std::vector<Event>& events,
                                                  const ChunkKey* protected_key) {
        while (table_.size() > options_.max_cached_chunks) {
            auto candidates = CandidatesLocked(protected_key);
            auto choice = SelectEvictionCandidate(candidates);
            if (!choice) {
                LOG_ERROR("cache exhausted: %zu/%zu entries and none evictable",
                          table_.size(), options_.max_cached_chunks);
                return make_error_code(CacheErrc::kCacheExhausted);
            }
            auto it = table_.find(candidates[*choice].key);
            std::string message;
            if (EvictEntryLocked(it, events, message)) {
                LOG_ERROR("cache exhausted: %zu/%zu entries, every candidate dirty and %s unwritable: %s",
                          table_.size(), options_.max_cached_chunks,
                          candidates[*choice].key.ToString().c_str(), message.c_str());
                return make_error_code(CacheErrc::kCacheExhausted);
            }
        }
        return {};
    }

    std::error_code SaveOne(const ChunkKey& key, std::vector<Event>& events, std::string& message) {
        ChunkPtr snapshot;
        uint64_t version = 0;
        {
            std::unique_lock<std::mutex> lock(mu_);
            // One persist per key at a time; a second Save() queues behind it.
            persist_cv_.wait(lock, [this, &key]() { return persisting_.count(key) == 0; });
            auto it = table_.find(key);
            if (it == table_.end()) {
                message = "not cached";
                return make_error_code(CacheErrc::kNotFound);
            }
            snapshot = it->second.chunk;
            version = it->second.version;
            persisting_.insert(key);
        }

        auto ec = PersistSafely(key, *snapshot, message);

        std::lock_guard<std::mutex> lock(mu_);
        persisting_.erase(key);
        persist_cv_.notify_all();
        if (ec) {
            ++stats_.save_failures;
            LOG_WARNING("save of %s failed: %s", key.ToString().c_str(), message.c_str());
            events.push_back(Event::Error(key, make_error_code(CacheErrc::kPersistFailed), message));
            return make_error_code(CacheErrc::kPersistFailed);
        }
        ++stats_.saves;
        auto it = table_.find(key);
        if (it != table_.end() && it->second.version == version) {
            it->second.dirty = false;
        }
        events.push_back(Event::Saved(key));
        return {};
    }

    std::error_code SetActive(const ChunkKey& key, bool active) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = table_.find(key);
        if (it == table_.end()) {
            return make_error_code(CacheErrc::kNotFound);
        }
        it->second.active = active;
        if (active) {
            it->second.last_accessed = clock_();
        }
        return {};
    }

    // The hook runs under hook_mu_ so that SetEnqueueHook(nullptr) returns
    // only once no call into the previous hook is still running.
    void NotifyEnqueued() {
        std::lock_guard<std::mutex> lock(hook_mu_);
        if (enqueue_hook_) {
            enqueue_hook_();
        }
    }

    std::shared_ptr<Backend> backend_;
    ChunkCacheOptions options_;
    ClockFn clock_;
    EventBus<Chunk> events_;

    mutable std::mutex mu_;
    Table table_;
    LoadQueue queue_;
    ChunkCoord reference_;
    uint64_t next_sequence_ = 0;
    uint64_t next_version_ = 0;
    // Keys with a Save() persist running outside mu_.
    std::unordered_set<ChunkKey, ChunkKeyHash> persisting_;
    std::condition_variable persist_cv_;
    CacheStats stats_;

    std::mutex hook_mu_;
    std::function<void()> enqueue_hook_;
};

} // namespace chunkcache
