#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "chunk_cache.hpp"
#include "logger.hpp"

namespace chunkcache {

/**
 * @brief Background drain loop for a cache's load queue.
 *
 * Sleeps until the cache reports newly queued keys, then runs ProcessBatch()
 * until the queue is empty, pausing loading_delay_ms between batches. There
 * is no polling while the queue is empty. Stop() waits for the current batch;
 * dispatched fetches are never cancelled.
 *
 * Must be stopped (or destroyed) before the cache it drives.
 */
template <typename Chunk>
class LoadScheduler {
public:
    explicit LoadScheduler(ChunkCache<Chunk>& cache)
        : cache_(cache), delay_(cache.Options().LoadingDelay()) {}

    ~LoadScheduler() { Stop(); }

    LoadScheduler(const LoadScheduler&) = delete;
    LoadScheduler& operator=(const LoadScheduler&) = delete;

    void Start() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (worker_.joinable()) {
                LOG_WARNING("load scheduler already running");
                return;
            }
            shutting_down_.store(false);
            // Keys queued before Start() must not wait for the next enqueue.
            notified_ = true;
            worker_ = std::thread([this]() { Worker(); });
        }
        cache_.SetEnqueueHook([this]() { Notify(); });
        LOG_INFO("load scheduler started (batch %zu, delay %lld ms)",
                 cache_.Options().loading_batch_size, static_cast<long long>(delay_.count()));
    }

    void Stop() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!worker_.joinable()) return;
            shutting_down_.store(true);
        }
        cache_.SetEnqueueHook(nullptr);
        cv_.notify_one();
        worker_.join();
        LOG_INFO("load scheduler stopped after %zu batches", batches_.load());
    }

    void Notify() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            notified_ = true;
        }
        cv_.notify_one();
    }

    bool Running() const { return !shutting_down_.load() && worker_.joinable(); }

    size_t BatchesProcessed() const { return batches_.load(); }

private:
    void Worker() {
        while (!shutting_down_.load()) {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [this]() { return notified_ || shutting_down_.load(); });
            if (shutting_down_.load()) break;
            notified_ = false;
            lk.unlock();
            Drain();
        }
    }

    void Drain() {
        while (!shutting_down_.load()) {
            BatchReport report = cache_.ProcessBatch();
            if (report.processed == 0) {
                return;
            }
            ++batches_;
            for (const auto& result : report.results) {
                if (!result.ok()) {
                    LOG_DEBUG("batch result for %s: %s", result.key.ToString().c_str(),
                              result.message.c_str());
                }
            }
            if (report.remaining == 0) {
                return;
            }
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait_for(lk, delay_, [this]() { return shutting_down_.load(); });
        }
    }

    ChunkCache<Chunk>& cache_;
    std::chrono::milliseconds delay_;

    std::mutex mtx_;
    std::condition_variable cv_;
    bool notified_ = false;
    std::thread worker_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<size_t> batches_{0};
};

} // namespace chunkcache
