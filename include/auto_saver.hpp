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
 * @brief Periodic SaveAllDirty() on a worker thread, every save_interval_ms.
 *
 * Goes through the cache's public API only, so it takes the same lock as
 * every other caller. Stop() does not save; call SaveAllDirty() before
 * disposing of the cache.
 */
template <typename Chunk>
class AutoSaver {
public:
    explicit AutoSaver(ChunkCache<Chunk>& cache)
        : cache_(cache), interval_(cache.Options().SaveInterval()) {}

    ~AutoSaver() { Stop(); }

    AutoSaver(const AutoSaver&) = delete;
    AutoSaver& operator=(const AutoSaver&) = delete;

    void Start() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (worker_.joinable()) return;
        shutting_down_.store(false);
        worker_ = std::thread([this]() { Worker(); });
    }

    void Stop() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!worker_.joinable()) return;
            shutting_down_.store(true);
        }
        cv_.notify_one();
        worker_.join();
    }

    size_t RunsCompleted() const { return runs_.load(); }
    size_t FailuresSeen() const { return failures_.load(); }

private:
    void Worker() {
        while (!shutting_down_.load()) {
            {
                std::unique_lock<std::mutex> lk(mtx_);
                if (cv_.wait_for(lk, interval_, [this]() { return shutting_down_.load(); })) {
                    break;
                }
            }
            auto results = cache_.SaveAllDirty();
            size_t failed = 0;
            for (const auto& result : results) {
                if (!result.ok()) {
                    ++failed;
                    LOG_WARNING("auto-save of %s failed: %s", result.key.ToString().c_str(),
                                result.message.c_str());
                }
            }
            failures_ += failed;
            ++runs_;
            if (!results.empty()) {
                LOG_INFO("auto-save wrote %zu of %zu dirty chunks", results.size() - failed,
                         results.size());
            }
        }
    }

    ChunkCache<Chunk>& cache_;
    std::chrono::milliseconds interval_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<size_t> runs_{0};
    std::atomic<size_t> failures_{0};
};

} // namespace chunkcache
