#pragma once

#include <chrono>
#include <cstddef>

namespace chunkcache {

/**
 * @brief Options for configuring a chunk cache instance
 */
struct ChunkCacheOptions {
    // Edge length of a chunk in world units; world -> chunk is floor(world / chunk_size)
    int chunk_size = 16;

    // Upper bound on cached entries
    size_t max_cached_chunks = 64;

    // Square radius (in chunks) used for priority normalisation
    int preload_radius = 2;

    // Number of priority tiers; tier 0 is kept longest
    int priority_levels = 3;

    // Keys dispatched per drain step
    size_t loading_batch_size = 4;

    // Pause between two drain steps while keys remain queued
    size_t loading_delay_ms = 1000;

    // Idle time after which an inactive entry is unloaded by UnloadStale()
    size_t unload_threshold_ms = 300000;

    // Period of the optional auto-save task
    size_t save_interval_ms = 60000;

    // Undrained events retained by the event bus
    size_t event_buffer_limit = 1024;

    std::chrono::milliseconds LoadingDelay() const {
        return std::chrono::milliseconds(loading_delay_ms);
    }
    std::chrono::milliseconds UnloadThreshold() const {
        return std::chrono::milliseconds(unload_threshold_ms);
    }
    std::chrono::milliseconds SaveInterval() const {
        return std::chrono::milliseconds(save_interval_ms);
    }

    // Throws std::invalid_argument naming the first unusable field.
    void Validate() const;
};

} // namespace chunkcache
