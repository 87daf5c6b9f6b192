#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "chunk_key.hpp"

namespace chunkcache {

using CacheClock = std::chrono::steady_clock;

// What the eviction policy needs to know about one entry.
struct EvictionCandidate {
    ChunkKey key;
    int priority;
    CacheClock::time_point last_accessed;
    uint64_t sequence;  // insertion order, the final tie-break
    bool dirty;
};

/**
 * @brief Strict eviction order: higher priority number first, then older
 *        last_accessed, then earlier insertion.
 */
bool EvictsBefore(const EvictionCandidate& a, const EvictionCandidate& b);

/**
 * @brief Index of the entry to evict next, or nullopt for an empty input.
 *
 * Clean candidates are taken in eviction order. Dirty candidates are skipped
 * while any clean one remains; once only dirty ones are left, the first of
 * them in eviction order is returned and the caller must write it back
 * before removing it.
 */
std::optional<size_t> SelectEvictionCandidate(const std::vector<EvictionCandidate>& candidates);

// Indices of all candidates sorted by EvictsBefore.
std::vector<size_t> RankEvictionCandidates(const std::vector<EvictionCandidate>& candidates);

} // namespace chunkcache
