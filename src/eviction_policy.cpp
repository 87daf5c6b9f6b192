#include "eviction_policy.hpp"

#include <algorithm>
#include <numeric>

namespace chunkcache {

bool EvictsBefore(const EvictionCandidate& a, const EvictionCandidate& b) {
    if (a.priority != b.priority) {
        return a.priority > b.priority;
    }
    if (a.last_accessed != b.last_accessed) {
        return a.last_accessed < b.last_accessed;
    }
    return a.sequence < b.sequence;
}

std::optional<size_t> SelectEvictionCandidate(const std::vector<EvictionCandidate>& candidates) {
    std::optional<size_t> best_clean;
    std::optional<size_t> best_dirty;
    for (size_t i = 0; i < candidates.size(); ++i) {
        auto& slot = candidates[i].dirty ? best_dirty : best_clean;
        if (!slot || EvictsBefore(candidates[i], candidates[*slot])) {
            slot = i;
        }
    }
    return best_clean ? best_clean : best_dirty;
}

std::vector<size_t> RankEvictionCandidates(const std::vector<EvictionCandidate>& candidates) {
    std::vector<size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&candidates](size_t lhs, size_t rhs) {
        return EvictsBefore(candidates[lhs], candidates[rhs]);
    });
    return order;
}

} // namespace chunkcache
