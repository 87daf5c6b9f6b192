#include "options.hpp"

#include <stdexcept>
#include <string>

namespace chunkcache {

void ChunkCacheOptions::Validate() const {
    if (chunk_size <= 0) {
        throw std::invalid_argument("chunk_size must be positive, got " + std::to_string(chunk_size));
    }
    if (max_cached_chunks == 0) {
        throw std::invalid_argument("max_cached_chunks must be at least 1");
    }
    if (preload_radius < 0) {
        throw std::invalid_argument("preload_radius must not be negative, got " +
                                    std::to_string(preload_radius));
    }
    if (priority_levels < 1) {
        throw std::invalid_argument("priority_levels must be at least 1, got " +
                                    std::to_string(priority_levels));
    }
    if (loading_batch_size == 0) {
        throw std::invalid_argument("loading_batch_size must be at least 1");
    }
}

} // namespace chunkcache
