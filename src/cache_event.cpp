#include "cache_event.hpp"

namespace chunkcache {

const char* CacheEventTypeName(CacheEventType type) {
    switch (type) {
        case CacheEventType::kChunkLoaded: return "chunk_loaded";
        case CacheEventType::kChunkEvicted: return "chunk_evicted";
        case CacheEventType::kChunkSaved: return "chunk_saved";
        case CacheEventType::kChunkError: return "chunk_error";
        case CacheEventType::kCacheCleared: return "cache_cleared";
        case CacheEventType::kQueueProcessed: return "queue_processed";
    }
    return "unknown";
}

} // namespace chunkcache
