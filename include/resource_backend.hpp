#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "cache_error.hpp"
#include "chunk_key.hpp"

namespace chunkcache {

/**
 * @brief Outcome of ResourceBackend::Fetch: a chunk, or an error code with a
 *        human readable message.
 */
template <typename Chunk>
struct FetchResult {
    std::optional<Chunk> chunk;
    std::error_code error;
    std::string message;

    bool ok() const { return !error && chunk.has_value(); }

    static FetchResult Success(Chunk value) {
        FetchResult result;
        result.chunk = std::move(value);
        return result;
    }

    static FetchResult Failure(std::error_code ec, std::string msg = {}) {
        FetchResult result;
        result.error = ec;
        result.message = msg.empty() ? ec.message() : std::move(msg);
        return result;
    }
};

/**
 * @brief Persistence collaborator of the chunk cache.
 *
 * Fetch and Persist may be called concurrently for distinct keys; the cache
 * never issues two overlapping fetches, or two overlapping persists, for the
 * same key. Timeouts, transport
 * and serialisation are the implementation's concern.
 */
template <typename Chunk>
class ResourceBackend {
public:
    virtual ~ResourceBackend() = default;

    // Typical failures: BackendErrc::kNotFound, BackendErrc::kTransient.
    virtual FetchResult<Chunk> Fetch(const ChunkKey& key) = 0;

    virtual std::error_code Persist(const ChunkKey& key, const Chunk& chunk) = 0;
};

} // namespace chunkcache
