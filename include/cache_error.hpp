#pragma once

#include <string>
#include <system_error>
#include <type_traits>

#include "chunk_key.hpp"

namespace chunkcache {

/**
 * @brief Outcome classes reported by the chunk cache.
 *
 * kAlreadyLoading is informational (a fetch for the key is queued or in
 * flight). kCacheExhausted is fatal for the operation that hit it: the cache
 * is over capacity and no candidate could be freed without losing data.
 */
enum class CacheErrc {
    kAlreadyLoading = 1,
    kNotFound,
    kFetchFailed,
    kPersistFailed,
    kCacheExhausted,
};

// Errors a ResourceBackend reports for a single key.
enum class BackendErrc {
    kNotFound = 1,
    kTransient,
    kCorrupted,
    kIoError,
};

const std::error_category& cache_category() noexcept;
const std::error_category& backend_category() noexcept;

std::error_code make_error_code(CacheErrc e) noexcept;
std::error_code make_error_code(BackendErrc e) noexcept;

// Result of one per-key step inside a bulk operation.
struct KeyResult {
    ChunkKey key;
    std::error_code error;
    std::string message;

    bool ok() const { return !error; }
};

} // namespace chunkcache

namespace std {
template <>
struct is_error_code_enum<chunkcache::CacheErrc> : true_type {};
template <>
struct is_error_code_enum<chunkcache::BackendErrc> : true_type {};
} // namespace std
