#include "cache_error.hpp"

namespace chunkcache {

namespace {

class CacheCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "chunk_cache"; }

    std::string message(int ev) const override {
        switch (static_cast<CacheErrc>(ev)) {
            case CacheErrc::kAlreadyLoading:
                return "chunk is already queued or loading";
            case CacheErrc::kNotFound:
                return "chunk is not cached";
            case CacheErrc::kFetchFailed:
                return "fetching chunk from backend failed";
            case CacheErrc::kPersistFailed:
                return "persisting chunk to backend failed";
            case CacheErrc::kCacheExhausted:
                return "cache full, all eviction candidates dirty and unwritable";
        }
        return "unknown chunk cache error";
    }
};

class BackendCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "chunk_backend"; }

    std::string message(int ev) const override {
        switch (static_cast<BackendErrc>(ev)) {
            case BackendErrc::kNotFound:
                return "chunk does not exist in backend";
            case BackendErrc::kTransient:
                return "transient backend failure";
            case BackendErrc::kCorrupted:
                return "stored chunk is corrupted";
            case BackendErrc::kIoError:
                return "backend I/O error";
        }
        return "unknown backend error";
    }
};

} // namespace

const std::error_category& cache_category() noexcept {
    static const CacheCategory category;
    return category;
}

const std::error_category& backend_category() noexcept {
    static const BackendCategory category;
    return category;
}

std::error_code make_error_code(CacheErrc e) noexcept {
    return {static_cast<int>(e), cache_category()};
}

std::error_code make_error_code(BackendErrc e) noexcept {
    return {static_cast<int>(e), backend_category()};
}

} // namespace chunkcache
