#include "file_chunk_store.hpp"

#include <zlib.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "cache_error.hpp"
#include "file_object.hpp"
#include "logger.hpp"

namespace chunkcache {

namespace {

constexpr size_t kHeaderSize = 8;
constexpr size_t kTrailerSize = 4;

void PutU32(std::vector<uint8_t>& buf, uint32_t v) {
    // Little-endian format (least significant byte first)
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

uint32_t GetU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

uint32_t Checksum(const uint8_t* data, size_t len) {
    uLong crc = ::crc32(0UL, Z_NULL, 0);
    // crc32() takes a uInt length; feed large buffers in pieces.
    constexpr size_t kStep = 1U << 30;
    while (len > 0) {
        size_t n = std::min(len, kStep);
        crc = ::crc32(crc, data, static_cast<uInt>(n));
        data += n;
        len -= n;
    }
    return static_cast<uint32_t>(crc);
}

bool ValidOwnerId(const std::string& owner_id) {
    if (owner_id.empty() || owner_id == "." || owner_id == "..") {
        return false;
    }
    return owner_id.find('/') == std::string::npos &&
           owner_id.find('\\') == std::string::npos &&
           owner_id.find('\0') == std::string::npos;
}

}  // namespace

FileChunkStore::FileChunkStore(std::filesystem::path root, uint64_t max_payload_size)
    : root_(std::move(root)), max_payload_size_(std::min(max_payload_size, kMaxPayloadSize)) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw std::system_error(ec, "cannot create chunk store root " + root_.string());
    }
}

std::filesystem::path FileChunkStore::PathFor(const ChunkKey& key) const {
    if (!ValidOwnerId(key.OwnerId())) {
        return {};
    }
    return root_ / key.OwnerId() /
           (std::to_string(key.X()) + "_" + std::to_string(key.Y()) + ".chunk");
}

std::vector<uint8_t> FileChunkStore::EncodeRecord(const ChunkBytes& payload) {
    if (payload.size() > kMaxPayloadSize) {
        throw std::length_error("chunk payload of " + std::to_string(payload.size()) +
                                " bytes does not fit a record");
    }
    std::vector<uint8_t> buf;
    buf.reserve(kHeaderSize + payload.size() + kTrailerSize);
    PutU32(buf, kMagic);
    PutU32(buf, static_cast<uint32_t>(payload.size()));
    buf.insert(buf.end(), payload.begin(), payload.end());
    PutU32(buf, Checksum(payload.data(), payload.size()));
    return buf;
}

ChunkBytes FileChunkStore::DecodeRecord(const std::vector<uint8_t>& record) {
    if (record.size() < kHeaderSize + kTrailerSize) {
        throw std::invalid_argument("chunk record too small");
    }
    if (GetU32(record.data()) != kMagic) {
        throw std::invalid_argument("bad chunk record magic");
    }
    uint32_t len = GetU32(record.data() + 4);
    if (record.size() != kHeaderSize + static_cast<size_t>(len) + kTrailerSize) {
        throw std::invalid_argument("chunk record length mismatch: header says " +
                                    std::to_string(len) + ", file holds " +
                                    std::to_string(record.size() - kHeaderSize - kTrailerSize));
    }
    const uint8_t* payload = record.data() + kHeaderSize;
    uint32_t stored = GetU32(payload + len);
    if (stored != Checksum(payload, len)) {
        throw std::invalid_argument("chunk record checksum mismatch");
    }
    return ChunkBytes(payload, payload + len);
}

FetchResult<ChunkBytes> FileChunkStore::Fetch(const ChunkKey& key) {
    auto path = PathFor(key);
    if (path.empty()) {
        return FetchResult<ChunkBytes>::Failure(make_error_code(BackendErrc::kIoError),
                                                "invalid owner id '" + key.OwnerId() + "'");
    }
    std::error_code exists_ec;
    if (!std::filesystem::exists(path, exists_ec)) {
        if (exists_ec) {
            return FetchResult<ChunkBytes>::Failure(make_error_code(BackendErrc::kIoError),
                                                    exists_ec.message());
        }
        return FetchResult<ChunkBytes>::Failure(make_error_code(BackendErrc::kNotFound),
                                                "no stored chunk " + key.ToString());
    }

    std::vector<uint8_t> record;
    try {
        record = FileObject::Open(path.string()).ReadAll();
    } catch (const std::system_error& e) {
        LOG_WARNING("reading %s failed: %s", path.c_str(), e.what());
        return FetchResult<ChunkBytes>::Failure(make_error_code(BackendErrc::kIoError), e.what());
    }

    try {
        return FetchResult<ChunkBytes>::Success(DecodeRecord(record));
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("corrupted chunk file %s: %s", path.c_str(), e.what());
        return FetchResult<ChunkBytes>::Failure(make_error_code(BackendErrc::kCorrupted), e.what());
    }
}

std::error_code FileChunkStore::Persist(const ChunkKey& key, const ChunkBytes& chunk) {
    auto path = PathFor(key);
    if (path.empty()) {
        LOG_WARNING("refusing to persist %s: invalid owner id", key.ToString().c_str());
        return make_error_code(BackendErrc::kIoError);
    }
    if (chunk.size() > max_payload_size_) {
        LOG_WARNING("refusing to persist %s: %zu bytes exceeds the %llu byte limit",
                    key.ToString().c_str(), chunk.size(),
                    static_cast<unsigned long long>(max_payload_size_));
        return make_error_code(BackendErrc::kIoError);
    }
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        LOG_WARNING("creating %s failed: %s", path.parent_path().c_str(), ec.message().c_str());
        return make_error_code(BackendErrc::kIoError);
    }
    try {
        FileObject::WriteAtomic(path.string(), EncodeRecord(chunk));
    } catch (const std::system_error& e) {
        LOG_WARNING("writing %s failed: %s", path.c_str(), e.what());
        return make_error_code(BackendErrc::kIoError);
    }
    return {};
}

bool FileChunkStore::Exists(const ChunkKey& key) const {
    auto path = PathFor(key);
    std::error_code ec;
    return !path.empty() && std::filesystem::exists(path, ec);
}

std::error_code FileChunkStore::Remove(const ChunkKey& key) {
    auto path = PathFor(key);
    if (path.empty()) {
        return make_error_code(BackendErrc::kIoError);
    }
    std::error_code ec;
    if (!std::filesystem::remove(path, ec)) {
        return ec ? make_error_code(BackendErrc::kIoError) : make_error_code(BackendErrc::kNotFound);
    }
    return {};
}

} // namespace chunkcache
