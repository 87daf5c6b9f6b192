#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "chunk_key.hpp"
#include "resource_backend.hpp"

namespace chunkcache {

using ChunkBytes = std::vector<uint8_t>;

/**
 * @brief ResourceBackend that keeps one file per chunk under a root directory.
 *
 * Layout: <root>/<owner_id>/<x>_<y>.chunk. Each file holds
 *
 *   | magic (u32) | payload length (u32) | payload | crc32(payload) (u32) |
 *
 * little-endian, checksum from zlib. Writes go through a temp file and a
 * rename. The payload is opaque; encoding chunk content is the caller's job.
 */
class FileChunkStore : public ResourceBackend<ChunkBytes> {
public:
    static constexpr uint32_t kMagic = 0x4B4E4843;  // "CHNK"
    // The record length field is 32 bits wide.
    static constexpr uint64_t kMaxPayloadSize = UINT32_MAX;

    // Creates root if missing; throws std::system_error when it cannot.
    // Persist refuses payloads above max_payload_size (capped at kMaxPayloadSize).
    explicit FileChunkStore(std::filesystem::path root,
                            uint64_t max_payload_size = kMaxPayloadSize);

    FetchResult<ChunkBytes> Fetch(const ChunkKey& key) override;
    std::error_code Persist(const ChunkKey& key, const ChunkBytes& chunk) override;

    bool Exists(const ChunkKey& key) const;
    std::error_code Remove(const ChunkKey& key);

    // Empty path for owner ids that would escape the root directory.
    std::filesystem::path PathFor(const ChunkKey& key) const;

    const std::filesystem::path& Root() const { return root_; }
    uint64_t MaxPayloadSize() const { return max_payload_size_; }

    // Throws std::length_error for payloads above kMaxPayloadSize.
    static std::vector<uint8_t> EncodeRecord(const ChunkBytes& payload);
    // Throws std::invalid_argument on a malformed or corrupted record.
    static ChunkBytes DecodeRecord(const std::vector<uint8_t>& record);

private:
    std::filesystem::path root_;
    uint64_t max_payload_size_;
};

} // namespace chunkcache
