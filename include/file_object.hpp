#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chunkcache {

/**
 * @brief RAII wrapper over a read-only POSIX file, used by FileChunkStore.
 *
 * Files are written with WriteAtomic (temp file, fsync, rename) and read back
 * through Open/Read/ReadAll. Failures throw std::system_error.
 */
class FileObject {
public:
    // Default ctor creates an invalid handle.
    FileObject() noexcept = default;

    // Move-only (copy disabled)
    FileObject(const FileObject&) = delete;
    FileObject& operator=(const FileObject&) = delete;
    FileObject(FileObject&& other) noexcept = default;
    FileObject& operator=(FileObject&& other) noexcept = default;

    ~FileObject() = default;

    /**
     * @brief Replace the file at `path` with `data`. The content is written to
     *        a unique `path + ".tmp.XXXXXX"` file, synced and renamed over the
     *        target, so readers see either the old or the new file, never a
     *        partial one.
     */
    static void WriteAtomic(const std::string& path, const std::vector<uint8_t>& data);

    /**
     * @brief Open an existing file as read-only.
     */
    static FileObject Open(const std::string& path);

    /**
     * @brief Read `len` bytes starting from `offset`.
     */
    std::vector<uint8_t> Read(uint64_t offset, uint64_t len) const;

    std::vector<uint8_t> ReadAll() const { return Read(0, Size()); }

    /**
     * @brief Total file size in bytes.
     */
    uint64_t Size() const noexcept;

    bool Valid() const noexcept;

private:
    std::shared_ptr<struct FileObjectImpl> impl_;
};

} // namespace chunkcache
