#include "file_object.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace chunkcache {

namespace {

class FileHandle {
public:
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle() {
        if (fd_ >= 0) ::close(fd_);
    }
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileHandle& operator=(FileHandle&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }
    int Fd() const noexcept { return fd_; }

private:
    int fd_{-1};
};

inline FileHandle OpenOrThrow(const std::string& path, int flags, mode_t mode, const char* what) {
    int fd = ::open(path.c_str(), flags, mode);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), std::string(what) + ": " + path);
    }
    return FileHandle(fd);
}

inline uint64_t FileSize(int fd) {
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        throw std::system_error(errno, std::generic_category(), "fstat failed");
    }
    return static_cast<uint64_t>(st.st_size);
}

void WriteFully(int fd, const std::vector<uint8_t>& data) {
    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::write(fd, data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "write file failed");
        }
        done += static_cast<size_t>(n);
    }
}

}  // namespace

struct FileObjectImpl {
    FileHandle handle;
    uint64_t size;

    FileObjectImpl(FileHandle h, uint64_t s) : handle(std::move(h)), size(s) {}
};

void FileObject::WriteAtomic(const std::string& path, const std::vector<uint8_t>& data) {
    // Unique temp name per writer so concurrent writers never share a file.
    std::vector<char> name(path.begin(), path.end());
    const char suffix[] = ".tmp.XXXXXX";
    name.insert(name.end(), suffix, suffix + sizeof(suffix));
    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "create file failed: " + path);
    }
    const std::string tmp_path(name.data());
    {
        FileHandle out(fd);
        try {
            if (::fchmod(out.Fd(), 0644) != 0) {
                throw std::system_error(errno, std::generic_category(), "fchmod failed");
            }
            WriteFully(out.Fd(), data);
            if (::fsync(out.Fd()) != 0) {
                throw std::system_error(errno, std::generic_category(), "fsync failed");
            }
        } catch (const std::system_error&) {
            ::unlink(tmp_path.c_str());
            throw;
        }
    }
    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp_path.c_str());
        throw std::system_error(err, std::generic_category(), "rename failed: " + path);
    }
}

FileObject FileObject::Open(const std::string& path) {
    FileHandle handle = OpenOrThrow(path, O_RDONLY, 0, "open read-only failed");
    uint64_t size = FileSize(handle.Fd());
    FileObject obj;
    obj.impl_ = std::make_shared<FileObjectImpl>(std::move(handle), size);
    return obj;
}

std::vector<uint8_t> FileObject::Read(uint64_t offset, uint64_t len) const {
    if (!Valid()) {
        throw std::invalid_argument("invalid file object");
    }
    std::vector<uint8_t> buf(len);
    if (len == 0) {
        return buf;
    }
    ssize_t n = ::pread(impl_->handle.Fd(), buf.data(), len, static_cast<off_t>(offset));
    if (n < 0 || static_cast<uint64_t>(n) != len) {
        throw std::system_error(n < 0 ? errno : EIO, std::generic_category(), "pread failed");
    }
    return buf;
}

bool FileObject::Valid() const noexcept { return impl_ != nullptr; }
uint64_t FileObject::Size() const noexcept { return Valid() ? impl_->size : 0; }

} // namespace chunkcache
