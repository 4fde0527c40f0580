/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors
 *
 * Used by the SMART ioctl layer (device nodes) and the atomic file writer
 * (temporary files and directory fsync).
 */

#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <string>
#include <utility>

#include "util/Result.hpp"

namespace util {

/**
 * @class FileDescriptor
 * @brief Owns a raw descriptor and closes it on destruction
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    /**
     * @brief Open a path with ::open, retrying on EINTR
     * @param path Filesystem path
     * @param flags open(2) flags; O_CLOEXEC is always added
     * @param mode Permissions when O_CREAT is given
     * @return Descriptor, or NotFound / ProviderUnavailable with errno
     */
    [[nodiscard]] static auto open(const std::string& path, int flags, mode_t mode = 0644)
        -> Result<FileDescriptor> {
        int fd = -1;
        do {
            fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
        } while (fd < 0 && errno == EINTR);

        if (fd < 0) {
            const int err = errno;
            auto kind = err == ENOENT ? ErrorKind::NotFound : ErrorKind::ProviderUnavailable;
            return fail(kind, std::format("open {}: {}", path, std::strerror(err)), err);
        }
        return FileDescriptor{fd};
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }
    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Give up ownership without closing
     */
    [[nodiscard]] auto release() noexcept -> int { return std::exchange(fd_, -1); }

    void reset() noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

}  // namespace util
