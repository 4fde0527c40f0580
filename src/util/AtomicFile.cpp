/**
 * @file AtomicFile.cpp
 * @brief Atomic replace and append-only writes
 */

#include "util/AtomicFile.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"

namespace util {

namespace fs = std::filesystem;

namespace {

auto io_error(std::string_view what, const fs::path& path, int err) -> std::unexpected<Error> {
    return fail(ErrorKind::PersistenceWriteFailed,
                std::format("{} {}: {}", what, path.string(), std::strerror(err)), err);
}

auto ensure_parent(const fs::path& path) -> Result<void> {
    if (!path.has_parent_path()) {
        return {};
    }
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return fail(ErrorKind::PersistenceWriteFailed,
                    std::format("create {}: {}", path.parent_path().string(), ec.message()),
                    ec.value());
    }
    return {};
}

}  // namespace

auto write_all(int fd, const void* buffer, size_t size) -> bool {
    const auto* bytes = static_cast<const char*>(buffer);
    size_t written = 0;
    while (written < size) {
        const auto result = ::write(fd, bytes + written, size - written);
        if (result < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(result);
    }
    return true;
}

auto write_file_atomic(const fs::path& path, std::string_view contents) -> Result<void> {
    if (auto parent = ensure_parent(path); !parent) {
        return parent;
    }

    auto tmp_path = path;
    tmp_path += std::format(".tmp.{}", ::getpid());

    {
        auto fd = FileDescriptor::open(tmp_path.string(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
        if (!fd) {
            return fail(ErrorKind::PersistenceWriteFailed, fd.error().message, fd.error().code);
        }

        if (!write_all(fd->get(), contents.data(), contents.size())) {
            const int err = errno;
            ::unlink(tmp_path.c_str());
            return io_error("write", tmp_path, err);
        }
        if (::fsync(fd->get()) != 0) {
            const int err = errno;
            ::unlink(tmp_path.c_str());
            return io_error("fsync", tmp_path, err);
        }
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return io_error("rename", path, err);
    }

    // The rename is durable only once the directory entry is flushed.
    auto dir = path.has_parent_path() ? path.parent_path() : fs::path{"."};
    if (auto dir_fd = FileDescriptor::open(dir.string(), O_RDONLY | O_DIRECTORY); dir_fd) {
        if (::fsync(dir_fd->get()) != 0) {
            LOG_WARNING("AtomicFile", std::format("directory fsync failed for {}: {}",
                                                  dir.string(), std::strerror(errno)));
        }
    }
    return {};
}

auto append_line(const fs::path& path, std::string_view line) -> Result<void> {
    if (auto parent = ensure_parent(path); !parent) {
        return parent;
    }

    auto fd = FileDescriptor::open(path.string(), O_WRONLY | O_CREAT | O_APPEND, 0600);
    if (!fd) {
        return fail(ErrorKind::PersistenceWriteFailed, fd.error().message, fd.error().code);
    }

    std::string buffer{line};
    buffer.push_back('\n');
    if (!write_all(fd->get(), buffer.data(), buffer.size())) {
        return io_error("append", path, errno);
    }
    return {};
}

auto read_file(const fs::path& path) -> Result<std::string> {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return fail(ErrorKind::NotFound, std::format("{} does not exist", path.string()));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail(ErrorKind::PersistenceWriteFailed, std::format("cannot read {}", path.string()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace util
