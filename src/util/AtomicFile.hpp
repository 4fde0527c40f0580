/**
 * @file AtomicFile.hpp
 * @brief Crash-safe file primitives for persisted monitor data
 *
 * Persisted files are either replaced whole (write to a temporary file in
 * the same directory, fsync, rename over the target, fsync the directory)
 * or appended to one line at a time. Nothing is ever rewritten in place.
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "util/Result.hpp"

namespace util {

/**
 * @brief write(2) that retries on EINTR/EAGAIN and short writes
 * @return true once all bytes are written
 */
auto write_all(int fd, const void* buffer, size_t size) -> bool;

/**
 * @brief Replace a file's contents atomically
 * @param path Target file; parent directories are created
 * @param contents New contents
 * @return PersistenceWriteFailed on any I/O error; the old file is intact
 */
auto write_file_atomic(const std::filesystem::path& path, std::string_view contents)
    -> Result<void>;

/**
 * @brief Append one line (a trailing newline is added) with O_APPEND
 */
auto append_line(const std::filesystem::path& path, std::string_view line) -> Result<void>;

/**
 * @brief Read a whole file
 * @return NotFound if the file does not exist
 */
auto read_file(const std::filesystem::path& path) -> Result<std::string>;

}  // namespace util
