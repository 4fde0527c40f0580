/**
 * @file Logger.hpp
 * @brief Thread-safe logger for the monitor daemon
 *
 * Writes one line per event with an ISO 8601 UTC timestamp, the level and
 * the emitting component, rotating the file once it grows past a size
 * limit. An optional sink receives every accepted entry; tests use it to
 * observe failures that are logged instead of propagated.
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-poll detail
    INFO,     ///< Lifecycle and state transitions
    WARNING,  ///< Degraded domains, rejected reloads, failed deliveries
    ERROR     ///< Failures that lose data or functionality
};

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 5 * 1024 * 1024;  ///< Rotate after 5MB
    int max_files = 5;                              ///< Rotated files kept
};

/**
 * @brief Receives every entry at or above the minimum level
 */
using LogSink = std::function<void(LogLevel, std::string_view component, std::string_view message)>;

/**
 * @class Logger
 * @brief Process-wide logger with file output, rotation and an observer sink
 *
 * Usage:
 * @code
 * auto& log = util::Logger::instance();
 * log.initialize(util::Logger::default_log_dir(), "drivewatch");
 * LOG_WARNING("PollingScheduler", std::format("SMART fetch for {} timed out", id));
 * @endcode
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Directory used when none is configured
     * @return $XDG_STATE_HOME/drivewatch, or ~/.local/state/drivewatch
     */
    [[nodiscard]] static auto default_log_dir() -> std::filesystem::path;

    /**
     * @brief Open {log_dir}/{app_name}.log for appending
     * @return true if the file could be opened
     *
     * Rotated files are named {app_name}.1.log ... {app_name}.N.log.
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO, LogRotationPolicy policy = {}) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Mirror entries to stderr (used by the daemon in foreground mode)
     */
    void set_console_output(bool enable);

    /**
     * @brief Install or clear (nullptr) the observer sink
     *
     * The sink is invoked outside the logger lock and must not log itself.
     */
    void set_sink(LogSink sink);

    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    void flush();
    void shutdown();

    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto get_timestamp() -> std::string;

    void rotate_if_needed();
    auto open_log_file() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    LogSink sink_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t current_file_size_ = 0;
};

#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
