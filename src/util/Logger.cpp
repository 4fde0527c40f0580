/**
 * @file Logger.cpp
 * @brief Thread-safe logger implementation
 */

#include "util/Logger.hpp"

#include <chrono>
#include <cstdlib>
#include <format>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace util {

namespace fs = std::filesystem;

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

auto Logger::default_log_dir() -> fs::path {
    if (const char* state_home = std::getenv("XDG_STATE_HOME"); state_home && *state_home) {
        return fs::path{state_home} / "drivewatch";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path{home} / ".local" / "state" / "drivewatch";
    }
    return fs::temp_directory_path() / "drivewatch";
}

auto Logger::initialize(const fs::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    policy_ = policy;
    current_file_size_ = 0;

    std::error_code ec;
    fs::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "Logger: cannot create log directory " << log_dir_ << ": " << ec.message()
                  << std::endl;
        return false;
    }

    if (!open_log_file()) {
        return false;
    }

    initialized_ = true;
    file_ << get_timestamp() << "[INFO ] [Logger] opened " << (log_dir_ / (app_name_ + ".log")).string()
          << " level=" << level_to_string(min_level_) << std::endl;
    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::open_log_file() -> bool {
    auto log_path = log_dir_ / (app_name_ + ".log");

    file_.open(log_path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Logger: cannot open log file " << log_path << std::endl;
        return false;
    }

    std::error_code ec;
    current_file_size_ = fs::file_size(log_path, ec);
    if (ec) {
        current_file_size_ = 0;
    }
    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    LogSink sink;
    {
        std::lock_guard lock(mutex_);
        if (level < min_level_) {
            return;
        }

        auto line = std::format("{}[{}] [{}] {}\n", get_timestamp(), level_to_string(level),
                                component, message);

        if (initialized_ && file_.is_open()) {
            rotate_if_needed();
            file_ << line;
            file_.flush();
            current_file_size_ += line.size();
        }

        if (console_output_) {
            std::cerr << line;
        }
        sink = sink_;
    }

    if (sink) {
        sink(level, component, message);
    }
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

void Logger::set_sink(LogSink sink) {
    std::lock_guard lock(mutex_);
    sink_ = std::move(sink);
}

auto Logger::get_log_file_path() const -> fs::path {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return {};
    }
    return log_dir_ / (app_name_ + ".log");
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (initialized_ && file_.is_open()) {
        file_ << get_timestamp() << "[INFO ] [Logger] closing" << std::endl;
        file_.close();
    }
    initialized_ = false;
}

auto Logger::get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count() << "Z ";
    return oss.str();
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

void Logger::rotate_if_needed() {
    if (current_file_size_ < policy_.max_file_size_bytes) {
        return;
    }

    file_.close();

    std::error_code ec;
    auto rotated = [this](int index) {
        return log_dir_ / std::format("{}.{}.log", app_name_, index);
    };

    fs::remove(rotated(policy_.max_files), ec);
    for (int i = policy_.max_files - 1; i >= 1; --i) {
        if (fs::exists(rotated(i), ec)) {
            fs::rename(rotated(i), rotated(i + 1), ec);
        }
    }
    fs::rename(log_dir_ / (app_name_ + ".log"), rotated(1), ec);

    if (open_log_file()) {
        file_ << get_timestamp() << "[INFO ] [Logger] log rotated" << std::endl;
    }
}

}  // namespace util
