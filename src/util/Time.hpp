/**
 * @file Time.hpp
 * @brief Wall-clock helpers shared by the state model and persistence
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace util {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

[[nodiscard]] inline auto to_unix_seconds(TimePoint tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline auto from_unix_seconds(int64_t seconds) -> TimePoint {
    return TimePoint{std::chrono::seconds{seconds}};
}

/**
 * @brief Format a time point as local "YYYY-MM-DD HH:MM:SS"
 */
[[nodiscard]] inline auto format_local(TimePoint tp) -> std::string {
    auto time_t_value = Clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&time_t_value, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

/**
 * @brief Format a time point as a local date "YYYY-MM-DD"
 */
[[nodiscard]] inline auto format_date(TimePoint tp) -> std::string {
    return format_local(tp).substr(0, 10);
}

}  // namespace util
