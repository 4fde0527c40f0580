/**
 * @file Result.hpp
 * @brief Error taxonomy and expected-based result alias
 *
 * Every fallible operation in the monitor returns util::Result<T>, an
 * std::expected carrying a util::Error on failure. The ErrorKind tells the
 * caller how to react (retry next cadence, keep the old config, log and
 * move on) without inspecting message text.
 */

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace util {

/**
 * @enum ErrorKind
 * @brief Closed set of failure categories raised by the monitor
 */
enum class ErrorKind {
    ProviderUnavailable,         ///< Domain tool or driver missing; domain marked stale
    TransientFetchError,         ///< Single poll failed or timed out; retried next cadence
    ConfigInvalid,               ///< Configuration rejected; previous config stays active
    NotificationDeliveryFailed,  ///< Desktop or webhook delivery failed; logged only
    PersistenceWriteFailed,      ///< File write failed; in-memory state stays authoritative
    SelfTestTimeout,             ///< Self-test exceeded its allowed duration
    NotFound,                    ///< Unknown device, alert or file
    InvalidArgument              ///< Caller passed an unusable value
};

/**
 * @brief Get a stable name for an error kind
 * @param kind Error kind
 * @return Name used in log lines (e.g., "ProviderUnavailable")
 */
[[nodiscard]] constexpr auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::ProviderUnavailable:
            return "ProviderUnavailable";
        case ErrorKind::TransientFetchError:
            return "TransientFetchError";
        case ErrorKind::ConfigInvalid:
            return "ConfigInvalid";
        case ErrorKind::NotificationDeliveryFailed:
            return "NotificationDeliveryFailed";
        case ErrorKind::PersistenceWriteFailed:
            return "PersistenceWriteFailed";
        case ErrorKind::SelfTestTimeout:
            return "SelfTestTimeout";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}

/**
 * @struct Error
 * @brief Represents a failure with its category, message and optional errno
 */
struct Error {
    ErrorKind kind = ErrorKind::TransientFetchError;
    std::string message;
    int code = 0;

    Error() = default;
    Error(ErrorKind err_kind, std::string msg, int err_code = 0)
        : kind(err_kind), message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }
};

/**
 * @brief Result of a fallible operation
 *
 * @example
 * ```cpp
 * auto load() -> util::Result<Config> {
 *     if (!exists) {
 *         return util::fail(util::ErrorKind::NotFound, "no config file");
 *     }
 *     return config;
 * }
 * ```
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Build an unexpected value for a Result return
 * @param kind Error category
 * @param message Human-readable description
 * @param code Optional errno or protocol status
 */
[[nodiscard]] inline auto fail(ErrorKind kind, std::string message, int code = 0)
    -> std::unexpected<Error> {
    return std::unexpected(Error{kind, std::move(message), code});
}

}  // namespace util
