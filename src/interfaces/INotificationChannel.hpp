/**
 * @file INotificationChannel.hpp
 * @brief Interface for one notification side channel (desktop, webhook)
 */

#pragma once

#include "models/Alert.hpp"
#include "models/Config.hpp"
#include "util/Result.hpp"

#include <string_view>

class INotificationChannel {
public:
    virtual ~INotificationChannel() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Whether this channel is configured at all
     */
    [[nodiscard]] virtual auto is_enabled(const NotificationsConfig& config) const -> bool = 0;

    /**
     * @brief Deliver one event
     * @return NotificationDeliveryFailed on any failure
     */
    virtual auto deliver(const AlertEvent& event, const NotificationsConfig& config)
        -> util::Result<void> = 0;
};
