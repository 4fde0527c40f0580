/**
 * @file DesktopNotifier.hpp
 * @brief Desktop notifications over the org.freedesktop.Notifications bus API
 */

#pragma once

#include "interfaces/INotificationChannel.hpp"

#include <gio/gio.h>

#include <mutex>
#include <string>

/**
 * @class DesktopNotifier
 * @brief Sends one desktop notification per alert event on the session bus
 *
 * The bus connection is opened lazily on first delivery and reused. A
 * missing session bus or notification daemon is a delivery failure, not
 * an error that reaches the alert engine.
 */
class DesktopNotifier : public INotificationChannel {
public:
    DesktopNotifier() = default;
    ~DesktopNotifier() override;

    DesktopNotifier(const DesktopNotifier&) = delete;
    DesktopNotifier& operator=(const DesktopNotifier&) = delete;

    [[nodiscard]] auto name() const -> std::string_view override { return "desktop"; }

    [[nodiscard]] auto is_enabled(const NotificationsConfig& config) const -> bool override {
        return config.desktop;
    }

    auto deliver(const AlertEvent& event, const NotificationsConfig& config)
        -> util::Result<void> override;

    /**
     * @brief freedesktop urgency hint: 1 normal, 2 critical
     */
    [[nodiscard]] static auto urgency_for(Severity severity) -> guchar;

    [[nodiscard]] static auto summary_for(const AlertEvent& event) -> std::string;
    [[nodiscard]] static auto body_for(const AlertEvent& event) -> std::string;

private:
    auto ensure_connection() -> util::Result<GDBusConnection*>;

    std::mutex mutex_;
    GDBusConnection* connection_ = nullptr;
};
