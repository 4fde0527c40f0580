/**
 * @file DesktopNotifier.cpp
 * @brief org.freedesktop.Notifications client
 */

#include "services/DesktopNotifier.hpp"

#include <format>

namespace {
    constexpr auto NOTIFY_NAME = "org.freedesktop.Notifications";
    constexpr auto NOTIFY_PATH = "/org/freedesktop/Notifications";
    constexpr auto NOTIFY_INTERFACE = "org.freedesktop.Notifications";
    constexpr auto APP_NAME = "drivewatch";
    constexpr auto APP_ICON = "drive-harddisk";
    constexpr int NOTIFY_TIMEOUT_MS = 5000;
    constexpr int EXPIRE_DEFAULT = -1;
}

DesktopNotifier::~DesktopNotifier() {
    if (connection_) {
        g_object_unref(connection_);
        connection_ = nullptr;
    }
}

auto DesktopNotifier::urgency_for(Severity severity) -> guchar {
    return severity == Severity::Crit ? 2 : 1;
}

auto DesktopNotifier::summary_for(const AlertEvent& event) -> std::string {
    if (event.escalation) {
        return std::format("drivewatch: {} escalated to critical", event.display_name);
    }
    return std::format("drivewatch: {} alert on {}",
                       event.alert.severity == Severity::Crit ? "critical" : "warning",
                       event.display_name);
}

auto DesktopNotifier::body_for(const AlertEvent& event) -> std::string {
    return std::format("[{}] {}: {}", to_string(event.alert.rule), event.display_name,
                       event.alert.message);
}

auto DesktopNotifier::ensure_connection() -> util::Result<GDBusConnection*> {
    if (connection_) {
        return connection_;
    }

    GError* error = nullptr;
    connection_ = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &error);
    if (!connection_) {
        auto message = std::format("session bus unavailable: {}", error ? error->message : "unknown");
        g_clear_error(&error);
        return util::fail(util::ErrorKind::NotificationDeliveryFailed, std::move(message));
    }
    return connection_;
}

auto DesktopNotifier::deliver(const AlertEvent& event, const NotificationsConfig& /*config*/)
    -> util::Result<void> {
    std::lock_guard lock(mutex_);

    auto connection = ensure_connection();
    if (!connection) {
        return std::unexpected(connection.error());
    }

    GVariantBuilder hints;
    g_variant_builder_init(&hints, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&hints, "{sv}", "urgency",
                          g_variant_new_byte(urgency_for(event.alert.severity)));
    g_variant_builder_add(&hints, "{sv}", "category", g_variant_new_string("device"));

    GVariantBuilder actions;
    g_variant_builder_init(&actions, G_VARIANT_TYPE("as"));

    const auto summary = summary_for(event);
    const auto body = body_for(event);

    GError* error = nullptr;
    GVariant* result = g_dbus_connection_call_sync(
        *connection,
        NOTIFY_NAME,
        NOTIFY_PATH,
        NOTIFY_INTERFACE,
        "Notify",
        g_variant_new("(susssasa{sv}i)",
            APP_NAME,
            static_cast<guint32>(0),  // replaces_id
            APP_ICON,
            summary.c_str(),
            body.c_str(),
            &actions,
            &hints,
            EXPIRE_DEFAULT),
        G_VARIANT_TYPE("(u)"),
        G_DBUS_CALL_FLAGS_NONE,
        NOTIFY_TIMEOUT_MS,
        nullptr,
        &error
    );

    if (!result) {
        auto message = std::format("Notify failed: {}", error ? error->message : "unknown");
        g_clear_error(&error);
        return util::fail(util::ErrorKind::NotificationDeliveryFailed, std::move(message));
    }

    g_variant_unref(result);
    return {};
}
