/**
 * @file DBusService.hpp
 * @brief Exports the monitor's query and command surface on D-Bus
 *
 * Structured results travel as JSON strings so clients need no knowledge
 * of GVariant signatures beyond "s".
 */

#pragma once

#include "services/MonitorService.hpp"
#include "util/Result.hpp"

#include <gio/gio.h>

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

/**
 * @class DBusService
 * @brief Owns the bus name and dispatches method calls to MonitorService
 *
 * Quick calls are answered on the main loop thread. Calls that may block
 * for seconds (SMART re-poll, waiting self-tests, webhook test) are run on
 * a worker and answered from there; workers are joined on destruction.
 */
class DBusService {
public:
    static constexpr auto BUS_NAME = "io.drivewatch.Monitor";
    static constexpr auto OBJECT_PATH = "/io/drivewatch/Monitor";
    static constexpr auto INTERFACE_NAME = "io.drivewatch.Monitor";
    static constexpr auto ERROR_PREFIX = "io.drivewatch.Error.";

    using NameLostHandler = std::function<void()>;

    explicit DBusService(std::shared_ptr<MonitorService> monitor);
    ~DBusService();

    DBusService(const DBusService&) = delete;
    DBusService& operator=(const DBusService&) = delete;

    /**
     * @brief Request the bus name; the object is registered once it is owned
     * @param bus_type G_BUS_TYPE_SESSION for a per-user monitor
     * @param on_name_lost Called if the name cannot be acquired or is lost
     */
    void start(GBusType bus_type, NameLostHandler on_name_lost);

    /**
     * @brief Unregister the object, release the name and join workers
     */
    void stop();

    /**
     * @brief Execute one method synchronously
     * @param method Method name from the introspection data
     * @param parameters Input tuple matching the method signature
     * @return Floating reply tuple owned by the caller
     */
    [[nodiscard]] auto call(std::string_view method, GVariant* parameters) -> util::Result<GVariant*>;

    /**
     * @brief Whether a method may block long enough to stall the main loop
     */
    [[nodiscard]] static auto is_blocking(std::string_view method) -> bool;

    /**
     * @brief D-Bus error name for an error kind, e.g. io.drivewatch.Error.NotFound
     */
    [[nodiscard]] static auto error_name(util::ErrorKind kind) -> std::string;

    [[nodiscard]] static auto introspection_xml() -> const char*;

private:
    static void on_method_call(GDBusConnection* connection, const gchar* sender,
                               const gchar* object_path, const gchar* interface_name,
                               const gchar* method_name, GVariant* parameters,
                               GDBusMethodInvocation* invocation, gpointer user_data);
    static void on_name_acquired(GDBusConnection* connection, const gchar* name,
                                 gpointer user_data);
    static void on_name_lost(GDBusConnection* connection, const gchar* name, gpointer user_data);

    void reply(GDBusMethodInvocation* invocation, std::string_view method, GVariant* parameters);
    void run_async(std::function<void()> job);
    void reap_jobs(bool wait);

    std::shared_ptr<MonitorService> monitor_;
    NameLostHandler name_lost_handler_;

    guint owner_id_ = 0;
    guint registration_id_ = 0;
    GDBusConnection* connection_ = nullptr;

    std::mutex jobs_mutex_;
    std::vector<std::future<void>> jobs_;
};
