/**
 * @file main.cpp
 * @brief drivewatchd: storage health monitor daemon
 *
 * Polls SMART, I/O, filesystem, NFS and md RAID state, raises alerts,
 * sends notifications and answers queries on D-Bus until SIGINT or
 * SIGTERM.
 */

#include "daemon/DBusService.hpp"
#include "daemon/DaemonOptions.hpp"
#include "providers/LinuxProvider.hpp"
#include "services/ConfigStore.hpp"
#include "services/DesktopNotifier.hpp"
#include "services/MonitorService.hpp"
#include "services/PersistenceLayer.hpp"
#include "services/WebhookNotifier.hpp"
#include "util/Logger.hpp"

#include <glib-unix.h>
#include <glib.h>

#include <csignal>
#include <format>
#include <memory>

namespace {

auto on_shutdown_signal(gpointer user_data) -> gboolean {
    LOG_INFO("main", "shutdown requested");
    g_main_loop_quit(static_cast<GMainLoop*>(user_data));
    return G_SOURCE_CONTINUE;
}

}  // namespace

int main(int argc, char* argv[]) {
    g_set_prgname("drivewatchd");

    auto options = parse_daemon_options(argc, argv);
    if (!options) {
        g_printerr("drivewatchd: %s\n", options.error().message.c_str());
        return 2;
    }

    auto& logger = util::Logger::instance();
    const bool file_available =
        logger.initialize(util::Logger::default_log_dir(), "drivewatchd",
                          log_setup_for(*options, true).level);
    if (!file_available) {
        g_printerr("drivewatchd: log file unavailable, logging to stderr only\n");
    }
    const auto setup = log_setup_for(*options, file_available);
    logger.set_min_level(setup.level);
    logger.set_console_output(setup.console);
    LOG_INFO("main", "drivewatchd starting");

    auto config_store =
        std::make_shared<ConfigStore>(options->config_path.value_or(ConfigStore::default_path()));
    if (auto loaded = config_store->load(); !loaded) {
        LOG_WARNING("main", std::format("configuration problem, using defaults: {}",
                                        loaded.error().message));
    }
    config_store->start_reload_timer();

    auto persistence =
        std::make_shared<PersistenceLayer>(resolve_data_dir(*options, *config_store->current()));
    auto provider = std::make_shared<LinuxProvider>();
    std::vector<std::shared_ptr<INotificationChannel>> channels{
        std::make_shared<DesktopNotifier>(), std::make_shared<WebhookNotifier>()};

    auto monitor = std::make_shared<MonitorService>(config_store, provider, persistence, channels);
    if (auto initialized = monitor->initialize(); !initialized) {
        LOG_WARNING("main", std::format("starting with partially restored state: {}",
                                        initialized.error().message));
    }
    monitor->start();

    GMainLoop* loop = g_main_loop_new(nullptr, FALSE);

    DBusService dbus(monitor);
    dbus.start(options->system_bus ? G_BUS_TYPE_SYSTEM : G_BUS_TYPE_SESSION,
               [loop] { g_main_loop_quit(loop); });

    const guint sigint_id = g_unix_signal_add(SIGINT, on_shutdown_signal, loop);
    const guint sigterm_id = g_unix_signal_add(SIGTERM, on_shutdown_signal, loop);

    g_main_loop_run(loop);

    g_source_remove(sigint_id);
    g_source_remove(sigterm_id);

    // Stopping the monitor first releases callers blocked in self-test waits
    monitor->stop();
    dbus.stop();
    config_store->stop_reload_timer();
    g_main_loop_unref(loop);

    LOG_INFO("main", "drivewatchd stopped");
    logger.shutdown();
    return 0;
}
