/**
 * @file DaemonOptions.cpp
 * @brief GOptionContext parsing for drivewatchd
 */

#include "daemon/DaemonOptions.hpp"

#include "services/PersistenceLayer.hpp"

#include <glib.h>

#include <memory>
#include <string>

namespace {

using OptionContextPtr = std::unique_ptr<GOptionContext, decltype(&g_option_context_free)>;

struct RawOptions {
    gchar* config_path = nullptr;
    gchar* data_dir = nullptr;
    gboolean verbose = FALSE;
    gboolean system_bus = FALSE;

    ~RawOptions() {
        g_free(config_path);
        g_free(data_dir);
    }
};

}  // namespace

auto parse_daemon_options(int& argc, char**& argv) -> util::Result<DaemonOptions> {
    RawOptions raw;
    GOptionEntry entries[] = {
        {"config", 'c', 0, G_OPTION_ARG_FILENAME, &raw.config_path,
         "Configuration file (default: $XDG_CONFIG_HOME/drivewatch/drivewatch.conf)", "FILE"},
        {"data-dir", 'd', 0, G_OPTION_ARG_FILENAME, &raw.data_dir,
         "Directory for alert log, history and baselines", "DIR"},
        {"verbose", 'v', 0, G_OPTION_ARG_NONE, &raw.verbose,
         "Log per-poll detail and mirror the log to stderr", nullptr},
        {"system", 0, 0, G_OPTION_ARG_NONE, &raw.system_bus,
         "Export the monitor on the system bus instead of the session bus", nullptr},
        G_OPTION_ENTRY_NULL};

    OptionContextPtr context(g_option_context_new("- storage health monitor"),
                             &g_option_context_free);
    g_option_context_add_main_entries(context.get(), entries, nullptr);

    GError* error = nullptr;
    if (g_option_context_parse(context.get(), &argc, &argv, &error) == FALSE) {
        std::string message = error != nullptr ? error->message : "invalid arguments";
        g_clear_error(&error);
        return util::fail(util::ErrorKind::InvalidArgument, std::move(message));
    }

    DaemonOptions options;
    if (raw.config_path != nullptr) {
        options.config_path = std::filesystem::path{raw.config_path};
    }
    if (raw.data_dir != nullptr) {
        options.data_dir = std::filesystem::path{raw.data_dir};
    }
    options.verbose = raw.verbose != FALSE;
    options.system_bus = raw.system_bus != FALSE;
    return options;
}

auto log_setup_for(const DaemonOptions& options, bool file_available) -> LogSetup {
    LogSetup setup;
    setup.level = options.verbose ? util::LogLevel::DEBUG : util::LogLevel::INFO;
    setup.console = options.verbose || !file_available;
    return setup;
}

auto resolve_data_dir(const DaemonOptions& options, const Config& config)
    -> std::filesystem::path {
    if (options.data_dir) {
        return *options.data_dir;
    }
    if (!config.general.data_dir.empty()) {
        return config.general.data_dir;
    }
    return PersistenceLayer::default_data_dir();
}
