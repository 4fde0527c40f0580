/**
 * @file DaemonOptions.hpp
 * @brief drivewatchd command line and the logging setup derived from it
 */

#pragma once

#include "models/Config.hpp"
#include "util/Logger.hpp"
#include "util/Result.hpp"

#include <filesystem>
#include <optional>

/**
 * @struct DaemonOptions
 * @brief Parsed drivewatchd command line
 */
struct DaemonOptions {
    std::optional<std::filesystem::path> config_path;  ///< --config / -c
    std::optional<std::filesystem::path> data_dir;     ///< --data-dir / -d
    bool verbose = false;                              ///< --verbose / -v
    bool system_bus = false;                           ///< --system
};

/**
 * @struct LogSetup
 * @brief Logger level and whether entries are mirrored to stderr
 */
struct LogSetup {
    util::LogLevel level = util::LogLevel::INFO;
    bool console = false;
};

/**
 * @brief Parse the command line with GOptionContext, removing recognised options
 * @return InvalidArgument with GLib's message for unknown or malformed options
 */
[[nodiscard]] auto parse_daemon_options(int& argc, char**& argv) -> util::Result<DaemonOptions>;

/**
 * @brief DEBUG and stderr with --verbose; stderr also when there is no log file
 */
[[nodiscard]] auto log_setup_for(const DaemonOptions& options, bool file_available) -> LogSetup;

/**
 * @brief --data-dir, else the configured data_dir, else the per-user default
 */
[[nodiscard]] auto resolve_data_dir(const DaemonOptions& options, const Config& config)
    -> std::filesystem::path;
