/**
 * @file IAlertLog.hpp
 * @brief Durable storage for resolved alerts and acknowledgements
 */

#pragma once

#include "models/Alert.hpp"
#include "util/Result.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

class IAlertLog {
public:
    virtual ~IAlertLog() = default;

    /**
     * @brief Append one alert record to the log
     */
    virtual auto append_alert(const Alert& alert) -> util::Result<void> = 0;

    /**
     * @brief Read every logged alert, oldest first
     */
    [[nodiscard]] virtual auto load_alert_log() -> util::Result<std::vector<Alert>> = 0;

    /**
     * @brief Replace the set of acknowledged alert keys
     */
    virtual auto save_acknowledged(const std::set<std::string>& keys) -> util::Result<void> = 0;

    [[nodiscard]] virtual auto load_acknowledged() -> util::Result<std::set<std::string>> = 0;

    /**
     * @brief Persist the id the next fired alert will get
     *
     * Alerts still active at shutdown never reach the log, so their ids
     * are only protected from reuse by this counter.
     */
    virtual auto save_next_alert_id(uint64_t next_id) -> util::Result<void> = 0;

    /**
     * @return The saved counter, 1 when none was saved
     */
    [[nodiscard]] virtual auto load_next_alert_id() -> util::Result<uint64_t> = 0;
};
