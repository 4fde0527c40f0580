/**
 * @file AlertEngine.hpp
 * @brief Alert rule evaluation and alert lifecycle
 */

#pragma once

#include "interfaces/IAlertLog.hpp"
#include "interfaces/INotificationSink.hpp"
#include "models/Alert.hpp"
#include "models/DeviceState.hpp"
#include "models/HostState.hpp"
#include "services/ConfigStore.hpp"
#include "util/HistoryRing.hpp"
#include "util/Result.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * @class AlertEngine
 * @brief Owns the active alert set
 *
 * Per (device, rule kind) the engine tracks one level: clear, warn or crit.
 * Leaving clear creates an Alert and, unless the (device, rule, severity)
 * cooldown is running, submits it for notification. Escalation from warn
 * to crit always notifies immediately. Crit to warn lowers the severity
 * without notifying. Returning to clear resolves the alert, appends it to
 * the alert log and removes it from the active set. Acknowledgement only
 * sets a flag.
 */
class AlertEngine {
public:
    static constexpr size_t RECENT_CAPACITY = 50;

    AlertEngine(std::shared_ptr<ConfigStore> config_store,
                std::shared_ptr<INotificationSink> sink, std::shared_ptr<IAlertLog> log);

    /**
     * @brief Restore acknowledged keys and the next alert id from the log
     */
    auto load_state() -> util::Result<void>;

    /**
     * @brief Evaluate the rules fed by one device domain
     *
     * Only the rules of `domain` are evaluated, so stale data in other
     * domains never raises or resolves alerts.
     */
    void evaluate_device(const DeviceState& state, Domain domain, util::TimePoint now);

    /**
     * @brief Evaluate the rules fed by one host domain
     */
    void evaluate_host(const HostState& host, Domain domain, util::TimePoint now);

    /**
     * @brief Active alerts matching a query, newest first
     */
    [[nodiscard]] auto active(const AlertQuery& query = {}) const -> std::vector<Alert>;

    /**
     * @brief Last fired alerts kept in memory, newest first
     */
    [[nodiscard]] auto recent() const -> std::vector<Alert>;

    /**
     * @brief Active alerts plus the persisted log, filtered, newest first
     */
    [[nodiscard]] auto query(const AlertQuery& query) const -> util::Result<std::vector<Alert>>;

    [[nodiscard]] auto find(uint64_t id) const -> std::optional<Alert>;

    /**
     * @brief Mark one active alert acknowledged
     * @return NotFound if no active alert has this id
     */
    auto acknowledge(uint64_t id) -> util::Result<void>;

    /**
     * @brief Acknowledge every alert active at the time of the call
     * @return Number of alerts newly acknowledged
     */
    auto acknowledge_all() -> size_t;

    /**
     * @brief Drop the live alerts of a departed device without logging them
     */
    void forget_device(const std::string& device);

private:
    struct Outcome {
        std::vector<AlertEvent> notify;
        std::vector<Alert> resolved;
        bool acks_changed = false;
        std::optional<uint64_t> next_id;  ///< Set when an alert took a new id
    };

    struct Verdict {
        RuleKind rule;
        AlertLevel level;
        std::string message;
    };

    void apply(const std::string& device, const std::string& display_name, const Verdict& verdict,
               util::TimePoint now, const Config& config, Outcome& outcome);
    void resolve_missing(RuleKind rule, const std::set<std::string>& present, util::TimePoint now,
                         Outcome& outcome);
    void finish(Outcome outcome);

    [[nodiscard]] static auto smart_verdicts(const DeviceState& state, const Config& config)
        -> std::vector<Verdict>;
    [[nodiscard]] static auto io_verdicts(const DeviceState& state, const Config& config)
        -> std::vector<Verdict>;

    [[nodiscard]] auto ack_keys_locked() const -> std::set<std::string>;

    std::shared_ptr<ConfigStore> config_store_;
    std::shared_ptr<INotificationSink> sink_;
    std::shared_ptr<IAlertLog> log_;

    mutable std::mutex mutex_;
    std::map<std::string, Alert> active_;                 ///< Keyed by Alert::key()
    std::map<std::string, util::TimePoint> cooldowns_;    ///< Keyed by key + severity
    std::set<std::string> restored_acks_;                 ///< From the previous session
    util::HistoryRing<Alert> recent_{RECENT_CAPACITY};
    uint64_t next_id_ = 1;
};
