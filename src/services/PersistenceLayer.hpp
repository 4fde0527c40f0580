/**
 * @file PersistenceLayer.hpp
 * @brief Durable monitor state under the per-user data directory
 */

#pragma once

#include "interfaces/IAlertLog.hpp"
#include "models/DeviceState.hpp"
#include "models/Health.hpp"
#include "models/SmartData.hpp"
#include "util/Result.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

/**
 * @class PersistenceLayer
 * @brief Loads and saves every persisted file of the monitor
 *
 * Layout under the data directory:
 *   alerts.log              one JSON alert per line, append-only
 *   acked_alerts.json       acknowledged alert keys
 *   alert_state.json        next alert id
 *   health_history.json     per-device score series
 *   smart_anomalies.json    anomaly records and cleared marks
 *   write_endurance.json    cumulative bytes written per device
 *   smart_cache.json        last SMART snapshot per device
 *   baselines/<device>.json saved baselines, oldest first
 *
 * Every other file is replaced atomically. A missing file loads as empty.
 */
class PersistenceLayer : public IAlertLog {
public:
    using HistoryMap = std::map<std::string, std::vector<HealthHistoryPoint>>;
    using ClearedMap = std::map<std::string, std::map<uint32_t, uint64_t>>;
    using EnduranceMap = std::map<std::string, EnduranceRecord>;

    struct AnomalyState {
        std::vector<AnomalyRecord> records;
        ClearedMap cleared;
    };

    struct CachedSmart {
        DeviceIdentity identity;
        SmartSnapshot snapshot;
    };

    explicit PersistenceLayer(std::filesystem::path data_dir);

    /**
     * @brief $XDG_DATA_HOME/drivewatch, or ~/.local/share/drivewatch
     */
    [[nodiscard]] static auto default_data_dir() -> std::filesystem::path;

    [[nodiscard]] auto data_dir() const -> const std::filesystem::path& { return data_dir_; }

    // IAlertLog
    auto append_alert(const Alert& alert) -> util::Result<void> override;
    [[nodiscard]] auto load_alert_log() -> util::Result<std::vector<Alert>> override;
    auto save_acknowledged(const std::set<std::string>& keys) -> util::Result<void> override;
    [[nodiscard]] auto load_acknowledged() -> util::Result<std::set<std::string>> override;
    auto save_next_alert_id(uint64_t next_id) -> util::Result<void> override;
    [[nodiscard]] auto load_next_alert_id() -> util::Result<uint64_t> override;

    /**
     * @brief Save all series, keeping the newest HEALTH_HISTORY_CAPACITY points each
     */
    auto save_health_history(const HistoryMap& history) -> util::Result<void>;
    [[nodiscard]] auto load_health_history() -> util::Result<HistoryMap>;

    auto save_anomalies(const std::vector<AnomalyRecord>& records, const ClearedMap& cleared)
        -> util::Result<void>;
    [[nodiscard]] auto load_anomalies() -> util::Result<AnomalyState>;

    auto save_endurance(const EnduranceMap& records) -> util::Result<void>;
    [[nodiscard]] auto load_endurance() -> util::Result<EnduranceMap>;

    auto save_smart_cache(const std::vector<CachedSmart>& entries) -> util::Result<void>;
    [[nodiscard]] auto load_smart_cache() -> util::Result<std::vector<CachedSmart>>;

    /**
     * @brief Append a baseline to the device's baseline file
     *
     * Earlier baselines are kept unchanged.
     */
    auto save_baseline(const Baseline& baseline) -> util::Result<void>;

    /**
     * @brief All baselines of a device, oldest first
     */
    [[nodiscard]] auto load_baselines(const std::string& device)
        -> util::Result<std::vector<Baseline>>;

    /**
     * @brief Most recently saved baseline
     * @return NotFound when none was saved
     */
    [[nodiscard]] auto latest_baseline(const std::string& device) -> util::Result<Baseline>;

    [[nodiscard]] auto alert_log_path() const -> std::filesystem::path;
    [[nodiscard]] auto baseline_path(const std::string& device) const -> std::filesystem::path;

private:
    [[nodiscard]] auto path_of(const char* name) const -> std::filesystem::path {
        return data_dir_ / name;
    }

    std::filesystem::path data_dir_;
    std::mutex mutex_;
};
