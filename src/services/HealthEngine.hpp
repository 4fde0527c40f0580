/**
 * @file HealthEngine.hpp
 * @brief Health scoring, health history and SMART anomaly detection
 */

#pragma once

#include "models/Config.hpp"
#include "models/DeviceState.hpp"
#include "models/Health.hpp"
#include "models/SmartData.hpp"
#include "services/ConfigStore.hpp"
#include "util/HistoryRing.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @class HealthEngine
 * @brief Derives a 0..100 score and anomaly records from SMART snapshots
 *
 * The score depends only on the latest snapshot, the device kind and the
 * temperature thresholds; it never looks at alert state. Invoked by the
 * state store on every SMART merge.
 */
class HealthEngine {
public:
    static constexpr std::chrono::minutes HISTORY_INTERVAL{5};
    static constexpr size_t ANOMALY_WINDOW = 12;
    static constexpr uint64_t JUMP_DELTA = 5;
    static constexpr double BAND_TOLERANCE = 0.5;
    static constexpr int FAILING_ATTRIBUTE_CAP = 20;

    /// Watched ATA attributes plus the NVMe media error sentinel
    static constexpr uint32_t WATCHED_ATTRIBUTES[] = {
        smart::REALLOCATED_SECTORS, smart::CURRENT_PENDING_SECTORS, smart::OFFLINE_UNCORRECTABLE,
        smart::UDMA_CRC_ERRORS, smart::NVME_MEDIA_ERRORS};

    explicit HealthEngine(std::shared_ptr<ConfigStore> config_store);

    /**
     * @brief Compute the health score for a snapshot
     * @param smart Latest snapshot, nullptr when none was ever read (scores 100)
     */
    [[nodiscard]] static auto score(const SmartSnapshot* smart, DeviceKind kind,
                                    const Config& config) -> int;

    /**
     * @brief Score, record history and detect anomalies for a SMART merge
     */
    auto evaluate(const DeviceState& prev, const DeviceState& next) -> HealthRecord;

    /**
     * @brief Health series for a device, oldest first
     * @param days Window ending now; 0 returns everything retained
     */
    [[nodiscard]] auto history(const std::string& device, int days) const
        -> std::vector<HealthHistoryPoint>;

    /**
     * @brief Anomaly records, optionally for one device, in detection order
     */
    [[nodiscard]] auto anomalies(const std::optional<std::string>& device = std::nullopt) const
        -> std::vector<AnomalyRecord>;

    /**
     * @brief Remove anomaly records for one device or all devices
     *
     * Counters that stay at their current value are not reported again.
     * @return Number of records removed
     */
    auto clear_anomalies(const std::optional<std::string>& device = std::nullopt) -> size_t;

    /**
     * @brief Compare a snapshot with a saved baseline
     */
    [[nodiscard]] static auto diff(const Baseline& baseline, const SmartSnapshot& current)
        -> BaselineDiff;

    /**
     * @brief Build a baseline from a snapshot
     */
    [[nodiscard]] static auto make_baseline(const std::string& device, const SmartSnapshot& snapshot,
                                            util::TimePoint saved_at) -> Baseline;

    using HistoryMap = std::map<std::string, std::vector<HealthHistoryPoint>>;
    using ClearedMap = std::map<std::string, std::map<uint32_t, uint64_t>>;

    [[nodiscard]] auto export_history() const -> HistoryMap;
    void import_history(const HistoryMap& history);

    [[nodiscard]] auto export_cleared() const -> ClearedMap;
    void import_anomalies(std::vector<AnomalyRecord> records, ClearedMap cleared);

    /**
     * @brief Consume the "changed since last save" flags
     */
    [[nodiscard]] auto take_history_dirty() -> bool { return history_dirty_.exchange(false); }
    [[nodiscard]] auto take_anomalies_dirty() -> bool { return anomalies_dirty_.exchange(false); }

private:
    void record_history(const std::string& device, util::TimePoint at, int score);
    auto detect_anomalies(const std::string& device, const SmartSnapshot& snapshot) -> size_t;
    auto find_first_seen(const std::string& device, uint32_t attr_id) -> AnomalyRecord*;

    std::shared_ptr<ConfigStore> config_store_;

    mutable std::mutex mutex_;
    std::map<std::string, util::HistoryRing<HealthHistoryPoint>> history_;
    std::vector<AnomalyRecord> anomalies_;
    std::map<std::string, std::map<uint32_t, util::HistoryRing<uint64_t>>> windows_;
    ClearedMap cleared_;

    std::atomic<bool> history_dirty_{false};
    std::atomic<bool> anomalies_dirty_{false};
};
