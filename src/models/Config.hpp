/**
 * @file Config.hpp
 * @brief Validated monitor configuration
 *
 * A Config is immutable once published by the ConfigStore; readers hold a
 * std::shared_ptr<const Config> for as long as they need a consistent view.
 */

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "models/Alert.hpp"
#include "models/SmartData.hpp"
#include "util/Result.hpp"

struct GeneralConfig {
    int update_interval_ms = 2000;  ///< I/O counter cadence
    int smart_interval_sec = 300;
    int fs_interval_sec = 5;
    int nfs_interval_sec = 5;
    int volume_interval_sec = 10;
    int fetch_timeout_ms = 10000;  ///< Per provider call
    int selftest_poll_sec = 30;
    int selftest_short_timeout_min = 15;
    int selftest_long_timeout_min = 1440;
    std::string data_dir;  ///< Empty = $XDG_DATA_HOME/drivewatch

    auto operator==(const GeneralConfig&) const -> bool = default;
};

struct ThresholdPair {
    double warn = 0.0;
    double crit = 0.0;

    auto operator==(const ThresholdPair&) const -> bool = default;
};

struct Thresholds {
    ThresholdPair temperature_hdd{50, 60};
    ThresholdPair temperature_ssd{55, 70};
    ThresholdPair temperature_nvme{55, 70};
    ThresholdPair filesystem_pct{85, 95};
    ThresholdPair inode_pct{85, 95};
    ThresholdPair io_util_pct{95, 100};
    ThresholdPair latency_ms{50, 200};
    ThresholdPair nfs_rtt_ms{50, 200};
    ThresholdPair reallocated{1, 100};
    ThresholdPair pending{1, 10};
    ThresholdPair uncorrectable{1, 1};
    ThresholdPair fill_days{14, 3};  ///< Days until full; smaller is worse, 0 disables

    auto operator==(const Thresholds&) const -> bool = default;
};

struct NotificationsConfig {
    std::string webhook_url;
    bool notify_warning = false;
    bool notify_critical = true;
    bool desktop = false;

    auto operator==(const NotificationsConfig&) const -> bool = default;
};

/**
 * @struct Config
 * @brief Complete configuration snapshot
 */
struct Config {
    GeneralConfig general;
    std::chrono::seconds cooldown{0};
    std::vector<RuleKind> disabled_rules;
    Thresholds thresholds;
    std::vector<std::string> exclude{"loop*", "sr*", "ram*", "fd*"};
    NotificationsConfig notifications;
    std::map<std::string, std::string> aliases;

    /**
     * @brief Check ranges and orderings
     * @return ConfigInvalid naming the first offending key
     */
    [[nodiscard]] auto validate() const -> util::Result<void>;

    /**
     * @brief True when a device name matches an exclusion glob
     */
    [[nodiscard]] auto is_excluded(const std::string& device) const -> bool;

    /**
     * @brief Alias for a device, or an empty string
     */
    [[nodiscard]] auto alias_for(const std::string& device) const -> std::string;

    [[nodiscard]] auto temperature_thresholds(DeviceKind kind) const -> const ThresholdPair&;

    [[nodiscard]] auto is_rule_enabled(RuleKind kind) const -> bool;

    /**
     * @brief Rule definition for a kind
     *
     * Temperature uses the HDD pair and sector-count the reallocated pair
     * here; the engine picks the per-kind and per-attribute pairs itself.
     * SmartStatus and VolumeHealth are level-based (warn=1, crit=2).
     */
    [[nodiscard]] auto rule(RuleKind kind) const -> AlertRule;

    [[nodiscard]] auto rules() const -> std::vector<AlertRule>;

    auto operator==(const Config&) const -> bool = default;
};
