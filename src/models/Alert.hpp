/**
 * @file Alert.hpp
 * @brief Alert rules and alert records
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "util/Time.hpp"

/**
 * @enum RuleKind
 * @brief Closed set of alert rule kinds
 */
enum class RuleKind {
    ThresholdTemp,   ///< Drive temperature, per device kind
    ThresholdUtil,   ///< I/O utilisation %
    ThresholdFs,     ///< Filesystem space used %
    ThresholdInode,  ///< Filesystem inodes used %
    SmartStatus,     ///< Overall verdict, at-risk and degrading pre-fail attributes
    SectorCount,     ///< Reallocated, pending and uncorrectable sectors
    Latency,         ///< Average I/O latency
    NfsLatency,      ///< NFS RPC round-trip time
    VolumeHealth,    ///< RAID/pool degraded or rebuilding
    FsFillRate       ///< Projected days until a filesystem is full
};

inline constexpr std::array<RuleKind, 10> ALL_RULE_KINDS = {
    RuleKind::ThresholdTemp, RuleKind::ThresholdUtil, RuleKind::ThresholdFs,
    RuleKind::ThresholdInode, RuleKind::SmartStatus, RuleKind::SectorCount,
    RuleKind::Latency,       RuleKind::NfsLatency,    RuleKind::VolumeHealth,
    RuleKind::FsFillRate};

[[nodiscard]] auto to_string(RuleKind kind) -> std::string_view;
[[nodiscard]] auto rule_kind_from_string(std::string_view text) -> std::optional<RuleKind>;

enum class Severity { Warn, Crit };

/**
 * @brief Per-(device, rule) evaluation outcome; ordered by escalation
 */
enum class AlertLevel { Clear = 0, Warn = 1, Crit = 2 };

[[nodiscard]] auto to_string(Severity severity) -> std::string_view;
[[nodiscard]] auto severity_from_string(std::string_view text) -> std::optional<Severity>;
[[nodiscard]] auto to_string(AlertLevel level) -> std::string_view;

[[nodiscard]] constexpr auto to_severity(AlertLevel level) -> Severity {
    return level == AlertLevel::Crit ? Severity::Crit : Severity::Warn;
}

[[nodiscard]] constexpr auto to_level(Severity severity) -> AlertLevel {
    return severity == Severity::Crit ? AlertLevel::Crit : AlertLevel::Warn;
}

/**
 * @brief Classify a value against warn/crit thresholds
 *
 * A value equal to a threshold belongs to the higher level.
 */
[[nodiscard]] constexpr auto classify(double value, double warn, double crit) -> AlertLevel {
    if (value >= crit) {
        return AlertLevel::Crit;
    }
    if (value >= warn) {
        return AlertLevel::Warn;
    }
    return AlertLevel::Clear;
}

/**
 * @brief Classify where smaller is worse (days until full); 0 disables a level
 */
[[nodiscard]] constexpr auto classify_below(double value, double warn, double crit) -> AlertLevel {
    if (crit > 0 && value <= crit) {
        return AlertLevel::Crit;
    }
    if (warn > 0 && value <= warn) {
        return AlertLevel::Warn;
    }
    return AlertLevel::Clear;
}

/**
 * @struct AlertRule
 * @brief Thresholds for one rule kind, taken from the active Config
 */
struct AlertRule {
    RuleKind kind = RuleKind::ThresholdTemp;
    double warn = 0.0;
    double crit = 0.0;
    bool enabled = true;
};

/**
 * @struct Alert
 * @brief One logical alert per (device, rule kind)
 */
struct Alert {
    uint64_t id = 0;
    std::string device;  ///< Device id, mount point or volume name
    RuleKind rule = RuleKind::ThresholdTemp;
    Severity severity = Severity::Warn;
    std::string message;
    util::TimePoint fired_at{};
    util::TimePoint last_fired_at{};
    util::TimePoint cooldown_until{};
    bool acknowledged = false;
    bool resolved = false;
    std::optional<util::TimePoint> resolved_at;

    [[nodiscard]] auto key() const -> std::string { return make_key(device, rule); }

    [[nodiscard]] static auto make_key(std::string_view device, RuleKind rule) -> std::string;
};

/**
 * @struct AlertEvent
 * @brief Handed to the notification dispatcher when an alert must be announced
 */
struct AlertEvent {
    Alert alert;
    std::string display_name;  ///< Alias or device id
    bool escalation = false;   ///< Warn to crit transition
};

/**
 * @struct AlertQuery
 * @brief Filters for active and historical alert queries
 */
struct AlertQuery {
    bool active_only = false;
    std::optional<util::TimePoint> since;
    std::optional<Severity> min_severity;
    std::string search;  ///< Case-insensitive substring of device or message
    size_t limit = 0;    ///< 0 = unlimited

    [[nodiscard]] auto matches(const Alert& alert) const -> bool;
};
