/**
 * @file Health.hpp
 * @brief Health history, anomaly and baseline records
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/Time.hpp"

/// One point per 5 minutes, 7.5 days
inline constexpr size_t HEALTH_HISTORY_CAPACITY = 2160;

struct HealthHistoryPoint {
    util::TimePoint at{};
    int score = 0;

    auto operator==(const HealthHistoryPoint&) const -> bool = default;
};

/**
 * @enum AnomalyKind
 * @brief Why an anomaly record was created
 */
enum class AnomalyKind {
    FirstSeen,  ///< Watched counter became non-zero
    Jump,       ///< Counter rose sharply since the previous snapshot
    OutOfBand   ///< Value left the band of recent snapshots
};

[[nodiscard]] auto to_string(AnomalyKind kind) -> std::string_view;
[[nodiscard]] auto anomaly_kind_from_string(std::string_view text) -> AnomalyKind;

/**
 * @struct AnomalyRecord
 * @brief A detected deviation of a watched attribute; kept until cleared
 */
struct AnomalyRecord {
    std::string device;
    uint32_t attr_id = 0;
    std::string attr_name;
    AnomalyKind kind = AnomalyKind::FirstSeen;
    uint64_t first_value = 0;  ///< FirstSeen: value at detection; otherwise the value before
    uint64_t last_value = 0;   ///< Observed value (FirstSeen records keep tracking it)
    uint64_t expected_low = 0;
    uint64_t expected_high = 0;
    int64_t delta = 0;
    util::TimePoint detected_at{};

    auto operator==(const AnomalyRecord&) const -> bool = default;
};

struct BaselineAttribute {
    uint32_t id = 0;
    std::string name;
    uint64_t raw_value = 0;
    uint32_t value = 0;

    auto operator==(const BaselineAttribute&) const -> bool = default;
};

/**
 * @struct Baseline
 * @brief User-saved copy of a SMART snapshot; never modified after saving
 */
struct Baseline {
    std::string device;
    util::TimePoint saved_at{};
    std::optional<uint64_t> power_on_hours;
    std::vector<BaselineAttribute> attributes;

    auto operator==(const Baseline&) const -> bool = default;
};

struct AttributeDelta {
    uint32_t id = 0;
    std::string name;
    uint64_t baseline_raw = 0;
    uint64_t current_raw = 0;
    int64_t delta = 0;
    int64_t normalized_delta = 0;
};

/**
 * @struct BaselineDiff
 * @brief Current SMART snapshot compared with the latest baseline
 */
struct BaselineDiff {
    std::string device;
    util::TimePoint baseline_saved_at{};
    std::optional<int64_t> power_on_hours_delta;
    std::vector<AttributeDelta> attributes;  ///< Only attributes present in both
};
