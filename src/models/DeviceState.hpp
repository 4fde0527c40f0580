/**
 * @file DeviceState.hpp
 * @brief Per-device state record held by the DeviceStateStore
 *
 * A DeviceState is an immutable value once published: merges build a new
 * record from the previous one with one sub-record replaced, so readers
 * never see a half-applied poll.
 */

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "models/SmartData.hpp"
#include "util/Time.hpp"

/**
 * @enum Domain
 * @brief Independently polled data sources
 */
enum class Domain { Smart, IoCounters, Filesystem, Nfs, Volume, SelfTest };

inline constexpr std::array<Domain, 6> ALL_DOMAINS = {Domain::Smart,  Domain::IoCounters,
                                                      Domain::Filesystem, Domain::Nfs,
                                                      Domain::Volume, Domain::SelfTest};

[[nodiscard]] auto to_string(Domain domain) -> std::string_view;

/**
 * @struct DeviceIdentity
 * @brief Stable identity of a block device
 *
 * `id` is the key of all live and persisted state (the kernel name, e.g.
 * "sda" or "nvme0n1").
 */
struct DeviceIdentity {
    std::string id;
    DeviceKind kind = DeviceKind::HDD;
    std::string model;
    std::string serial;
    std::string transport;  ///< "sata", "nvme", "usb", "virtio"; empty if unknown
    uint64_t capacity_bytes = 0;

    auto operator==(const DeviceIdentity&) const -> bool = default;
};

/**
 * @struct IoCounters
 * @brief Cumulative counters from /proc/diskstats
 */
struct IoCounters {
    util::TimePoint captured_at{};
    uint64_t reads_completed = 0;
    uint64_t sectors_read = 0;
    uint64_t read_time_ms = 0;
    uint64_t writes_completed = 0;
    uint64_t sectors_written = 0;
    uint64_t write_time_ms = 0;
    uint64_t io_time_ms = 0;  ///< Time spent doing I/O

    auto operator==(const IoCounters&) const -> bool = default;
};

/**
 * @struct IoRates
 * @brief Rates derived from two consecutive counter samples
 */
struct IoRates {
    double read_bytes_per_sec = 0.0;
    double write_bytes_per_sec = 0.0;
    double read_iops = 0.0;
    double write_iops = 0.0;
    double util_pct = 0.0;
    double avg_read_latency_ms = 0.0;
    double avg_write_latency_ms = 0.0;

    [[nodiscard]] auto max_latency_ms() const -> double {
        return avg_read_latency_ms > avg_write_latency_ms ? avg_read_latency_ms
                                                          : avg_write_latency_ms;
    }

    /**
     * @brief Compute rates between two samples
     * @return nullopt if `prev` is not older than `next` or a counter went
     *         backwards (device reset)
     */
    [[nodiscard]] static auto between(const IoCounters& prev, const IoCounters& next)
        -> std::optional<IoRates>;
};

/**
 * @struct IoRecord
 * @brief Latest counters and the rates since the sample before them
 */
struct IoRecord {
    IoCounters counters;
    std::optional<IoRates> rates;
};

/**
 * @struct HealthRecord
 * @brief Result of the last health evaluation
 */
struct HealthRecord {
    int score = 100;
    util::TimePoint evaluated_at{};
    size_t new_anomalies = 0;  ///< Anomaly records appended by that evaluation
};

/**
 * @brief Health band for a score: >= 80 good, >= 50 warn, below crit
 */
enum class HealthBand { Good, Warn, Crit };

inline constexpr int HEALTH_GOOD_MIN = 80;
inline constexpr int HEALTH_WARN_MIN = 50;

[[nodiscard]] constexpr auto health_band(int score) -> HealthBand {
    if (score >= HEALTH_GOOD_MIN) {
        return HealthBand::Good;
    }
    return score >= HEALTH_WARN_MIN ? HealthBand::Warn : HealthBand::Crit;
}

enum class SelfTestType { Short, Long };

/**
 * @enum SelfTestState
 * @brief Progress of the most recent self-test
 */
enum class SelfTestState {
    Idle,
    Running,
    CompletedPass,
    CompletedFail,
    Aborted,
    TimedOut  ///< Exceeded the tracking deadline; the drive may still be testing
};

[[nodiscard]] auto to_string(SelfTestType type) -> std::string_view;
[[nodiscard]] auto to_string(SelfTestState state) -> std::string_view;
[[nodiscard]] auto self_test_state_from_string(std::string_view text) -> SelfTestState;

[[nodiscard]] constexpr auto is_terminal(SelfTestState state) -> bool {
    return state == SelfTestState::CompletedPass || state == SelfTestState::CompletedFail ||
           state == SelfTestState::Aborted || state == SelfTestState::TimedOut;
}

struct SelfTestStatus {
    SelfTestState state = SelfTestState::Idle;
    SelfTestType type = SelfTestType::Short;
    std::optional<int> percent_remaining;
    util::TimePoint started_at{};
    util::TimePoint updated_at{};

    auto operator==(const SelfTestStatus&) const -> bool = default;
};

/**
 * @struct SelfTestEntry
 * @brief One line of the drive's self-test log
 */
struct SelfTestEntry {
    SelfTestType type = SelfTestType::Short;
    std::string status;  ///< Drive-reported text, e.g. "Completed without error"
    uint64_t lifetime_hours = 0;
    bool passed = false;

    auto operator==(const SelfTestEntry&) const -> bool = default;
};

/**
 * @struct EnduranceRecord
 * @brief Cumulative host writes observed for a device
 */
struct EnduranceRecord {
    uint64_t bytes_written = 0;
    util::TimePoint first_tracked{};
    uint64_t last_sectors_written = 0;  ///< Counter value at the last merge

    /**
     * @brief Average bytes written per day since tracking started
     */
    [[nodiscard]] auto bytes_per_day(util::TimePoint now) const -> double;

    auto operator==(const EnduranceRecord&) const -> bool = default;
};

/**
 * @struct DeviceState
 * @brief Complete, self-consistent view of one device
 */
struct DeviceState {
    DeviceIdentity identity;
    std::string alias;  ///< Display name from [aliases], empty if none

    std::shared_ptr<const SmartSnapshot> smart;
    std::shared_ptr<const SmartSnapshot> smart_prev;  ///< Previous snapshot for diffing
    std::optional<IoRecord> io;
    std::optional<HealthRecord> health;
    SelfTestStatus self_test;
    std::vector<SelfTestEntry> self_test_log;  ///< Most recent last
    std::optional<EnduranceRecord> endurance;

    bool smart_stale = false;
    bool io_stale = false;
    bool self_test_stale = false;
    util::TimePoint smart_updated_at{};
    util::TimePoint io_updated_at{};

    [[nodiscard]] auto display_name() const -> const std::string& {
        return alias.empty() ? identity.id : alias;
    }

    [[nodiscard]] auto is_stale(Domain domain) const -> bool;
};
