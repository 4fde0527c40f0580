/**
 * @file SmartData.hpp
 * @brief SMART snapshot model for ATA and NVMe devices
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "util/Time.hpp"

/**
 * @brief Well-known attribute ids
 */
namespace smart {
constexpr uint32_t REALLOCATED_SECTORS = 5;
constexpr uint32_t POWER_ON_HOURS = 9;
constexpr uint32_t TEMPERATURE = 194;
constexpr uint32_t CURRENT_PENDING_SECTORS = 197;
constexpr uint32_t OFFLINE_UNCORRECTABLE = 198;
constexpr uint32_t UDMA_CRC_ERRORS = 199;

/// NVMe has no attribute table; media errors are tracked under this id
constexpr uint32_t NVME_MEDIA_ERRORS = 9999;

/// A pre-fail attribute within this many points of its threshold is at risk
constexpr uint32_t AT_RISK_MARGIN = 10;

/**
 * @brief Display name for an attribute id (empty when unknown)
 */
[[nodiscard]] auto attribute_name(uint32_t id) -> std::string_view;
}  // namespace smart

/**
 * @enum DeviceKind
 * @brief Storage device class; selects temperature thresholds
 */
enum class DeviceKind { HDD, SSD, NVMe };

[[nodiscard]] auto to_string(DeviceKind kind) -> std::string_view;
[[nodiscard]] auto device_kind_from_string(std::string_view text) -> std::optional<DeviceKind>;

/**
 * @enum SmartStatus
 * @brief Overall SMART verdict
 */
enum class SmartStatus {
    Unknown,  ///< SMART not readable
    Passed,   ///< Drive reports healthy
    Warning,  ///< Passed, but an attribute or NVMe flag is at risk
    Failed    ///< Drive reports failure
};

[[nodiscard]] auto to_string(SmartStatus status) -> std::string_view;
[[nodiscard]] auto smart_status_from_string(std::string_view text) -> SmartStatus;

/**
 * @struct SmartAttribute
 * @brief One row of the ATA attribute table
 */
struct SmartAttribute {
    uint32_t id = 0;
    std::string name;
    uint32_t value = 0;      ///< Normalized current value
    uint32_t worst = 0;      ///< Normalized worst value
    uint32_t threshold = 0;  ///< Failure threshold (0 = informational)
    bool prefail = false;
    uint64_t raw_value = 0;

    [[nodiscard]] auto is_at_risk() const -> bool {
        return prefail && threshold > 0 && value <= threshold + smart::AT_RISK_MARGIN;
    }

    [[nodiscard]] auto is_failing() const -> bool { return threshold > 0 && value <= threshold; }

    auto operator==(const SmartAttribute&) const -> bool = default;
};

/**
 * @struct NvmeHealth
 * @brief Fields of the NVMe SMART / Health Information log (page 02h)
 */
struct NvmeHealth {
    uint8_t critical_warning = 0;
    uint32_t available_spare = 100;   ///< Percent
    uint32_t spare_threshold = 10;    ///< Percent
    uint32_t percentage_used = 0;
    uint64_t data_units_written = 0;  ///< Units of 512,000 bytes
    uint64_t media_errors = 0;

    auto operator==(const NvmeHealth&) const -> bool = default;
};

/**
 * @struct SmartSnapshot
 * @brief Full SMART reading for one device, replaced wholesale on every poll
 */
struct SmartSnapshot {
    util::TimePoint captured_at{};
    SmartStatus status = SmartStatus::Unknown;
    std::optional<int> temperature_celsius;
    std::optional<uint64_t> power_on_hours;
    std::map<uint32_t, SmartAttribute> attributes;
    std::optional<NvmeHealth> nvme;

    [[nodiscard]] auto find(uint32_t id) const -> const SmartAttribute* {
        auto it = attributes.find(id);
        return it == attributes.end() ? nullptr : &it->second;
    }

    /**
     * @brief Raw value of an attribute, NVMe media errors for the sentinel id
     */
    [[nodiscard]] auto raw_or(uint32_t id, uint64_t fallback) const -> uint64_t;

    /**
     * @brief Downgrade Passed to Warning when a pre-fail attribute is at risk
     * or the NVMe log reports a problem. Failed is never changed.
     */
    void derive_status();

    auto operator==(const SmartSnapshot&) const -> bool = default;
};
