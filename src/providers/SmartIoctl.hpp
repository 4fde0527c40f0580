/**
 * @file SmartIoctl.hpp
 * @brief SMART and self-test access through Linux ATA and NVMe ioctls
 *
 * ATA drives are driven with HDIO_DRIVE_CMD / HDIO_DRIVE_TASK (libata
 * translates these for SATA disks behind AHCI), NVMe drives with
 * NVME_IOCTL_ADMIN_CMD. No external tool is involved.
 */

#pragma once

#include "models/DeviceState.hpp"
#include "models/Readings.hpp"
#include "models/SmartData.hpp"
#include "util/Result.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @class SmartIoctl
 * @brief Reads SMART tables and runs self-tests on one device node
 *
 * Each call opens the device node, issues its commands and closes it
 * again, so instances hold no state and may be shared between threads.
 */
class SmartIoctl {
public:
    static constexpr size_t SECTOR_SIZE = 512;
    static constexpr size_t NVME_SMART_LOG_SIZE = 512;
    static constexpr size_t NVME_SELF_TEST_LOG_SIZE = 564;

    using Sector = std::array<uint8_t, SECTOR_SIZE>;

    /**
     * @struct AtaProgress
     * @brief Self-test execution status byte of the SMART data sector
     */
    struct AtaProgress {
        SelfTestState state = SelfTestState::Idle;
        std::optional<int> percent_remaining;
    };

    /**
     * @brief Read attributes, thresholds and the overall verdict of an ATA drive
     * @param device_path Device node, e.g. /dev/sda
     */
    [[nodiscard]] auto read_ata(const std::string& device_path) const
        -> util::Result<SmartSnapshot>;

    /**
     * @brief Read the SMART / Health Information log of an NVMe drive
     */
    [[nodiscard]] auto read_nvme(const std::string& device_path) const
        -> util::Result<SmartSnapshot>;

    /**
     * @brief SMART EXECUTE OFFLINE IMMEDIATE, short (1) or extended (2)
     */
    auto start_ata_self_test(const std::string& device_path, SelfTestType type) const
        -> util::Result<void>;

    /**
     * @brief NVMe Device Self-test admin command on all namespaces
     */
    auto start_nvme_self_test(const std::string& device_path, SelfTestType type) const
        -> util::Result<void>;

    [[nodiscard]] auto read_ata_self_test(const std::string& device_path) const
        -> util::Result<SelfTestReading>;

    [[nodiscard]] auto read_nvme_self_test(const std::string& device_path) const
        -> util::Result<SelfTestReading>;

    // Decoders, exposed for tests

    /**
     * @brief Decode the attribute table of a SMART READ DATA sector
     * @param data SMART data sector
     * @param thresholds SMART READ THRESHOLDS sector
     */
    [[nodiscard]] static auto parse_ata_attributes(const Sector& data, const Sector& thresholds)
        -> std::map<uint32_t, SmartAttribute>;

    /**
     * @brief Decode byte 363 (self-test execution status) of the SMART data sector
     */
    [[nodiscard]] static auto parse_ata_progress(uint8_t status_byte) -> AtaProgress;

    /**
     * @brief Decode the SMART self-test log (log address 06h), oldest entry first
     */
    [[nodiscard]] static auto parse_ata_self_test_log(const Sector& log)
        -> std::vector<SelfTestEntry>;

    [[nodiscard]] static auto parse_nvme_smart_log(
        const std::array<uint8_t, NVME_SMART_LOG_SIZE>& log) -> SmartSnapshot;

    /**
     * @brief Decode the NVMe Device Self-test log (log page 06h)
     */
    [[nodiscard]] static auto parse_nvme_self_test_log(
        const std::array<uint8_t, NVME_SELF_TEST_LOG_SIZE>& log) -> SelfTestReading;

    /**
     * @brief Text for an ATA self-test execution status nibble
     */
    [[nodiscard]] static auto ata_status_text(uint8_t status_nibble) -> std::string;
};
