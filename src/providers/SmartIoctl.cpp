/**
 * @file SmartIoctl.cpp
 * @brief ATA and NVMe SMART ioctls
 */

#include "providers/SmartIoctl.hpp"

#include "util/FileDescriptor.hpp"

#include <fcntl.h>
#include <linux/hdreg.h>
#include <linux/nvme_ioctl.h>
#include <sys/ioctl.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>

namespace {

// ATA SMART command constants
constexpr uint8_t ATA_SMART_CMD = 0xB0;
constexpr uint8_t ATA_SMART_READ_DATA = 0xD0;
constexpr uint8_t ATA_SMART_READ_THRESHOLDS = 0xD1;
constexpr uint8_t ATA_SMART_EXECUTE_OFFLINE = 0xD4;
constexpr uint8_t ATA_SMART_READ_LOG = 0xD5;
constexpr uint8_t ATA_SMART_RETURN_STATUS = 0xDA;

constexpr uint8_t ATA_SELF_TEST_LOG = 0x06;
constexpr uint8_t ATA_SHORT_SELF_TEST = 0x01;
constexpr uint8_t ATA_EXTENDED_SELF_TEST = 0x02;

// LBA mid/high after RETURN STATUS
constexpr uint8_t STATUS_PASSED_MID = 0x4F;
constexpr uint8_t STATUS_PASSED_HIGH = 0xC2;
constexpr uint8_t STATUS_FAILED_MID = 0xF4;
constexpr uint8_t STATUS_FAILED_HIGH = 0x2C;

// SMART data sector layout
constexpr size_t ATTR_OFFSET = 2;
constexpr size_t ATTR_SIZE = 12;
constexpr size_t MAX_ATTRS = 30;
constexpr size_t SELF_TEST_STATUS_OFFSET = 363;

// Self-test log layout
constexpr size_t LOG_DESCRIPTOR_OFFSET = 2;
constexpr size_t LOG_DESCRIPTOR_SIZE = 24;
constexpr size_t LOG_DESCRIPTORS = 21;
constexpr size_t LOG_INDEX_OFFSET = 508;

constexpr uint8_t ATA_STATUS_IN_PROGRESS = 0x0F;

// NVMe admin opcodes
constexpr uint8_t NVME_GET_LOG_PAGE = 0x02;
constexpr uint8_t NVME_DEVICE_SELF_TEST = 0x14;
constexpr uint8_t NVME_LOG_SMART = 0x02;
constexpr uint8_t NVME_LOG_SELF_TEST = 0x06;
constexpr uint32_t NVME_ALL_NAMESPACES = 0xFFFF'FFFF;

constexpr size_t NVME_SELF_TEST_RESULT_OFFSET = 4;
constexpr size_t NVME_SELF_TEST_RESULT_SIZE = 28;
constexpr size_t NVME_SELF_TEST_RESULTS = 20;
constexpr uint8_t NVME_RESULT_UNUSED = 0x0F;

constexpr int KELVIN_OFFSET = 273;

auto le16(const uint8_t* p) -> uint16_t {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

auto le_n(const uint8_t* p, size_t bytes) -> uint64_t {
    uint64_t value = 0;
    for (size_t i = bytes; i > 0; --i) {
        value = (value << 8) | p[i - 1];
    }
    return value;
}

/**
 * @brief Classify an ioctl errno
 *
 * Missing support or permission means the domain cannot work on this
 * device at all; anything else is worth retrying next cadence.
 */
auto ioctl_error(std::string_view what, const std::string& path, int err) -> util::Error {
    const bool unsupported = err == ENOTTY || err == EINVAL || err == EOPNOTSUPP ||
                             err == EACCES || err == EPERM || err == ENODEV;
    return util::Error{unsupported ? util::ErrorKind::ProviderUnavailable
                                   : util::ErrorKind::TransientFetchError,
                       std::format("{} on {}: {}", what, path, std::strerror(err)), err};
}

auto open_device(const std::string& path) -> util::Result<util::FileDescriptor> {
    return util::FileDescriptor::open(path, O_RDONLY | O_NONBLOCK);
}

/**
 * @brief Issue an ATA SMART subcommand that may return one data sector
 *
 * HDIO_DRIVE_CMD layout: [command, sector number, feature, sector count]
 * followed by the returned data.
 */
auto ata_smart(int fd, uint8_t feature, uint8_t sector, uint8_t count,
               SmartIoctl::Sector* out) -> int {
    std::array<uint8_t, 4 + SmartIoctl::SECTOR_SIZE> buffer{};
    buffer[0] = ATA_SMART_CMD;
    buffer[1] = sector;
    buffer[2] = feature;
    buffer[3] = count;

    if (::ioctl(fd, HDIO_DRIVE_CMD, buffer.data()) != 0) {
        return errno;
    }
    if (out != nullptr) {
        std::copy_n(buffer.begin() + 4, SmartIoctl::SECTOR_SIZE, out->begin());
    }
    return 0;
}

auto ata_return_status(int fd) -> SmartStatus {
    // HDIO_DRIVE_TASK: [command, feature, nsect, sector, lcyl, hcyl, select]
    std::array<uint8_t, 7> task{ATA_SMART_CMD, ATA_SMART_RETURN_STATUS, 0, 0,
                                STATUS_PASSED_MID, STATUS_PASSED_HIGH, 0};
    if (::ioctl(fd, HDIO_DRIVE_TASK, task.data()) != 0) {
        return SmartStatus::Unknown;
    }
    if (task[4] == STATUS_PASSED_MID && task[5] == STATUS_PASSED_HIGH) {
        return SmartStatus::Passed;
    }
    if (task[4] == STATUS_FAILED_MID && task[5] == STATUS_FAILED_HIGH) {
        return SmartStatus::Failed;
    }
    return SmartStatus::Unknown;
}

auto nvme_get_log(int fd, uint8_t log_id, void* data, uint32_t length) -> int {
    nvme_admin_cmd cmd{};
    cmd.opcode = NVME_GET_LOG_PAGE;
    cmd.nsid = NVME_ALL_NAMESPACES;
    cmd.addr = reinterpret_cast<uint64_t>(data);
    cmd.data_len = length;
    cmd.cdw10 = log_id | (((length / 4) - 1) << 16);  // NUMDL

    if (::ioctl(fd, NVME_IOCTL_ADMIN_CMD, &cmd) < 0) {
        return errno;
    }
    return 0;
}

auto nvme_result_text(uint8_t result) -> std::string {
    switch (result) {
        case 0x0:
            return "Completed without error";
        case 0x1:
            return "Aborted by a Device Self-test command";
        case 0x2:
            return "Aborted by a controller reset";
        case 0x3:
            return "Aborted due to namespace removal";
        case 0x4:
            return "Aborted by a Format NVM command";
        case 0x5:
            return "Fatal or unknown test error";
        case 0x6:
            return "Completed with an unknown failed segment";
        case 0x7:
            return "Completed with failed segments";
        case 0x8:
            return "Aborted for unknown reason";
        case 0x9:
            return "Aborted by a sanitize operation";
        default:
            return std::format("Unknown result {:#x}", result);
    }
}

auto nvme_state_for(uint8_t result) -> SelfTestState {
    switch (result) {
        case 0x0:
            return SelfTestState::CompletedPass;
        case 0x5:
        case 0x6:
        case 0x7:
            return SelfTestState::CompletedFail;
        default:
            return SelfTestState::Aborted;
    }
}

}  // namespace

auto SmartIoctl::read_ata(const std::string& device_path) const -> util::Result<SmartSnapshot> {
    auto fd = open_device(device_path);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    Sector data{};
    if (int err = ata_smart(fd->get(), ATA_SMART_READ_DATA, 0, 1, &data); err != 0) {
        return std::unexpected(ioctl_error("SMART READ DATA", device_path, err));
    }

    // Thresholds are optional; without them no attribute is treated as failing
    Sector thresholds{};
    if (ata_smart(fd->get(), ATA_SMART_READ_THRESHOLDS, 1, 1, &thresholds) != 0) {
        thresholds.fill(0);
    }

    SmartSnapshot snapshot;
    snapshot.captured_at = util::Clock::now();
    snapshot.attributes = parse_ata_attributes(data, thresholds);
    snapshot.status = ata_return_status(fd->get());

    if (snapshot.status == SmartStatus::Unknown) {
        const bool failing = std::ranges::any_of(snapshot.attributes, [](const auto& entry) {
            return entry.second.prefail && entry.second.is_failing();
        });
        snapshot.status = failing ? SmartStatus::Failed : SmartStatus::Passed;
    }

    for (uint32_t id : {smart::TEMPERATURE, uint32_t{190}}) {
        if (const auto* attr = snapshot.find(id)) {
            const auto celsius = static_cast<int>(attr->raw_value & 0xFF);
            if (celsius > 0 && celsius < 128) {
                snapshot.temperature_celsius = celsius;
                break;
            }
        }
    }
    if (const auto* attr = snapshot.find(smart::POWER_ON_HOURS)) {
        snapshot.power_on_hours = attr->raw_value & 0xFFFF'FFFF;
    }
    return snapshot;
}

auto SmartIoctl::read_nvme(const std::string& device_path) const -> util::Result<SmartSnapshot> {
    auto fd = open_device(device_path);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    std::array<uint8_t, NVME_SMART_LOG_SIZE> log{};
    if (int err = nvme_get_log(fd->get(), NVME_LOG_SMART, log.data(), log.size()); err != 0) {
        return std::unexpected(ioctl_error("NVMe Get Log Page 02h", device_path, err));
    }

    auto snapshot = parse_nvme_smart_log(log);
    snapshot.captured_at = util::Clock::now();
    return snapshot;
}

auto SmartIoctl::start_ata_self_test(const std::string& device_path, SelfTestType type) const
    -> util::Result<void> {
    auto fd = open_device(device_path);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    const uint8_t subcommand =
        type == SelfTestType::Long ? ATA_EXTENDED_SELF_TEST : ATA_SHORT_SELF_TEST;
    if (int err = ata_smart(fd->get(), ATA_SMART_EXECUTE_OFFLINE, subcommand, 0, nullptr);
        err != 0) {
        return std::unexpected(ioctl_error("SMART EXECUTE OFFLINE IMMEDIATE", device_path, err));
    }
    return {};
}

auto SmartIoctl::start_nvme_self_test(const std::string& device_path, SelfTestType type) const
    -> util::Result<void> {
    auto fd = open_device(device_path);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    nvme_admin_cmd cmd{};
    cmd.opcode = NVME_DEVICE_SELF_TEST;
    cmd.nsid = NVME_ALL_NAMESPACES;
    cmd.cdw10 = type == SelfTestType::Long ? 0x2 : 0x1;

    if (::ioctl(fd->get(), NVME_IOCTL_ADMIN_CMD, &cmd) < 0) {
        return std::unexpected(ioctl_error("NVMe Device Self-test", device_path, errno));
    }
    return {};
}

auto SmartIoctl::read_ata_self_test(const std::string& device_path) const
    -> util::Result<SelfTestReading> {
    auto fd = open_device(device_path);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    Sector data{};
    if (int err = ata_smart(fd->get(), ATA_SMART_READ_DATA, 0, 1, &data); err != 0) {
        return std::unexpected(ioctl_error("SMART READ DATA", device_path, err));
    }

    SelfTestReading reading;
    const auto progress = parse_ata_progress(data[SELF_TEST_STATUS_OFFSET]);
    reading.status.state = progress.state;
    reading.status.percent_remaining = progress.percent_remaining;

    // The log is optional; drives without logging support still report progress
    Sector log{};
    if (ata_smart(fd->get(), ATA_SMART_READ_LOG, ATA_SELF_TEST_LOG, 1, &log) == 0) {
        reading.log = parse_ata_self_test_log(log);
    }
    return reading;
}

auto SmartIoctl::read_nvme_self_test(const std::string& device_path) const
    -> util::Result<SelfTestReading> {
    auto fd = open_device(device_path);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    std::array<uint8_t, NVME_SELF_TEST_LOG_SIZE> log{};
    if (int err = nvme_get_log(fd->get(), NVME_LOG_SELF_TEST, log.data(), log.size()); err != 0) {
        return std::unexpected(ioctl_error("NVMe Get Log Page 06h", device_path, err));
    }
    return parse_nvme_self_test_log(log);
}

auto SmartIoctl::parse_ata_attributes(const Sector& data, const Sector& thresholds)
    -> std::map<uint32_t, SmartAttribute> {
    std::map<uint32_t, uint32_t> limits;
    for (size_t i = 0; i < MAX_ATTRS; ++i) {
        const size_t offset = ATTR_OFFSET + (i * ATTR_SIZE);
        if (thresholds[offset] != 0) {
            limits[thresholds[offset]] = thresholds[offset + 1];
        }
    }

    // Each entry: [0] id, [1-2] flags, [3] value, [4] worst, [5-10] raw (LE), [11] reserved
    std::map<uint32_t, SmartAttribute> attributes;
    for (size_t i = 0; i < MAX_ATTRS; ++i) {
        const size_t offset = ATTR_OFFSET + (i * ATTR_SIZE);
        const uint8_t id = data[offset];
        if (id == 0) {
            continue;
        }

        SmartAttribute attr;
        attr.id = id;
        attr.name = std::string(smart::attribute_name(id));
        attr.prefail = (le16(&data[offset + 1]) & 0x0001) != 0;
        attr.value = data[offset + 3];
        attr.worst = data[offset + 4];
        attr.raw_value = le_n(&data[offset + 5], 6);
        if (auto it = limits.find(id); it != limits.end()) {
            attr.threshold = it->second;
        }
        attributes.emplace(attr.id, std::move(attr));
    }
    return attributes;
}

auto SmartIoctl::parse_ata_progress(uint8_t status_byte) -> AtaProgress {
    const uint8_t status = status_byte >> 4;
    AtaProgress progress;
    switch (status) {
        case 0x0:
            progress.state = SelfTestState::CompletedPass;
            break;
        case 0x1:
        case 0x2:
            progress.state = SelfTestState::Aborted;
            break;
        case ATA_STATUS_IN_PROGRESS:
            progress.state = SelfTestState::Running;
            progress.percent_remaining = (status_byte & 0x0F) * 10;
            break;
        default:
            progress.state = SelfTestState::CompletedFail;
            break;
    }
    return progress;
}

auto SmartIoctl::parse_ata_self_test_log(const Sector& log) -> std::vector<SelfTestEntry> {
    // Descriptors form a ring; byte 508 holds the 1-based index of the newest
    const uint8_t newest = log[LOG_INDEX_OFFSET];
    if (newest == 0 || newest > LOG_DESCRIPTORS) {
        return {};
    }

    std::vector<SelfTestEntry> entries;
    for (size_t step = 1; step <= LOG_DESCRIPTORS; ++step) {
        const size_t index = (newest + step - 1) % LOG_DESCRIPTORS;  // oldest first
        const size_t offset = LOG_DESCRIPTOR_OFFSET + (index * LOG_DESCRIPTOR_SIZE);
        const uint8_t test = log[offset];
        if (test == 0) {
            continue;
        }

        const uint8_t status = log[offset + 1] >> 4;
        SelfTestEntry entry;
        entry.type = (test & 0x7F) == ATA_EXTENDED_SELF_TEST ? SelfTestType::Long
                                                             : SelfTestType::Short;
        entry.status = ata_status_text(status);
        entry.lifetime_hours = le16(&log[offset + 2]);
        entry.passed = status == 0;
        entries.push_back(std::move(entry));
    }
    return entries;
}

auto SmartIoctl::parse_nvme_smart_log(const std::array<uint8_t, NVME_SMART_LOG_SIZE>& log)
    -> SmartSnapshot {
    SmartSnapshot snapshot;
    snapshot.status = SmartStatus::Passed;

    // Temperature is reported in Kelvin
    const int kelvin = le16(&log[1]);
    if (kelvin > 0 && kelvin < 500) {
        snapshot.temperature_celsius = kelvin - KELVIN_OFFSET;
    }

    NvmeHealth health;
    health.critical_warning = log[0];
    health.available_spare = log[3];
    health.spare_threshold = log[4];
    health.percentage_used = log[5];
    // 128-bit counters; the lower 64 bits are plenty
    health.data_units_written = le_n(&log[48], 8);
    health.media_errors = le_n(&log[160], 8);
    snapshot.nvme = health;
    snapshot.power_on_hours = le_n(&log[128], 8);
    return snapshot;
}

auto SmartIoctl::parse_nvme_self_test_log(
    const std::array<uint8_t, NVME_SELF_TEST_LOG_SIZE>& log) -> SelfTestReading {
    SelfTestReading reading;

    // Results are stored newest first
    std::vector<SelfTestEntry> entries;
    std::optional<uint8_t> newest_result;
    for (size_t i = 0; i < NVME_SELF_TEST_RESULTS; ++i) {
        const size_t offset = NVME_SELF_TEST_RESULT_OFFSET + (i * NVME_SELF_TEST_RESULT_SIZE);
        const uint8_t result = log[offset] & 0x0F;
        if (result == NVME_RESULT_UNUSED) {
            continue;
        }
        const uint8_t code = log[offset] >> 4;

        SelfTestEntry entry;
        entry.type = code == 0x2 ? SelfTestType::Long : SelfTestType::Short;
        entry.status = nvme_result_text(result);
        entry.lifetime_hours = le_n(&log[offset + 4], 8);
        entry.passed = result == 0;
        entries.push_back(std::move(entry));
        if (!newest_result) {
            newest_result = result;
        }
    }
    std::ranges::reverse(entries);
    reading.log = std::move(entries);

    const uint8_t current = log[0] & 0x0F;
    if (current == 0x1 || current == 0x2) {
        reading.status.state = SelfTestState::Running;
        reading.status.type = current == 0x2 ? SelfTestType::Long : SelfTestType::Short;
        reading.status.percent_remaining = 100 - static_cast<int>(log[1] & 0x7F);
    } else if (newest_result) {
        reading.status.state = nvme_state_for(*newest_result);
    }
    return reading;
}

auto SmartIoctl::ata_status_text(uint8_t status_nibble) -> std::string {
    switch (status_nibble) {
        case 0x0:
            return "Completed without error";
        case 0x1:
            return "Aborted by host";
        case 0x2:
            return "Interrupted by host reset";
        case 0x3:
            return "Fatal or unknown error";
        case 0x4:
            return "Completed: unknown failure";
        case 0x5:
            return "Completed: electrical failure";
        case 0x6:
            return "Completed: servo/seek failure";
        case 0x7:
            return "Completed: read failure";
        case 0x8:
            return "Completed: handling damage";
        case ATA_STATUS_IN_PROGRESS:
            return "Self-test routine in progress";
        default:
            return std::format("Reserved status {:#x}", status_nibble);
    }
}
