/**
 * @file SmartData.cpp
 * @brief SMART model helpers
 */

#include "models/SmartData.hpp"

namespace smart {

auto attribute_name(uint32_t id) -> std::string_view {
    switch (id) {
        case 1:
            return "Raw_Read_Error_Rate";
        case 3:
            return "Spin_Up_Time";
        case 4:
            return "Start_Stop_Count";
        case REALLOCATED_SECTORS:
            return "Reallocated_Sector_Ct";
        case 7:
            return "Seek_Error_Rate";
        case POWER_ON_HOURS:
            return "Power_On_Hours";
        case 10:
            return "Spin_Retry_Count";
        case 12:
            return "Power_Cycle_Count";
        case 177:
            return "Wear_Leveling_Count";
        case 187:
            return "Reported_Uncorrect";
        case 190:
            return "Airflow_Temperature_Cel";
        case TEMPERATURE:
            return "Temperature_Celsius";
        case 196:
            return "Reallocated_Event_Count";
        case CURRENT_PENDING_SECTORS:
            return "Current_Pending_Sector";
        case OFFLINE_UNCORRECTABLE:
            return "Offline_Uncorrectable";
        case UDMA_CRC_ERRORS:
            return "UDMA_CRC_Error_Count";
        case 231:
            return "SSD_Life_Left";
        case 241:
            return "Total_LBAs_Written";
        case NVME_MEDIA_ERRORS:
            return "NVMe_Media_Errors";
        default:
            return {};
    }
}

}  // namespace smart

auto to_string(DeviceKind kind) -> std::string_view {
    switch (kind) {
        case DeviceKind::HDD:
            return "hdd";
        case DeviceKind::SSD:
            return "ssd";
        case DeviceKind::NVMe:
            return "nvme";
    }
    return "hdd";
}

auto device_kind_from_string(std::string_view text) -> std::optional<DeviceKind> {
    if (text == "hdd") {
        return DeviceKind::HDD;
    }
    if (text == "ssd") {
        return DeviceKind::SSD;
    }
    if (text == "nvme") {
        return DeviceKind::NVMe;
    }
    return std::nullopt;
}

auto to_string(SmartStatus status) -> std::string_view {
    switch (status) {
        case SmartStatus::Unknown:
            return "unknown";
        case SmartStatus::Passed:
            return "passed";
        case SmartStatus::Warning:
            return "warning";
        case SmartStatus::Failed:
            return "failed";
    }
    return "unknown";
}

auto smart_status_from_string(std::string_view text) -> SmartStatus {
    if (text == "passed") {
        return SmartStatus::Passed;
    }
    if (text == "warning") {
        return SmartStatus::Warning;
    }
    if (text == "failed") {
        return SmartStatus::Failed;
    }
    return SmartStatus::Unknown;
}

auto SmartSnapshot::raw_or(uint32_t id, uint64_t fallback) const -> uint64_t {
    if (id == smart::NVME_MEDIA_ERRORS) {
        return nvme ? nvme->media_errors : fallback;
    }
    const auto* attr = find(id);
    return attr ? attr->raw_value : fallback;
}

void SmartSnapshot::derive_status() {
    if (status != SmartStatus::Passed) {
        return;
    }

    for (const auto& [id, attr] : attributes) {
        if (attr.is_at_risk()) {
            status = SmartStatus::Warning;
            return;
        }
    }

    if (nvme) {
        if (nvme->critical_warning != 0 || nvme->media_errors > 0 ||
            nvme->available_spare < nvme->spare_threshold) {
            status = SmartStatus::Warning;
        }
    }
}
