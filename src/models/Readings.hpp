/**
 * @file Readings.hpp
 * @brief Point-in-time readings handed from the scheduler to the state store
 *
 * The set of domains is closed, so readings are variants dispatched with
 * std::visit rather than a class hierarchy.
 */

#pragma once

#include <optional>
#include <variant>
#include <vector>

#include "models/DeviceState.hpp"
#include "models/HostState.hpp"
#include "models/SmartData.hpp"

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

struct SmartReading {
    SmartSnapshot snapshot;
};

struct IoReading {
    IoCounters counters;
};

/**
 * @struct SelfTestReading
 * @brief Self-test progress; `log` is only replaced when present
 */
struct SelfTestReading {
    SelfTestStatus status;
    std::optional<std::vector<SelfTestEntry>> log;
};

using DeviceReading = std::variant<SmartReading, IoReading, SelfTestReading>;

struct FilesystemReading {
    std::vector<FilesystemUsage> filesystems;
    util::TimePoint captured_at{};  ///< Defaults to the merge time
};

struct NfsReading {
    std::vector<NfsMountStats> mounts;
};

struct VolumeReading {
    std::vector<VolumeStatus> volumes;
};

using HostReading = std::variant<FilesystemReading, NfsReading, VolumeReading>;

[[nodiscard]] inline auto domain_of(const DeviceReading& reading) -> Domain {
    return std::visit(overloaded{[](const SmartReading&) { return Domain::Smart; },
                                 [](const IoReading&) { return Domain::IoCounters; },
                                 [](const SelfTestReading&) { return Domain::SelfTest; }},
                      reading);
}

[[nodiscard]] inline auto domain_of(const HostReading& reading) -> Domain {
    return std::visit(overloaded{[](const FilesystemReading&) { return Domain::Filesystem; },
                                 [](const NfsReading&) { return Domain::Nfs; },
                                 [](const VolumeReading&) { return Domain::Volume; }},
                      reading);
}
