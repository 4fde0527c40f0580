/**
 * @file LinuxProvider.hpp
 * @brief IReadingProvider backed by sysfs, procfs, statvfs and SMART ioctls
 */

#pragma once

#include "interfaces/IReadingProvider.hpp"
#include "providers/SmartIoctl.hpp"

#include <filesystem>
#include <optional>
#include <string>

/**
 * @class LinuxProvider
 * @brief Reads every monitored domain straight from kernel interfaces
 *
 * Roots are injectable so tests can point the provider at a fake sysfs
 * and procfs tree:
 * - devices: `<sys>/block/<name>/{size,queue/rotational,device/model,device/serial}`
 * - I/O counters: `<proc>/diskstats`
 * - filesystems: `<proc>/mounts` plus statvfs(3)
 * - NFS: `<proc>/self/mountstats`
 * - md RAID: `<proc>/mdstat`
 * - SMART and self-tests: ioctls on `<dev>/<name>`
 */
class LinuxProvider : public IReadingProvider {
public:
    LinuxProvider() : LinuxProvider("/sys", "/proc", "/dev") {}
    LinuxProvider(std::filesystem::path sys_root, std::filesystem::path proc_root,
                  std::filesystem::path dev_root);

    [[nodiscard]] auto list_devices(const FetchContext& ctx)
        -> util::Result<std::vector<DeviceIdentity>> override;

    [[nodiscard]] auto fetch_smart(const DeviceIdentity& device, const FetchContext& ctx)
        -> util::Result<SmartSnapshot> override;

    [[nodiscard]] auto fetch_io_counters(const FetchContext& ctx)
        -> util::Result<std::map<std::string, IoCounters>> override;

    [[nodiscard]] auto fetch_filesystems(const FetchContext& ctx)
        -> util::Result<std::vector<FilesystemUsage>> override;

    [[nodiscard]] auto fetch_nfs(const FetchContext& ctx)
        -> util::Result<std::vector<NfsMountStats>> override;

    [[nodiscard]] auto fetch_volumes(const FetchContext& ctx)
        -> util::Result<std::vector<VolumeStatus>> override;

    auto start_self_test(const DeviceIdentity& device, SelfTestType type)
        -> util::Result<void> override;

    [[nodiscard]] auto fetch_self_test(const DeviceIdentity& device, const FetchContext& ctx)
        -> util::Result<SelfTestReading> override;

    /**
     * @brief Guess the transport from the resolved sysfs device path
     * @param sys_path Canonical path of /sys/block/<name>
     */
    [[nodiscard]] static auto transport_from_path(std::string_view name, std::string_view sys_path)
        -> std::string;

    /**
     * @brief Whether SMART ioctls can reach a device of this kind and transport
     */
    [[nodiscard]] static auto supports_smart(const DeviceIdentity& device) -> bool;

private:
    [[nodiscard]] auto read_identity(const std::filesystem::path& block_dir) const
        -> std::optional<DeviceIdentity>;
    [[nodiscard]] auto read_proc(const std::string& relative) const -> util::Result<std::string>;
    [[nodiscard]] auto device_node(const DeviceIdentity& device) const -> std::string;
    [[nodiscard]] auto check_smart(const DeviceIdentity& device, const FetchContext& ctx) const
        -> util::Result<void>;

    std::filesystem::path sys_root_;
    std::filesystem::path proc_root_;
    std::filesystem::path dev_root_;
    SmartIoctl smart_;
};
