/**
 * @file HostState.hpp
 * @brief Host-wide readings not tied to one block device
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/Time.hpp"

/**
 * @struct FilesystemUsage
 * @brief Space and inode usage of one mounted filesystem
 */
struct FilesystemUsage {
    std::string device;
    std::string mount;
    std::string fs_type;
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t avail_bytes = 0;
    uint64_t total_inodes = 0;
    uint64_t free_inodes = 0;

    std::optional<double> fill_rate_bps;    ///< Positive when filling
    std::optional<double> days_until_full;  ///< Only set while filling

    [[nodiscard]] auto use_pct() const -> double {
        if (total_bytes == 0) {
            return 0.0;
        }
        return static_cast<double>(total_bytes - avail_bytes) / static_cast<double>(total_bytes) *
               100.0;
    }

    [[nodiscard]] auto inode_pct() const -> double {
        if (total_inodes == 0) {
            return 0.0;
        }
        return static_cast<double>(total_inodes - free_inodes) /
               static_cast<double>(total_inodes) * 100.0;
    }

    auto operator==(const FilesystemUsage&) const -> bool = default;
};

/**
 * @struct NfsMountStats
 * @brief Per-mount RPC statistics from /proc/self/mountstats
 */
struct NfsMountStats {
    std::string device;  ///< "server:/export"
    std::string mount;
    std::string fs_type;
    uint64_t age_secs = 0;
    uint64_t read_ops = 0;
    uint64_t write_ops = 0;
    double read_rtt_ms = 0.0;
    double write_rtt_ms = 0.0;

    [[nodiscard]] auto max_rtt_ms() const -> double {
        return read_rtt_ms > write_rtt_ms ? read_rtt_ms : write_rtt_ms;
    }

    auto operator==(const NfsMountStats&) const -> bool = default;
};

/**
 * @enum VolumeHealth
 * @brief Volume-manager verdict for an array or pool
 */
enum class VolumeHealth { Healthy, Rebuilding, Degraded, Failed };

[[nodiscard]] auto to_string(VolumeHealth health) -> std::string_view;

/**
 * @struct VolumeStatus
 * @brief One md RAID array, LVM volume group or ZFS pool
 */
struct VolumeStatus {
    std::string name;
    std::string kind;   ///< "md", "lvm", "zfs"
    std::string level;  ///< e.g. "raid1"
    std::string state;  ///< Raw state text
    VolumeHealth health = VolumeHealth::Healthy;
    std::optional<double> rebuild_pct;
    std::vector<std::string> members;

    auto operator==(const VolumeStatus&) const -> bool = default;
};

/**
 * @struct HostState
 * @brief Host-wide readings; each vector is replaced whole by its domain
 */
struct HostState {
    std::vector<FilesystemUsage> filesystems;
    std::vector<NfsMountStats> nfs_mounts;
    std::vector<VolumeStatus> volumes;

    bool filesystems_stale = false;
    bool nfs_stale = false;
    bool volumes_stale = false;
    util::TimePoint filesystems_updated_at{};
    util::TimePoint nfs_updated_at{};
    util::TimePoint volumes_updated_at{};
};
