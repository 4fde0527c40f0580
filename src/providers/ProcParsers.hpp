/**
 * @file ProcParsers.hpp
 * @brief Parsers for the text tables under /proc
 *
 * The parsers take file contents rather than paths so they can be fed
 * captured samples; LinuxProvider does the reading.
 */

#pragma once

#include "models/DeviceState.hpp"
#include "models/HostState.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace procfs {

/**
 * @brief Whether a kernel block name is a partition ("sda1", "nvme0n1p2")
 *
 * md and device-mapper nodes ("md0", "dm-3") are whole devices.
 */
[[nodiscard]] auto is_partition(std::string_view name) -> bool;

/**
 * @brief Whether a kernel block name is a virtual device never monitored
 */
[[nodiscard]] auto is_virtual_device(std::string_view name) -> bool;

/**
 * @brief Parse /proc/diskstats
 * @param text File contents
 * @param captured_at Timestamp stamped on every counter set
 * @return Counters of whole physical devices keyed by kernel name
 *
 * Partitions, virtual devices and lines with fewer than 14 fields are
 * skipped.
 */
[[nodiscard]] auto parse_diskstats(std::string_view text, util::TimePoint captured_at)
    -> std::map<std::string, IoCounters>;

/**
 * @brief Parse /proc/self/mountstats, keeping nfs and nfs4 mounts only
 *
 * Round-trip times are averaged per operation from the cumulative RTT
 * column of the READ and WRITE rows.
 */
[[nodiscard]] auto parse_mountstats(std::string_view text) -> std::vector<NfsMountStats>;

/**
 * @brief Parse /proc/mdstat into one VolumeStatus per md array
 *
 * An inactive array is Failed, a recovering or resyncing one Rebuilding,
 * one with a missing member in its [UU_] map Degraded.
 */
[[nodiscard]] auto parse_mdstat(std::string_view text) -> std::vector<VolumeStatus>;

/**
 * @brief Whether a filesystem type is served over the network (NFS, SMB, sshfs, ...)
 */
[[nodiscard]] auto is_network_filesystem(std::string_view fs_type) -> bool;

/**
 * @brief Whether a mount is a pseudo, system or network filesystem not watched for usage
 */
[[nodiscard]] auto is_pseudo_mount(std::string_view device, std::string_view mount,
                                   std::string_view fs_type) -> bool;

}  // namespace procfs
