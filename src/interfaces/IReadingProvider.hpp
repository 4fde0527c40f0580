/**
 * @file IReadingProvider.hpp
 * @brief Interface for raw per-domain data sources
 *
 * Providers return already-parsed structured readings. A missing tool or
 * driver is reported as ProviderUnavailable, a failed or timed out call as
 * TransientFetchError; neither may throw.
 */

#pragma once

#include "models/DeviceState.hpp"
#include "models/HostState.hpp"
#include "models/Readings.hpp"
#include "models/SmartData.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <string>
#include <vector>

/**
 * @struct FetchContext
 * @brief Deadline and cancellation flag for one provider call
 */
struct FetchContext {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    const std::atomic<bool>* cancel = nullptr;

    [[nodiscard]] auto cancelled() const -> bool {
        return cancel != nullptr && cancel->load();
    }

    [[nodiscard]] auto expired() const -> bool {
        return cancelled() || std::chrono::steady_clock::now() >= deadline;
    }

    [[nodiscard]] static auto with_timeout(std::chrono::milliseconds timeout,
                                           const std::atomic<bool>* cancel_flag = nullptr)
        -> FetchContext {
        return FetchContext{std::chrono::steady_clock::now() + timeout, cancel_flag};
    }
};

/**
 * @class IReadingProvider
 * @brief Abstract source of SMART, I/O, filesystem, NFS, volume and self-test readings
 *
 * Implementations must be safe to call from several scheduler threads at
 * once; calls for different devices may run in parallel.
 */
class IReadingProvider {
public:
    virtual ~IReadingProvider() = default;

    /**
     * @brief Enumerate block devices currently present
     */
    [[nodiscard]] virtual auto list_devices(const FetchContext& ctx)
        -> util::Result<std::vector<DeviceIdentity>> = 0;

    /**
     * @brief Read the SMART table of one device
     */
    [[nodiscard]] virtual auto fetch_smart(const DeviceIdentity& device, const FetchContext& ctx)
        -> util::Result<SmartSnapshot> = 0;

    /**
     * @brief Read cumulative I/O counters for all devices, keyed by device id
     */
    [[nodiscard]] virtual auto fetch_io_counters(const FetchContext& ctx)
        -> util::Result<std::map<std::string, IoCounters>> = 0;

    [[nodiscard]] virtual auto fetch_filesystems(const FetchContext& ctx)
        -> util::Result<std::vector<FilesystemUsage>> = 0;

    [[nodiscard]] virtual auto fetch_nfs(const FetchContext& ctx)
        -> util::Result<std::vector<NfsMountStats>> = 0;

    [[nodiscard]] virtual auto fetch_volumes(const FetchContext& ctx)
        -> util::Result<std::vector<VolumeStatus>> = 0;

    /**
     * @brief Ask the drive to start a self-test and return immediately
     */
    virtual auto start_self_test(const DeviceIdentity& device, SelfTestType type)
        -> util::Result<void> = 0;

    /**
     * @brief Read self-test progress and, when available, the drive's self-test log
     */
    [[nodiscard]] virtual auto fetch_self_test(const DeviceIdentity& device,
                                               const FetchContext& ctx)
        -> util::Result<SelfTestReading> = 0;
};
