/**
 * @file PollingScheduler.hpp
 * @brief One polling cadence per data domain
 */

#pragma once

#include "interfaces/IReadingProvider.hpp"
#include "services/ConfigStore.hpp"
#include "services/DeviceStateStore.hpp"
#include "util/Result.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

/**
 * @class PollingScheduler
 * @brief Fetches readings from the provider and merges them into the store
 *
 * Each of the SMART, I/O, filesystem, NFS and volume domains runs on its
 * own thread with its own interval, re-read from the config before every
 * wait. Every provider call runs on a worker and is bounded by
 * fetch_timeout_ms; a failed or late fetch marks the domain stale and keeps
 * the previous data. A call that outlives its deadline stays in flight
 * and the same fetch is skipped until it returns, so a hung device holds
 * at most one worker. SMART reads for different devices run in parallel,
 * each merged through the store's per-device merge point. The I/O cycle
 * also enumerates devices and turns enumeration changes into hotplug
 * events.
 */
class PollingScheduler {
public:
    /// Domains with their own polling thread
    static constexpr std::array<Domain, 5> POLLED_DOMAINS = {
        Domain::Smart, Domain::IoCounters, Domain::Filesystem, Domain::Nfs, Domain::Volume};

    /// Invoked after every completed cycle, successful or not
    using CycleListener = std::function<void(Domain)>;

    PollingScheduler(std::shared_ptr<IReadingProvider> provider,
                     std::shared_ptr<DeviceStateStore> store,
                     std::shared_ptr<ConfigStore> config_store);
    ~PollingScheduler();

    PollingScheduler(const PollingScheduler&) = delete;
    PollingScheduler& operator=(const PollingScheduler&) = delete;

    /**
     * @brief Enumerate devices once, then start one thread per domain
     */
    void start();

    /**
     * @brief Cancel in-flight fetches and join every domain thread
     *
     * Provider calls that ignore cancellation are abandoned, not waited for.
     */
    void stop();

    [[nodiscard]] auto is_running() const -> bool { return running_.load(); }

    void set_cycle_listener(CycleListener listener);

    /**
     * @brief Run one cycle of a domain on the calling thread
     * @return The provider error if the cycle failed
     */
    auto poll_once(Domain domain) -> util::Result<void>;

    /**
     * @brief Enumerate devices, apply exclusions and emit hotplug events
     */
    auto refresh_devices() -> util::Result<void>;

    /**
     * @brief Fetch and merge SMART data of one device now
     */
    auto repoll_smart(const std::string& device) -> util::Result<void>;

    /**
     * @brief Wake a domain's thread before its interval elapses
     *
     * Domain::SelfTest has no polling thread and is ignored.
     */
    void request_poll(Domain domain);

    /**
     * @brief Consecutive failed cycles of a domain, 0 for Domain::SelfTest
     */
    [[nodiscard]] auto failure_streak(Domain domain) const -> int;

    /**
     * @brief Provider calls that passed their deadline and have not returned
     */
    [[nodiscard]] auto in_flight() const -> std::vector<std::string>;

    [[nodiscard]] static auto interval_for(Domain domain, const Config& config)
        -> std::chrono::milliseconds;

private:
    /// Keys of provider calls whose worker is still running
    struct InFlight {
        std::mutex mutex;
        std::set<std::string> keys;
    };

    template <typename T>
    using Fetch = std::function<util::Result<T>(const FetchContext&)>;

    void domain_loop(Domain domain);
    auto poll_smart() -> util::Result<void>;
    auto poll_io() -> util::Result<void>;
    auto poll_host(Domain domain) -> util::Result<void>;

    [[nodiscard]] auto make_context() const -> FetchContext;

    template <typename T>
    auto launch(const std::string& key, const FetchContext& ctx, Fetch<T> fetch)
        -> util::Result<std::future<util::Result<T>>>;
    template <typename T>
    auto await(const std::string& key, std::future<util::Result<T>>& future,
               const FetchContext& ctx) -> util::Result<T>;
    template <typename T>
    auto bounded_fetch(const std::string& key, Fetch<T> fetch) -> util::Result<T>;

    auto launch_smart(const DeviceIdentity& identity, const FetchContext& ctx)
        -> util::Result<std::future<util::Result<SmartSnapshot>>>;
    auto merge_smart(const std::string& device, util::Result<SmartSnapshot> snapshot)
        -> util::Result<void>;

    void record_outcome(Domain domain, const util::Result<void>& result);
    void notify_cycle(Domain domain);

    [[nodiscard]] static auto index_of(Domain domain) -> std::optional<size_t>;

    std::shared_ptr<IReadingProvider> provider_;
    std::shared_ptr<DeviceStateStore> store_;
    std::shared_ptr<ConfigStore> config_store_;

    std::atomic<bool> running_{false};
    /// Shared with workers so an abandoned call never sees a dangling flag
    std::shared_ptr<std::atomic<bool>> cancel_ = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<InFlight> in_flight_ = std::make_shared<InFlight>();

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::array<bool, POLLED_DOMAINS.size()> wake_requested_{};
    std::vector<std::thread> threads_;

    std::array<std::atomic<int>, POLLED_DOMAINS.size()> failures_{};

    std::mutex listener_mutex_;
    CycleListener cycle_listener_;
};
