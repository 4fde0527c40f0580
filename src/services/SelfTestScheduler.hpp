/**
 * @file SelfTestScheduler.hpp
 * @brief Issues SMART self-tests and tracks them to completion
 */

#pragma once

#include "interfaces/IReadingProvider.hpp"
#include "services/ConfigStore.hpp"
#include "services/DeviceStateStore.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @class SelfTestScheduler
 * @brief Fire-and-forget self-test requests plus a tracking thread
 *
 * Starting a test only asks the provider to begin. The tracking thread
 * polls progress every selftest_poll_sec and merges it into the device's
 * self-test status until a terminal state is seen. A test still running
 * after its maximum duration is marked TimedOut. Waiters block only their
 * own thread; the poll loop and other devices are never held up.
 */
class SelfTestScheduler {
public:
    /**
     * @param poll_interval Tracking cadence; zero takes selftest_poll_sec from the config
     */
    SelfTestScheduler(std::shared_ptr<IReadingProvider> provider,
                      std::shared_ptr<DeviceStateStore> store,
                      std::shared_ptr<ConfigStore> config_store,
                      std::chrono::milliseconds poll_interval = std::chrono::milliseconds{0});
    ~SelfTestScheduler();

    SelfTestScheduler(const SelfTestScheduler&) = delete;
    SelfTestScheduler& operator=(const SelfTestScheduler&) = delete;

    void start();
    void stop();

    /**
     * @brief Ask the drive to start a test and begin tracking it
     * @return The Running status; NotFound for unknown devices,
     *         InvalidArgument if a test is already starting or being tracked
     *
     * The device is reserved before the provider is asked, so concurrent
     * requests for one device start at most one test.
     */
    auto schedule(const std::string& device, SelfTestType type) -> util::Result<SelfTestStatus>;

    /**
     * @brief Schedule, then wait for a terminal state or `timeout`
     *
     * Reaching `timeout` is not an error: the status returned is the one
     * current at that moment (typically Running) and tracking continues.
     */
    auto schedule_and_wait(const std::string& device, SelfTestType type,
                           std::chrono::milliseconds timeout) -> util::Result<SelfTestStatus>;

    [[nodiscard]] auto status(const std::string& device) const -> util::Result<SelfTestStatus>;

    /**
     * @brief The drive's self-test log, most recent last
     */
    [[nodiscard]] auto log(const std::string& device) const
        -> util::Result<std::vector<SelfTestEntry>>;

    [[nodiscard]] auto is_tracking(const std::string& device) const -> bool;

    /**
     * @brief Poll every tracked test once
     */
    void poll_once();

private:
    struct Tracked {
        DeviceIdentity identity;
        SelfTestType type = SelfTestType::Short;
        util::TimePoint started_at{};
        std::chrono::steady_clock::time_point deadline{};
        bool pending = true;  ///< Reserved while the provider starts the test
    };

    void tracker_loop();
    auto poll_one(const Tracked& tracked) -> bool;
    [[nodiscard]] auto interval() const -> std::chrono::milliseconds;

    std::shared_ptr<IReadingProvider> provider_;
    std::shared_ptr<DeviceStateStore> store_;
    std::shared_ptr<ConfigStore> config_store_;
    std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_cv_;
    std::condition_variable done_cv_;
    std::map<std::string, Tracked> tracked_;
    bool stop_requested_ = false;
    bool work_added_ = false;
    std::atomic<bool> cancel_{false};
    std::thread worker_;
};
