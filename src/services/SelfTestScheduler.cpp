/**
 * @file SelfTestScheduler.cpp
 * @brief Self-test tracking thread
 */

#include "services/SelfTestScheduler.hpp"

#include "util/Logger.hpp"

#include <format>

SelfTestScheduler::SelfTestScheduler(std::shared_ptr<IReadingProvider> provider,
                                     std::shared_ptr<DeviceStateStore> store,
                                     std::shared_ptr<ConfigStore> config_store,
                                     std::chrono::milliseconds poll_interval)
    : provider_(std::move(provider)),
      store_(std::move(store)),
      config_store_(std::move(config_store)),
      poll_interval_(poll_interval) {}

SelfTestScheduler::~SelfTestScheduler() {
    stop();
}

void SelfTestScheduler::start() {
    std::lock_guard lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stop_requested_ = false;
    cancel_ = false;
    worker_ = std::thread([this] { tracker_loop(); });
}

void SelfTestScheduler::stop() {
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
    }
    cancel_ = true;
    wake_cv_.notify_all();
    done_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto SelfTestScheduler::interval() const -> std::chrono::milliseconds {
    if (poll_interval_.count() > 0) {
        return poll_interval_;
    }
    return std::chrono::seconds(config_store_->current()->general.selftest_poll_sec);
}

auto SelfTestScheduler::schedule(const std::string& device, SelfTestType type)
    -> util::Result<SelfTestStatus> {
    auto snapshot = store_->get_snapshot(device);
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    {
        std::lock_guard lock(mutex_);
        if (tracked_.contains(device)) {
            return util::fail(util::ErrorKind::InvalidArgument,
                              std::format("a self-test is already running on {}", device));
        }
        tracked_.emplace(device, Tracked{(*snapshot)->identity, type, {}, {}, true});
    }

    auto release = [this, &device] {
        {
            std::lock_guard lock(mutex_);
            tracked_.erase(device);
        }
        done_cv_.notify_all();
    };

    if (auto started = provider_->start_self_test((*snapshot)->identity, type); !started) {
        LOG_WARNING("SelfTestScheduler", std::format("could not start {} self-test on {}: {}",
                                                     to_string(type), device,
                                                     started.error().message));
        release();
        return std::unexpected(started.error());
    }

    const auto config = config_store_->current();
    const auto limit = std::chrono::minutes(type == SelfTestType::Long
                                                ? config->general.selftest_long_timeout_min
                                                : config->general.selftest_short_timeout_min);
    const auto now = util::Clock::now();

    SelfTestStatus status;
    status.state = SelfTestState::Running;
    status.type = type;
    status.started_at = now;
    status.updated_at = now;

    if (auto merged = store_->merge(device, SelfTestReading{status, std::nullopt}); !merged) {
        release();
        return std::unexpected(merged.error());
    }

    {
        std::lock_guard lock(mutex_);
        auto& tracked = tracked_[device];
        tracked.started_at = now;
        tracked.deadline = std::chrono::steady_clock::now() + limit;
        tracked.pending = false;
        work_added_ = true;
    }
    wake_cv_.notify_all();

    LOG_INFO("SelfTestScheduler", std::format("{} self-test started on {}", to_string(type), device));
    return status;
}

auto SelfTestScheduler::schedule_and_wait(const std::string& device, SelfTestType type,
                                          std::chrono::milliseconds timeout)
    -> util::Result<SelfTestStatus> {
    auto scheduled = schedule(device, type);
    if (!scheduled) {
        return scheduled;
    }

    {
        std::unique_lock lock(mutex_);
        const bool finished = done_cv_.wait_for(lock, timeout, [this, &device] {
            return stop_requested_ || !tracked_.contains(device);
        });
        if (!finished) {
            LOG_INFO("SelfTestScheduler",
                     std::format("wait for self-test on {} ended after {} ms, still running", device,
                                 timeout.count()));
        }
    }
    return status(device);
}

auto SelfTestScheduler::status(const std::string& device) const -> util::Result<SelfTestStatus> {
    auto snapshot = store_->get_snapshot(device);
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return (*snapshot)->self_test;
}

auto SelfTestScheduler::log(const std::string& device) const
    -> util::Result<std::vector<SelfTestEntry>> {
    auto snapshot = store_->get_snapshot(device);
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return (*snapshot)->self_test_log;
}

auto SelfTestScheduler::is_tracking(const std::string& device) const -> bool {
    std::lock_guard lock(mutex_);
    return tracked_.contains(device);
}

void SelfTestScheduler::tracker_loop() {
    LOG_DEBUG("SelfTestScheduler", "tracker started");
    while (true) {
        {
            std::unique_lock lock(mutex_);
            wake_cv_.wait_for(lock, interval(),
                              [this] { return stop_requested_ || work_added_; });
            if (stop_requested_) {
                break;
            }
            work_added_ = false;
        }
        poll_once();
    }
    LOG_DEBUG("SelfTestScheduler", "tracker stopped");
}

void SelfTestScheduler::poll_once() {
    std::vector<std::pair<std::string, Tracked>> work;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [device, tracked] : tracked_) {
            if (!tracked.pending) {
                work.emplace_back(device, tracked);
            }
        }
    }

    std::vector<std::string> finished;
    for (const auto& [device, tracked] : work) {
        if (cancel_) {
            return;
        }
        if (poll_one(tracked)) {
            finished.push_back(device);
        }
    }

    if (!finished.empty()) {
        {
            std::lock_guard lock(mutex_);
            for (const auto& device : finished) {
                tracked_.erase(device);
            }
        }
        done_cv_.notify_all();
    }
}

auto SelfTestScheduler::poll_one(const Tracked& tracked) -> bool {
    const auto& device = tracked.identity.id;
    const auto config = config_store_->current();
    const auto ctx = FetchContext::with_timeout(
        std::chrono::milliseconds(config->general.fetch_timeout_ms), &cancel_);

    auto reading = provider_->fetch_self_test(tracked.identity, ctx);
    const auto now = util::Clock::now();

    if (!reading) {
        LOG_DEBUG("SelfTestScheduler", std::format("self-test poll of {} failed: {}", device,
                                                   reading.error().message));
        store_->mark_stale(device, Domain::SelfTest);
        if (std::chrono::steady_clock::now() < tracked.deadline) {
            return false;
        }
        reading = SelfTestReading{};
        reading->status.state = SelfTestState::Running;
    }

    auto& status = reading->status;
    status.type = tracked.type;
    status.started_at = tracked.started_at;
    status.updated_at = now;

    if (status.state == SelfTestState::Idle) {
        // The drive no longer reports the test as active and gave no verdict
        status.state = SelfTestState::Running;
    }

    if (!is_terminal(status.state) && std::chrono::steady_clock::now() >= tracked.deadline) {
        status.state = SelfTestState::TimedOut;
        status.percent_remaining.reset();
        LOG_WARNING("SelfTestScheduler",
                    std::format("{}: {} self-test on {} exceeded its allowed duration",
                                util::to_string(util::ErrorKind::SelfTestTimeout),
                                to_string(tracked.type), device));
    }

    const auto final_state = status.state;
    const bool terminal = is_terminal(final_state);
    if (auto merged = store_->merge(device, std::move(*reading)); !merged) {
        LOG_INFO("SelfTestScheduler",
                 std::format("dropping self-test tracking for {}: {}", device, merged.error().message));
        return true;
    }

    if (terminal) {
        LOG_INFO("SelfTestScheduler", std::format("{} self-test on {} finished: {}",
                                                  to_string(tracked.type), device,
                                                  to_string(final_state)));
    }
    return terminal;
}
