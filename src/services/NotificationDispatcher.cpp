/**
 * @file NotificationDispatcher.cpp
 * @brief Notification worker thread
 */

#include "services/NotificationDispatcher.hpp"

#include "util/Logger.hpp"

#include <format>

NotificationDispatcher::NotificationDispatcher(
    std::shared_ptr<ConfigStore> config_store,
    std::vector<std::shared_ptr<INotificationChannel>> channels)
    : config_store_(std::move(config_store)), channels_(std::move(channels)) {}

NotificationDispatcher::~NotificationDispatcher() {
    stop();
}

void NotificationDispatcher::start() {
    std::lock_guard lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stop_requested_ = false;
    worker_ = std::thread([this] { worker_loop(); });
}

void NotificationDispatcher::stop() {
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard lock(mutex_);
    if (!queue_.empty()) {
        LOG_WARNING("NotificationDispatcher",
                    std::format("discarding {} undelivered notification(s)", queue_.size()));
        queue_.clear();
    }
    idle_cv_.notify_all();
}

auto NotificationDispatcher::should_notify(Severity severity, const NotificationsConfig& config)
    -> bool {
    return severity == Severity::Crit ? config.notify_critical : config.notify_warning;
}

void NotificationDispatcher::submit(AlertEvent event) {
    {
        std::lock_guard lock(mutex_);
        if (stop_requested_) {
            return;
        }
        if (queue_.size() >= MAX_QUEUE) {
            LOG_WARNING("NotificationDispatcher", "queue full, dropping oldest notification");
            queue_.pop_front();
        }
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

auto NotificationDispatcher::wait_idle(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
}

void NotificationDispatcher::worker_loop() {
    LOG_DEBUG("NotificationDispatcher", "worker started");
    std::unique_lock lock(mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] { return stop_requested_ || !queue_.empty(); });
        if (stop_requested_) {
            break;
        }

        auto event = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lock.unlock();

        dispatch(event);

        lock.lock();
        busy_ = false;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    LOG_DEBUG("NotificationDispatcher", "worker stopped");
}

void NotificationDispatcher::dispatch(const AlertEvent& event) {
    const auto config = config_store_->current();
    if (!should_notify(event.alert.severity, config->notifications)) {
        return;
    }

    for (const auto& channel : channels_) {
        if (!channel->is_enabled(config->notifications)) {
            continue;
        }
        if (auto result = channel->deliver(event, config->notifications); result) {
            ++delivered_;
        } else {
            ++failed_;
            LOG_WARNING("NotificationDispatcher",
                        std::format("{} delivery of alert #{} failed ({}): {}", channel->name(),
                                    event.alert.id, util::to_string(result.error().kind),
                                    result.error().message));
        }
    }
}
