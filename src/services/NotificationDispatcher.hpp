/**
 * @file NotificationDispatcher.hpp
 * @brief Best-effort delivery of alert events to side channels
 */

#pragma once

#include "interfaces/INotificationChannel.hpp"
#include "interfaces/INotificationSink.hpp"
#include "services/ConfigStore.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @class NotificationDispatcher
 * @brief Queues alert events and delivers them from a worker thread
 *
 * submit() never blocks on delivery. Each channel is tried independently;
 * a failing channel is logged and does not stop the others. Warn-level
 * events are dropped unless notify_warning is set, crit-level events
 * unless notify_critical is set.
 */
class NotificationDispatcher : public INotificationSink {
public:
    static constexpr size_t MAX_QUEUE = 256;

    NotificationDispatcher(std::shared_ptr<ConfigStore> config_store,
                           std::vector<std::shared_ptr<INotificationChannel>> channels);
    ~NotificationDispatcher() override;

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    void start();

    /**
     * @brief Stop the worker; events still queued are discarded
     */
    void stop();

    void submit(AlertEvent event) override;

    /**
     * @brief Block until the queue is drained and no delivery is running
     * @return false on timeout
     */
    auto wait_idle(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto delivered_count() const -> size_t { return delivered_.load(); }
    [[nodiscard]] auto failed_count() const -> size_t { return failed_.load(); }

    /**
     * @brief Whether a severity passes the notify_warning/notify_critical filter
     */
    [[nodiscard]] static auto should_notify(Severity severity, const NotificationsConfig& config)
        -> bool;

private:
    void worker_loop();
    void dispatch(const AlertEvent& event);

    std::shared_ptr<ConfigStore> config_store_;
    std::vector<std::shared_ptr<INotificationChannel>> channels_;

    std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<AlertEvent> queue_;
    bool busy_ = false;
    bool stop_requested_ = false;
    std::thread worker_;

    std::atomic<size_t> delivered_{0};
    std::atomic<size_t> failed_{0};
};
