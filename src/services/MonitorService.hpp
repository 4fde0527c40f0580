/**
 * @file MonitorService.hpp
 * @brief Owns the monitoring core and exposes its query/command surface
 */

#pragma once

#include "interfaces/INotificationChannel.hpp"
#include "interfaces/IReadingProvider.hpp"
#include "services/AlertEngine.hpp"
#include "services/ConfigStore.hpp"
#include "services/DeviceStateStore.hpp"
#include "services/HealthEngine.hpp"
#include "services/NotificationDispatcher.hpp"
#include "services/PersistenceLayer.hpp"
#include "services/PollingScheduler.hpp"
#include "services/SelfTestScheduler.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @class MonitorService
 * @brief Composition root of the monitor
 *
 * Builds the state store, engines, schedulers and dispatcher, connects
 * the store's merge hooks to health and alert evaluation, restores
 * persisted state at startup and saves it as it changes. Dashboards, the
 * CLI and the D-Bus daemon only go through the methods below.
 *
 * @example
 * ```cpp
 * auto monitor = std::make_shared<MonitorService>(config_store, provider, persistence,
 *                                                 channels);
 * if (auto ok = monitor->initialize(); !ok) {
 *     LOG_WARNING("main", ok.error().message);
 * }
 * monitor->start();
 * ```
 */
class MonitorService {
public:
    static constexpr std::chrono::seconds ENDURANCE_SAVE_INTERVAL{60};

    MonitorService(std::shared_ptr<ConfigStore> config_store,
                   std::shared_ptr<IReadingProvider> provider,
                   std::shared_ptr<PersistenceLayer> persistence,
                   std::vector<std::shared_ptr<INotificationChannel>> channels,
                   std::chrono::milliseconds self_test_poll_interval = std::chrono::milliseconds{0});
    ~MonitorService();

    MonitorService(const MonitorService&) = delete;
    MonitorService& operator=(const MonitorService&) = delete;

    /**
     * @brief Wire components and restore persisted state
     *
     * Unreadable persisted files are logged and skipped; the first error
     * is returned after everything readable has been restored.
     */
    auto initialize() -> util::Result<void>;

    void start();

    /**
     * @brief Stop all threads and save everything still unsaved
     */
    void stop();

    /**
     * @brief Save health history, anomalies, endurance and the SMART cache now
     */
    void flush();

    // Queries

    [[nodiscard]] auto devices() const -> std::vector<DeviceStateStore::StatePtr>;
    [[nodiscard]] auto device(const std::string& id) const
        -> util::Result<DeviceStateStore::StatePtr>;
    [[nodiscard]] auto host() const -> DeviceStateStore::HostPtr;
    [[nodiscard]] auto alerts(const AlertQuery& query) const -> util::Result<std::vector<Alert>>;
    [[nodiscard]] auto recent_alerts() const -> std::vector<Alert>;
    [[nodiscard]] auto health_history(const std::string& device, int days) const
        -> std::vector<HealthHistoryPoint>;
    [[nodiscard]] auto anomalies(const std::optional<std::string>& device = std::nullopt) const
        -> std::vector<AnomalyRecord>;

    /**
     * @brief Compare the current SMART snapshot with the latest saved baseline
     * @return NotFound without a snapshot or a baseline
     */
    [[nodiscard]] auto baseline_diff(const std::string& device) const
        -> util::Result<BaselineDiff>;

    [[nodiscard]] auto self_test_status(const std::string& device) const
        -> util::Result<SelfTestStatus>;
    [[nodiscard]] auto self_test_log(const std::string& device) const
        -> util::Result<std::vector<SelfTestEntry>>;

    // Commands

    auto acknowledge(uint64_t alert_id) -> util::Result<void>;
    auto acknowledge_all() -> size_t;

    /**
     * @brief Save the device's current SMART snapshot as a new baseline
     */
    auto save_baseline(const std::string& device) -> util::Result<Baseline>;

    /**
     * @brief Start a self-test, optionally waiting up to `wait` for the result
     */
    auto schedule_self_test(const std::string& device, SelfTestType type,
                            std::optional<std::chrono::milliseconds> wait = std::nullopt)
        -> util::Result<SelfTestStatus>;

    auto clear_anomalies(const std::optional<std::string>& device = std::nullopt) -> size_t;

    auto repoll(const std::string& device) -> util::Result<void>;

    /**
     * @brief Send a synthetic critical alert through the webhook channel
     */
    auto test_webhook() -> util::Result<void>;

    [[nodiscard]] auto config() const -> std::shared_ptr<const Config> {
        return config_store_->current();
    }

    // Components, for embedding and tests

    [[nodiscard]] auto store() const -> const std::shared_ptr<DeviceStateStore>& { return store_; }
    [[nodiscard]] auto scheduler() const -> const std::shared_ptr<PollingScheduler>& {
        return scheduler_;
    }
    [[nodiscard]] auto alert_engine() const -> const std::shared_ptr<AlertEngine>& {
        return alerts_;
    }
    [[nodiscard]] auto health_engine() const -> const std::shared_ptr<HealthEngine>& {
        return health_;
    }
    [[nodiscard]] auto dispatcher() const -> const std::shared_ptr<NotificationDispatcher>& {
        return dispatcher_;
    }
    [[nodiscard]] auto self_tests() const -> const std::shared_ptr<SelfTestScheduler>& {
        return self_tests_;
    }

private:
    void wire();
    auto restore() -> util::Result<void>;
    void on_cycle(Domain domain);
    void save_health_state(bool force);
    void save_smart_cache();
    void save_endurance();

    std::shared_ptr<ConfigStore> config_store_;
    std::shared_ptr<IReadingProvider> provider_;
    std::shared_ptr<PersistenceLayer> persistence_;
    std::vector<std::shared_ptr<INotificationChannel>> channels_;

    std::shared_ptr<DeviceStateStore> store_;
    std::shared_ptr<HealthEngine> health_;
    std::shared_ptr<NotificationDispatcher> dispatcher_;
    std::shared_ptr<AlertEngine> alerts_;
    std::shared_ptr<PollingScheduler> scheduler_;
    std::shared_ptr<SelfTestScheduler> self_tests_;

    std::mutex save_mutex_;
    bool history_unsaved_ = false;
    bool anomalies_unsaved_ = false;
    std::chrono::steady_clock::time_point last_endurance_save_{};

    std::atomic<bool> started_{false};
};
