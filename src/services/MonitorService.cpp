/**
 * @file MonitorService.cpp
 * @brief Wiring, restore-on-start and save-on-change
 */

#include "services/MonitorService.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <format>

MonitorService::MonitorService(std::shared_ptr<ConfigStore> config_store,
                               std::shared_ptr<IReadingProvider> provider,
                               std::shared_ptr<PersistenceLayer> persistence,
                               std::vector<std::shared_ptr<INotificationChannel>> channels,
                               std::chrono::milliseconds self_test_poll_interval)
    : config_store_(std::move(config_store)),
      provider_(std::move(provider)),
      persistence_(std::move(persistence)),
      channels_(std::move(channels)),
      store_(std::make_shared<DeviceStateStore>()),
      health_(std::make_shared<HealthEngine>(config_store_)),
      dispatcher_(std::make_shared<NotificationDispatcher>(config_store_, channels_)),
      alerts_(std::make_shared<AlertEngine>(config_store_, dispatcher_, persistence_)),
      scheduler_(std::make_shared<PollingScheduler>(provider_, store_, config_store_)),
      self_tests_(std::make_shared<SelfTestScheduler>(provider_, store_, config_store_,
                                                      self_test_poll_interval)) {
    wire();
}

MonitorService::~MonitorService() {
    stop();
}

void MonitorService::wire() {
    store_->set_health_evaluator([this](const DeviceState& prev, const DeviceState& next) {
        return health_->evaluate(prev, next);
    });

    store_->set_commit_listener([this](const DeviceState& state, Domain domain) {
        alerts_->evaluate_device(state, domain, util::Clock::now());
    });

    store_->set_host_commit_listener([this](const HostState& host, Domain domain) {
        alerts_->evaluate_host(host, domain, util::Clock::now());
    });

    store_->set_hotplug_listener([this](HotplugEvent event, const std::string& device) {
        if (event == HotplugEvent::Remove) {
            alerts_->forget_device(device);
        }
    });

    scheduler_->set_cycle_listener([this](Domain domain) { on_cycle(domain); });

    config_store_->subscribe([store = std::weak_ptr<DeviceStateStore>(store_)](
                                 const std::shared_ptr<const Config>& config) {
        if (auto locked = store.lock()) {
            locked->apply_aliases(config->aliases);
        }
    });
}

auto MonitorService::initialize() -> util::Result<void> {
    store_->apply_aliases(config_store_->current()->aliases);
    auto restored = restore();
    LOG_INFO("MonitorService", std::format("initialized with data directory {}",
                                           persistence_->data_dir().string()));
    return restored;
}

auto MonitorService::restore() -> util::Result<void> {
    std::optional<util::Error> first_error;
    auto note = [&first_error](const char* what, const util::Error& error) {
        LOG_WARNING("MonitorService", std::format("could not restore {}: {}", what, error.message));
        if (!first_error) {
            first_error = error;
        }
    };

    if (auto history = persistence_->load_health_history(); history) {
        health_->import_history(*history);
    } else {
        note("health history", history.error());
    }

    if (auto anomalies = persistence_->load_anomalies(); anomalies) {
        health_->import_anomalies(std::move(anomalies->records), std::move(anomalies->cleared));
    } else {
        note("anomaly log", anomalies.error());
    }

    if (auto endurance = persistence_->load_endurance(); endurance) {
        store_->seed_endurance(*endurance);
    } else {
        note("write endurance", endurance.error());
    }

    if (auto cache = persistence_->load_smart_cache(); cache) {
        const auto config = config_store_->current();
        size_t seeded = 0;
        for (auto& entry : *cache) {
            if (config->is_excluded(entry.identity.id)) {
                continue;
            }
            store_->seed_from_cache(entry.identity, std::move(entry.snapshot));
            ++seeded;
        }
        if (seeded > 0) {
            LOG_INFO("MonitorService", std::format("{} device(s) seeded from the SMART cache", seeded));
        }
    } else {
        note("SMART cache", cache.error());
    }

    if (auto alerts = alerts_->load_state(); !alerts) {
        note("alert state", alerts.error());
    }

    if (first_error) {
        return std::unexpected(*first_error);
    }
    return {};
}

void MonitorService::start() {
    if (started_.exchange(true)) {
        return;
    }
    dispatcher_->start();
    scheduler_->start();
    self_tests_->start();
    LOG_INFO("MonitorService", "monitoring started");
}

void MonitorService::stop() {
    if (!started_.exchange(false)) {
        return;
    }
    scheduler_->stop();
    self_tests_->stop();
    dispatcher_->stop();
    flush();
    LOG_INFO("MonitorService", "monitoring stopped");
}

void MonitorService::flush() {
    save_health_state(true);
    save_smart_cache();
    save_endurance();
}

void MonitorService::on_cycle(Domain domain) {
    switch (domain) {
        case Domain::Smart:
            save_health_state(false);
            save_smart_cache();
            break;
        case Domain::IoCounters: {
            const auto now = std::chrono::steady_clock::now();
            bool due = false;
            {
                std::lock_guard lock(save_mutex_);
                if (now - last_endurance_save_ >= ENDURANCE_SAVE_INTERVAL) {
                    last_endurance_save_ = now;
                    due = true;
                }
            }
            if (due) {
                save_endurance();
            }
            break;
        }
        case Domain::Filesystem:
        case Domain::Nfs:
        case Domain::Volume:
        case Domain::SelfTest:
            break;
    }
}

void MonitorService::save_health_state(bool force) {
    std::lock_guard lock(save_mutex_);

    // A failed save is retried on the next call
    const bool history_dirty = health_->take_history_dirty() || history_unsaved_ || force;
    if (history_dirty) {
        history_unsaved_ = !persistence_->save_health_history(health_->export_history());
    }

    const bool anomalies_dirty = health_->take_anomalies_dirty() || anomalies_unsaved_ || force;
    if (anomalies_dirty) {
        anomalies_unsaved_ =
            !persistence_->save_anomalies(health_->anomalies(), health_->export_cleared());
    }
}

void MonitorService::save_smart_cache() {
    std::vector<PersistenceLayer::CachedSmart> entries;
    for (const auto& state : store_->list_devices()) {
        if (state->smart) {
            entries.push_back(PersistenceLayer::CachedSmart{state->identity, *state->smart});
        }
    }
    if (entries.empty()) {
        return;
    }
    // Failures are logged by the persistence layer; the next SMART cycle retries
    static_cast<void>(persistence_->save_smart_cache(entries));
}

void MonitorService::save_endurance() {
    PersistenceLayer::EnduranceMap records;
    for (const auto& state : store_->list_devices()) {
        if (state->endurance) {
            records.emplace(state->identity.id, *state->endurance);
        }
    }
    if (records.empty()) {
        return;
    }
    static_cast<void>(persistence_->save_endurance(records));
}

// Queries

auto MonitorService::devices() const -> std::vector<DeviceStateStore::StatePtr> {
    return store_->list_devices();
}

auto MonitorService::device(const std::string& id) const
    -> util::Result<DeviceStateStore::StatePtr> {
    return store_->get_snapshot(id);
}

auto MonitorService::host() const -> DeviceStateStore::HostPtr {
    return store_->host_snapshot();
}

auto MonitorService::alerts(const AlertQuery& query) const -> util::Result<std::vector<Alert>> {
    return alerts_->query(query);
}

auto MonitorService::recent_alerts() const -> std::vector<Alert> {
    return alerts_->recent();
}

auto MonitorService::health_history(const std::string& device, int days) const
    -> std::vector<HealthHistoryPoint> {
    return health_->history(device, days);
}

auto MonitorService::anomalies(const std::optional<std::string>& device) const
    -> std::vector<AnomalyRecord> {
    return health_->anomalies(device);
}

auto MonitorService::baseline_diff(const std::string& device) const -> util::Result<BaselineDiff> {
    auto state = store_->get_snapshot(device);
    if (!state) {
        return std::unexpected(state.error());
    }
    if (!(*state)->smart) {
        return util::fail(util::ErrorKind::NotFound, std::format("no SMART data for {}", device));
    }
    auto baseline = persistence_->latest_baseline(device);
    if (!baseline) {
        return std::unexpected(baseline.error());
    }
    return HealthEngine::diff(*baseline, *(*state)->smart);
}

auto MonitorService::self_test_status(const std::string& device) const
    -> util::Result<SelfTestStatus> {
    return self_tests_->status(device);
}

auto MonitorService::self_test_log(const std::string& device) const
    -> util::Result<std::vector<SelfTestEntry>> {
    return self_tests_->log(device);
}

// Commands

auto MonitorService::acknowledge(uint64_t alert_id) -> util::Result<void> {
    return alerts_->acknowledge(alert_id);
}

auto MonitorService::acknowledge_all() -> size_t {
    return alerts_->acknowledge_all();
}

auto MonitorService::save_baseline(const std::string& device) -> util::Result<Baseline> {
    auto state = store_->get_snapshot(device);
    if (!state) {
        return std::unexpected(state.error());
    }
    if (!(*state)->smart) {
        return util::fail(util::ErrorKind::NotFound,
                          std::format("no SMART data for {} to save as baseline", device));
    }

    auto baseline = HealthEngine::make_baseline(device, *(*state)->smart, util::Clock::now());
    if (auto saved = persistence_->save_baseline(baseline); !saved) {
        return std::unexpected(saved.error());
    }
    return baseline;
}

auto MonitorService::schedule_self_test(const std::string& device, SelfTestType type,
                                        std::optional<std::chrono::milliseconds> wait)
    -> util::Result<SelfTestStatus> {
    if (wait) {
        return self_tests_->schedule_and_wait(device, type, *wait);
    }
    return self_tests_->schedule(device, type);
}

auto MonitorService::clear_anomalies(const std::optional<std::string>& device) -> size_t {
    const auto removed = health_->clear_anomalies(device);
    save_health_state(false);
    return removed;
}

auto MonitorService::repoll(const std::string& device) -> util::Result<void> {
    return scheduler_->repoll_smart(device);
}

auto MonitorService::test_webhook() -> util::Result<void> {
    const auto config = config_store_->current();
    auto webhook = std::ranges::find_if(channels_, [](const auto& channel) {
        return channel->name() == "webhook";
    });
    if (webhook == channels_.end() || !(*webhook)->is_enabled(config->notifications)) {
        return util::fail(util::ErrorKind::NotFound, "no webhook URL is configured");
    }

    const auto now = util::Clock::now();
    Alert alert;
    alert.device = "drivewatch";
    alert.rule = RuleKind::SmartStatus;
    alert.severity = Severity::Crit;
    alert.message = "Test notification from drivewatch";
    alert.fired_at = now;
    alert.last_fired_at = now;

    auto delivered = (*webhook)->deliver(AlertEvent{alert, "drivewatch", false}, config->notifications);
    if (delivered) {
        LOG_INFO("MonitorService", "webhook test delivered");
    } else {
        LOG_WARNING("MonitorService",
                    std::format("webhook test failed: {}", delivered.error().message));
    }
    return delivered;
}
