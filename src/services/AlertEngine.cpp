/**
 * @file AlertEngine.cpp
 * @brief Alert state machine
 */

#include "services/AlertEngine.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <format>

namespace {

auto cooldown_key(const std::string& key, Severity severity) -> std::string {
    return std::format("{}|{}", key, to_string(severity));
}

void newest_first(std::vector<Alert>& alerts) {
    std::ranges::sort(alerts, [](const Alert& a, const Alert& b) {
        if (a.last_fired_at != b.last_fired_at) {
            return a.last_fired_at > b.last_fired_at;
        }
        return a.id > b.id;
    });
}

void apply_limit(std::vector<Alert>& alerts, size_t limit) {
    if (limit > 0 && alerts.size() > limit) {
        alerts.resize(limit);
    }
}

}  // namespace

AlertEngine::AlertEngine(std::shared_ptr<ConfigStore> config_store,
                         std::shared_ptr<INotificationSink> sink, std::shared_ptr<IAlertLog> log)
    : config_store_(std::move(config_store)), sink_(std::move(sink)), log_(std::move(log)) {}

auto AlertEngine::load_state() -> util::Result<void> {
    auto acks = log_->load_acknowledged();
    if (!acks) {
        return std::unexpected(acks.error());
    }
    auto logged = log_->load_alert_log();
    if (!logged) {
        return std::unexpected(logged.error());
    }
    auto saved_next_id = log_->load_next_alert_id();
    if (!saved_next_id) {
        return std::unexpected(saved_next_id.error());
    }

    std::lock_guard lock(mutex_);
    restored_acks_ = std::move(*acks);
    // The log only holds resolved alerts; the saved counter covers the active ones
    next_id_ = std::max(next_id_, *saved_next_id);
    for (const auto& alert : *logged) {
        next_id_ = std::max(next_id_, alert.id + 1);
    }
    return {};
}

auto AlertEngine::smart_verdicts(const DeviceState& state, const Config& config)
    -> std::vector<Verdict> {
    std::vector<Verdict> out;
    const auto& smart = state.smart;
    if (!smart) {
        return out;
    }

    // Temperature
    {
        Verdict verdict{RuleKind::ThresholdTemp, AlertLevel::Clear, {}};
        if (smart->temperature_celsius) {
            const auto& limits = config.temperature_thresholds(state.identity.kind);
            const int temp = *smart->temperature_celsius;
            verdict.level = classify(temp, limits.warn, limits.crit);
            if (verdict.level == AlertLevel::Crit) {
                verdict.message =
                    std::format("Temperature {}°C >= critical threshold {}°C", temp, limits.crit);
            } else if (verdict.level == AlertLevel::Warn) {
                verdict.message =
                    std::format("Temperature {}°C >= warning threshold {}°C", temp, limits.warn);
            }
        }
        out.push_back(std::move(verdict));
    }

    // Overall status, at-risk and degrading pre-fail attributes, NVMe flags
    {
        Verdict verdict{RuleKind::SmartStatus, AlertLevel::Clear, {}};
        auto raise = [&verdict](AlertLevel level, std::string message) {
            if (static_cast<int>(level) > static_cast<int>(verdict.level)) {
                verdict.level = level;
                verdict.message = std::move(message);
            }
        };

        if (smart->status == SmartStatus::Failed) {
            raise(AlertLevel::Crit, "SMART health check FAILED");
        }
        if (smart->nvme && smart->nvme->critical_warning != 0) {
            raise(AlertLevel::Crit, std::format("NVMe critical warning byte: 0x{:02X}",
                                                smart->nvme->critical_warning));
        }
        for (const auto& [id, attr] : smart->attributes) {
            if (attr.is_at_risk()) {
                raise(AlertLevel::Warn, std::format("Pre-fail attribute {} value {} near threshold {}",
                                                    attr.name, attr.value, attr.threshold));
            }
        }
        if (state.smart_prev) {
            for (const auto& [id, attr] : smart->attributes) {
                const auto* before = state.smart_prev->find(id);
                if (attr.prefail && before != nullptr && attr.value < before->value) {
                    raise(AlertLevel::Warn,
                          std::format("Pre-fail attribute {} degraded {} -> {}", attr.name,
                                      before->value, attr.value));
                }
            }
        }
        if (smart->nvme) {
            if (smart->nvme->media_errors > 0) {
                raise(AlertLevel::Warn, std::format("{} uncorrectable media error(s)",
                                                    smart->nvme->media_errors));
            }
            if (smart->nvme->available_spare < smart->nvme->spare_threshold) {
                raise(AlertLevel::Warn,
                      std::format("NVMe spare {}% below threshold {}%", smart->nvme->available_spare,
                                  smart->nvme->spare_threshold));
            }
        }
        if (smart->status == SmartStatus::Warning) {
            raise(AlertLevel::Warn, "SMART status reports a warning");
        }
        out.push_back(std::move(verdict));
    }

    // Sector counts
    {
        struct Counter {
            uint32_t id;
            const ThresholdPair& limits;
            const char* label;
        };
        const Counter counters[] = {
            {smart::REALLOCATED_SECTORS, config.thresholds.reallocated, "reallocated sector(s)"},
            {smart::CURRENT_PENDING_SECTORS, config.thresholds.pending, "pending sector(s)"},
            {smart::OFFLINE_UNCORRECTABLE, config.thresholds.uncorrectable,
             "uncorrectable sector(s)"},
        };

        Verdict verdict{RuleKind::SectorCount, AlertLevel::Clear, {}};
        for (const auto& counter : counters) {
            const auto raw = smart->raw_or(counter.id, 0);
            const auto level =
                classify(static_cast<double>(raw), counter.limits.warn, counter.limits.crit);
            if (static_cast<int>(level) > static_cast<int>(verdict.level)) {
                verdict.level = level;
                verdict.message = std::format("{} {}", raw, counter.label);
            }
        }
        out.push_back(std::move(verdict));
    }

    return out;
}

auto AlertEngine::io_verdicts(const DeviceState& state, const Config& config)
    -> std::vector<Verdict> {
    std::vector<Verdict> out;
    if (!state.io || !state.io->rates) {
        return out;
    }
    const auto& rates = *state.io->rates;

    const auto& util_limits = config.thresholds.io_util_pct;
    Verdict util{RuleKind::ThresholdUtil,
                 classify(rates.util_pct, util_limits.warn, util_limits.crit), {}};
    if (util.level != AlertLevel::Clear) {
        util.message = std::format("I/O utilisation {:.0f}%", rates.util_pct);
    }
    out.push_back(std::move(util));

    const auto& lat_limits = config.thresholds.latency_ms;
    const double latency = rates.max_latency_ms();
    Verdict lat{RuleKind::Latency, classify(latency, lat_limits.warn, lat_limits.crit), {}};
    if (lat.level == AlertLevel::Crit) {
        lat.message = std::format("I/O latency {:.0f}ms >= critical threshold {:.0f}ms", latency,
                                  lat_limits.crit);
    } else if (lat.level == AlertLevel::Warn) {
        lat.message = std::format("I/O latency {:.0f}ms >= warning threshold {:.0f}ms", latency,
                                  lat_limits.warn);
    }
    out.push_back(std::move(lat));
    return out;
}

void AlertEngine::evaluate_device(const DeviceState& state, Domain domain, util::TimePoint now) {
    const auto config = config_store_->current();

    std::vector<Verdict> verdicts;
    switch (domain) {
        case Domain::Smart:
            if (state.smart_stale) {
                return;
            }
            verdicts = smart_verdicts(state, *config);
            break;
        case Domain::IoCounters:
            if (state.io_stale) {
                return;
            }
            verdicts = io_verdicts(state, *config);
            break;
        case Domain::SelfTest:
        case Domain::Filesystem:
        case Domain::Nfs:
        case Domain::Volume:
            return;
    }

    Outcome outcome;
    {
        std::lock_guard lock(mutex_);
        for (const auto& verdict : verdicts) {
            apply(state.identity.id, state.display_name(), verdict, now, *config, outcome);
        }
    }
    finish(std::move(outcome));
}

void AlertEngine::evaluate_host(const HostState& host, Domain domain, util::TimePoint now) {
    const auto config = config_store_->current();
    const auto& thr = config->thresholds;

    Outcome outcome;
    std::unique_lock lock(mutex_);

    switch (domain) {
        case Domain::Filesystem: {
            if (host.filesystems_stale) {
                return;
            }
            std::set<std::string> mounts;
            for (const auto& fs : host.filesystems) {
                mounts.insert(fs.mount);

                const double pct = fs.use_pct();
                Verdict space{RuleKind::ThresholdFs,
                              classify(pct, thr.filesystem_pct.warn, thr.filesystem_pct.crit), {}};
                if (space.level == AlertLevel::Crit) {
                    space.message = std::format("{:.0f}% full, critically low space", pct);
                } else if (space.level == AlertLevel::Warn) {
                    space.message = std::format("{:.0f}% full", pct);
                }
                apply(fs.mount, fs.mount, space, now, *config, outcome);

                const double ipct = fs.inode_pct();
                Verdict inodes{RuleKind::ThresholdInode,
                               classify(ipct, thr.inode_pct.warn, thr.inode_pct.crit), {}};
                if (inodes.level != AlertLevel::Clear) {
                    inodes.message = std::format("Inodes {:.0f}% used", ipct);
                }
                apply(fs.mount, fs.mount, inodes, now, *config, outcome);

                Verdict fill{RuleKind::FsFillRate, AlertLevel::Clear, {}};
                if (fs.days_until_full) {
                    fill.level =
                        classify_below(*fs.days_until_full, thr.fill_days.warn, thr.fill_days.crit);
                    if (fill.level != AlertLevel::Clear) {
                        fill.message =
                            std::format("Projected full in {:.1f} day(s)", *fs.days_until_full);
                    }
                }
                apply(fs.mount, fs.mount, fill, now, *config, outcome);
            }
            resolve_missing(RuleKind::ThresholdFs, mounts, now, outcome);
            resolve_missing(RuleKind::ThresholdInode, mounts, now, outcome);
            resolve_missing(RuleKind::FsFillRate, mounts, now, outcome);
            break;
        }
        case Domain::Nfs: {
            if (host.nfs_stale) {
                return;
            }
            std::set<std::string> mounts;
            for (const auto& nfs : host.nfs_mounts) {
                mounts.insert(nfs.mount);
                const double rtt = nfs.max_rtt_ms();
                Verdict verdict{RuleKind::NfsLatency,
                                classify(rtt, thr.nfs_rtt_ms.warn, thr.nfs_rtt_ms.crit), {}};
                if (verdict.level != AlertLevel::Clear) {
                    verdict.message = std::format("NFS RTT {:.0f}ms on {}", rtt, nfs.device);
                }
                apply(nfs.mount, nfs.mount, verdict, now, *config, outcome);
            }
            resolve_missing(RuleKind::NfsLatency, mounts, now, outcome);
            break;
        }
        case Domain::Volume: {
            if (host.volumes_stale) {
                return;
            }
            std::set<std::string> names;
            for (const auto& volume : host.volumes) {
                names.insert(volume.name);
                Verdict verdict{RuleKind::VolumeHealth, AlertLevel::Clear, {}};
                switch (volume.health) {
                    case VolumeHealth::Failed:
                    case VolumeHealth::Degraded:
                        verdict.level = AlertLevel::Crit;
                        verdict.message =
                            std::format("{} {} is {}", volume.level, volume.name, to_string(volume.health));
                        break;
                    case VolumeHealth::Rebuilding:
                        verdict.level = AlertLevel::Warn;
                        verdict.message = volume.rebuild_pct
                                              ? std::format("{} {} rebuilding ({:.1f}%)", volume.level,
                                                            volume.name, *volume.rebuild_pct)
                                              : std::format("{} {} rebuilding", volume.level,
                                                            volume.name);
                        break;
                    case VolumeHealth::Healthy:
                        break;
                }
                apply(volume.name, volume.name, verdict, now, *config, outcome);
            }
            resolve_missing(RuleKind::VolumeHealth, names, now, outcome);
            break;
        }
        case Domain::Smart:
        case Domain::IoCounters:
        case Domain::SelfTest:
            return;
    }

    lock.unlock();
    finish(std::move(outcome));
}

void AlertEngine::apply(const std::string& device, const std::string& display_name,
                        const Verdict& verdict, util::TimePoint now, const Config& config,
                        Outcome& outcome) {
    const auto key = Alert::make_key(device, verdict.rule);
    const auto level = config.is_rule_enabled(verdict.rule) ? verdict.level : AlertLevel::Clear;
    auto it = active_.find(key);

    if (level == AlertLevel::Clear) {
        if (restored_acks_.erase(key) > 0) {
            outcome.acks_changed = true;
        }
        if (it == active_.end()) {
            return;
        }
        auto alert = std::move(it->second);
        active_.erase(it);
        alert.resolved = true;
        alert.resolved_at = now;
        if (alert.acknowledged) {
            outcome.acks_changed = true;
        }
        LOG_INFO("AlertEngine", std::format("resolved #{} {} {}", alert.id, device,
                                            to_string(verdict.rule)));
        outcome.resolved.push_back(std::move(alert));
        return;
    }

    const auto severity = to_severity(level);

    auto dispatch = [&](Alert& alert, bool escalation) {
        alert.cooldown_until = now + config.cooldown;
        cooldowns_[cooldown_key(key, severity)] = alert.cooldown_until;
        outcome.notify.push_back(AlertEvent{alert, display_name, escalation});
    };

    if (it == active_.end()) {
        Alert alert;
        alert.id = next_id_++;
        outcome.next_id = next_id_;
        alert.device = device;
        alert.rule = verdict.rule;
        alert.severity = severity;
        alert.message = verdict.message;
        alert.fired_at = now;
        alert.last_fired_at = now;
        if (restored_acks_.erase(key) > 0) {
            alert.acknowledged = true;
        }

        auto cooldown = cooldowns_.find(cooldown_key(key, severity));
        if (cooldown == cooldowns_.end() || now >= cooldown->second) {
            dispatch(alert, false);
        } else {
            alert.cooldown_until = cooldown->second;
            LOG_DEBUG("AlertEngine", std::format("{} {} {} suppressed by cooldown", device,
                                                 to_string(verdict.rule), to_string(severity)));
        }

        LOG_INFO("AlertEngine", std::format("fired #{} {} {} {}: {}", alert.id, to_string(severity),
                                            device, to_string(verdict.rule), alert.message));
        recent_.push(alert);
        active_.emplace(key, std::move(alert));
        return;
    }

    auto& alert = it->second;
    alert.last_fired_at = now;
    alert.message = verdict.message;

    if (severity == Severity::Crit && alert.severity == Severity::Warn) {
        alert.severity = Severity::Crit;
        LOG_INFO("AlertEngine", std::format("escalated #{} {} {} to crit", alert.id, device,
                                            to_string(verdict.rule)));
        dispatch(alert, true);
        recent_.push(alert);
    } else if (severity == Severity::Warn && alert.severity == Severity::Crit) {
        alert.severity = Severity::Warn;
        LOG_INFO("AlertEngine", std::format("de-escalated #{} {} {} to warn", alert.id, device,
                                            to_string(verdict.rule)));
    }
}

void AlertEngine::resolve_missing(RuleKind rule, const std::set<std::string>& present,
                                  util::TimePoint now, Outcome& outcome) {
    std::vector<std::string> gone;
    for (const auto& [key, alert] : active_) {
        if (alert.rule == rule && !present.contains(alert.device)) {
            gone.push_back(alert.device);
        }
    }
    const auto config = config_store_->current();
    for (const auto& device : gone) {
        apply(device, device, Verdict{rule, AlertLevel::Clear, {}}, now, *config, outcome);
    }
}

void AlertEngine::finish(Outcome outcome) {
    for (const auto& alert : outcome.resolved) {
        if (auto appended = log_->append_alert(alert); !appended) {
            LOG_ERROR("AlertEngine", std::format("could not log resolved alert #{}: {}", alert.id,
                                                 appended.error().message));
        }
    }

    if (outcome.next_id) {
        if (auto saved = log_->save_next_alert_id(*outcome.next_id); !saved) {
            LOG_ERROR("AlertEngine",
                      std::format("could not save alert id counter: {}", saved.error().message));
        }
    }

    if (outcome.acks_changed) {
        std::set<std::string> keys;
        {
            std::lock_guard lock(mutex_);
            keys = ack_keys_locked();
        }
        if (auto saved = log_->save_acknowledged(keys); !saved) {
            LOG_ERROR("AlertEngine",
                      std::format("could not save acknowledgements: {}", saved.error().message));
        }
    }

    for (auto& event : outcome.notify) {
        sink_->submit(std::move(event));
    }
}

auto AlertEngine::ack_keys_locked() const -> std::set<std::string> {
    std::set<std::string> keys = restored_acks_;
    for (const auto& [key, alert] : active_) {
        if (alert.acknowledged) {
            keys.insert(key);
        }
    }
    return keys;
}

auto AlertEngine::active(const AlertQuery& query) const -> std::vector<Alert> {
    std::vector<Alert> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, alert] : active_) {
            if (query.matches(alert)) {
                out.push_back(alert);
            }
        }
    }
    newest_first(out);
    apply_limit(out, query.limit);
    return out;
}

auto AlertEngine::recent() const -> std::vector<Alert> {
    std::lock_guard lock(mutex_);
    auto out = recent_.to_vector();
    std::ranges::reverse(out);
    return out;
}

auto AlertEngine::query(const AlertQuery& query) const -> util::Result<std::vector<Alert>> {
    auto out = active(AlertQuery{false, query.since, query.min_severity, query.search, 0});
    if (!query.active_only) {
        auto logged = log_->load_alert_log();
        if (!logged) {
            return std::unexpected(logged.error());
        }
        for (auto& alert : *logged) {
            if (query.matches(alert)) {
                out.push_back(std::move(alert));
            }
        }
    }
    newest_first(out);
    apply_limit(out, query.limit);
    return out;
}

auto AlertEngine::find(uint64_t id) const -> std::optional<Alert> {
    std::lock_guard lock(mutex_);
    for (const auto& [key, alert] : active_) {
        if (alert.id == id) {
            return alert;
        }
    }
    return std::nullopt;
}

auto AlertEngine::acknowledge(uint64_t id) -> util::Result<void> {
    Outcome outcome;
    {
        std::lock_guard lock(mutex_);
        auto it = std::ranges::find_if(active_, [id](const auto& item) { return item.second.id == id; });
        if (it == active_.end()) {
            return util::fail(util::ErrorKind::NotFound, std::format("no active alert #{}", id));
        }
        if (!it->second.acknowledged) {
            it->second.acknowledged = true;
            outcome.acks_changed = true;
            LOG_INFO("AlertEngine", std::format("acknowledged #{}", id));
        }
    }
    finish(std::move(outcome));
    return {};
}

auto AlertEngine::acknowledge_all() -> size_t {
    size_t count = 0;
    Outcome outcome;
    {
        std::lock_guard lock(mutex_);
        for (auto& [key, alert] : active_) {
            if (!alert.acknowledged) {
                alert.acknowledged = true;
                ++count;
            }
        }
        outcome.acks_changed = count > 0;
    }
    if (count > 0) {
        LOG_INFO("AlertEngine", std::format("acknowledged {} alert(s)", count));
    }
    finish(std::move(outcome));
    return count;
}

void AlertEngine::forget_device(const std::string& device) {
    Outcome outcome;
    {
        std::lock_guard lock(mutex_);
        const auto removed = std::erase_if(active_, [&](const auto& item) {
            if (item.second.device == device) {
                outcome.acks_changed = outcome.acks_changed || item.second.acknowledged;
                return true;
            }
            return false;
        });
        if (removed > 0) {
            LOG_INFO("AlertEngine", std::format("dropped {} live alert(s) of {}", removed, device));
        }
    }
    finish(std::move(outcome));
}
