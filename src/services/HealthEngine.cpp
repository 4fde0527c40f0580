/**
 * @file HealthEngine.cpp
 * @brief Health score policy and anomaly detection
 */

#include "services/HealthEngine.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <format>

namespace {

// Score deductions
constexpr int WARNING_STATUS_PENALTY = 10;
constexpr int TEMP_WARN_PENALTY = 10;
constexpr int TEMP_CRIT_PENALTY = 20;
constexpr int TEMP_PER_DEGREE_CAP = 10;
constexpr int REALLOCATED_PENALTY = 15;
constexpr int REALLOCATED_HEAVY_PENALTY = 30;
constexpr uint64_t REALLOCATED_HEAVY_COUNT = 100;
constexpr int PENDING_PENALTY = 25;
constexpr int UNCORRECTABLE_PENALTY = 40;
constexpr int NVME_MEDIA_ERROR_PENALTY = 25;
constexpr int NVME_SPARE_PENALTY = 20;
constexpr uint64_t HOURS_PER_AGE_POINT = 10000;
constexpr int AGE_PENALTY_CAP = 5;

auto nvme_wear_penalty(uint32_t percentage_used) -> int {
    if (percentage_used >= 90) {
        return 30;
    }
    if (percentage_used >= 70) {
        return 15;
    }
    if (percentage_used >= 50) {
        return 5;
    }
    return 0;
}

auto watched_value(const SmartSnapshot& snapshot, uint32_t id) -> std::optional<uint64_t> {
    if (id == smart::NVME_MEDIA_ERRORS) {
        if (!snapshot.nvme) {
            return std::nullopt;
        }
        return snapshot.nvme->media_errors;
    }
    if (const auto* attr = snapshot.find(id)) {
        return attr->raw_value;
    }
    return std::nullopt;
}

auto watched_name(const SmartSnapshot& snapshot, uint32_t id) -> std::string {
    if (const auto* attr = snapshot.find(id); attr && !attr->name.empty()) {
        return attr->name;
    }
    return std::string{smart::attribute_name(id)};
}

}  // namespace

HealthEngine::HealthEngine(std::shared_ptr<ConfigStore> config_store)
    : config_store_(std::move(config_store)) {}

auto HealthEngine::score(const SmartSnapshot* smart, DeviceKind kind, const Config& config) -> int {
    if (smart == nullptr) {
        return 100;
    }
    if (smart->status == SmartStatus::Failed) {
        return 0;
    }

    int score = 100;

    if (smart->status == SmartStatus::Warning) {
        score -= WARNING_STATUS_PENALTY;
    }

    if (smart->temperature_celsius) {
        const auto& limits = config.temperature_thresholds(kind);
        const double temp = *smart->temperature_celsius;
        if (temp >= limits.crit) {
            score -= TEMP_CRIT_PENALTY;
        } else if (temp >= limits.warn) {
            score -= TEMP_WARN_PENALTY;
        }
        if (temp > limits.warn) {
            score -= std::min(static_cast<int>(temp - limits.warn), TEMP_PER_DEGREE_CAP);
        }
    }

    if (const auto* realloc = smart->find(smart::REALLOCATED_SECTORS)) {
        if (realloc->raw_value > REALLOCATED_HEAVY_COUNT) {
            score -= REALLOCATED_HEAVY_PENALTY;
        } else if (realloc->raw_value > 0) {
            score -= REALLOCATED_PENALTY;
        }
    }
    if (smart->raw_or(smart::CURRENT_PENDING_SECTORS, 0) > 0) {
        score -= PENDING_PENALTY;
    }
    if (smart->raw_or(smart::OFFLINE_UNCORRECTABLE, 0) > 0) {
        score -= UNCORRECTABLE_PENALTY;
    }

    if (smart->nvme) {
        const auto& nvme = *smart->nvme;
        score -= nvme_wear_penalty(nvme.percentage_used);
        if (nvme.media_errors > 0) {
            score -= NVME_MEDIA_ERROR_PENALTY;
        }
        if (nvme.available_spare < nvme.spare_threshold) {
            score -= NVME_SPARE_PENALTY;
        }
    }

    if (smart->power_on_hours) {
        score -= static_cast<int>(
            std::min<uint64_t>(*smart->power_on_hours / HOURS_PER_AGE_POINT, AGE_PENALTY_CAP));
    }

    const bool failing = std::ranges::any_of(
        smart->attributes, [](const auto& item) { return item.second.is_failing(); });
    if (failing) {
        score = std::min(score, FAILING_ATTRIBUTE_CAP);
    }

    return std::clamp(score, 0, 100);
}

auto HealthEngine::evaluate(const DeviceState& /*prev*/, const DeviceState& next) -> HealthRecord {
    HealthRecord record;
    const auto config = config_store_->current();
    record.score = score(next.smart.get(), next.identity.kind, *config);
    record.evaluated_at = next.smart ? next.smart->captured_at : util::Clock::now();

    std::lock_guard lock(mutex_);
    record_history(next.identity.id, record.evaluated_at, record.score);
    if (next.smart) {
        record.new_anomalies = detect_anomalies(next.identity.id, *next.smart);
    }
    return record;
}

void HealthEngine::record_history(const std::string& device, util::TimePoint at, int score) {
    auto& ring = history_.try_emplace(device, HEALTH_HISTORY_CAPACITY).first->second;
    if (!ring.empty() && at - ring.back().at < HISTORY_INTERVAL) {
        return;
    }
    ring.push(HealthHistoryPoint{at, score});
    history_dirty_ = true;
}

auto HealthEngine::find_first_seen(const std::string& device, uint32_t attr_id) -> AnomalyRecord* {
    for (auto& record : anomalies_) {
        if (record.device == device && record.attr_id == attr_id &&
            record.kind == AnomalyKind::FirstSeen) {
            return &record;
        }
    }
    return nullptr;
}

auto HealthEngine::detect_anomalies(const std::string& device, const SmartSnapshot& snapshot)
    -> size_t {
    size_t appended = 0;
    auto& device_windows = windows_[device];
    auto& device_cleared = cleared_[device];

    for (auto attr_id : WATCHED_ATTRIBUTES) {
        auto value = watched_value(snapshot, attr_id);
        if (!value) {
            continue;
        }

        auto& window = device_windows.try_emplace(attr_id, ANOMALY_WINDOW).first->second;
        const auto cleared_at = device_cleared.contains(attr_id) ? device_cleared[attr_id] : 0;

        std::optional<AnomalyRecord> detected;
        auto* first_seen = find_first_seen(device, attr_id);

        if (*value > cleared_at && first_seen == nullptr && *value > 0) {
            detected = AnomalyRecord{device,  attr_id, watched_name(snapshot, attr_id),
                                     AnomalyKind::FirstSeen, *value, *value, 0, 0,
                                     static_cast<int64_t>(*value), snapshot.captured_at};
        } else {
            if (first_seen != nullptr && first_seen->last_value != *value) {
                first_seen->last_value = *value;
                anomalies_dirty_ = true;
            }

            if (!window.empty()) {
                const auto previous = window.back();
                const auto [lo, hi] = std::ranges::minmax(window.to_vector());
                const double tolerance = std::max(static_cast<double>(hi) * BAND_TOLERANCE, 1.0);

                if (*value >= previous + JUMP_DELTA) {
                    detected = AnomalyRecord{device, attr_id, watched_name(snapshot, attr_id),
                                             AnomalyKind::Jump, previous, *value, lo, hi,
                                             static_cast<int64_t>(*value - previous),
                                             snapshot.captured_at};
                } else if (window.size() >= 3 && hi > 0 &&
                           static_cast<double>(*value) > static_cast<double>(hi) + tolerance) {
                    detected = AnomalyRecord{device, attr_id, watched_name(snapshot, attr_id),
                                             AnomalyKind::OutOfBand, previous, *value, lo, hi,
                                             static_cast<int64_t>(*value - hi),
                                             snapshot.captured_at};
                }
            }
        }

        window.push(*value);

        if (detected) {
            LOG_INFO("HealthEngine",
                     std::format("{}: {} anomaly on {} ({} -> {})", device, to_string(detected->kind),
                                 detected->attr_name, detected->first_value, detected->last_value));
            anomalies_.push_back(std::move(*detected));
            anomalies_dirty_ = true;
            ++appended;
        }
    }
    return appended;
}

auto HealthEngine::history(const std::string& device, int days) const
    -> std::vector<HealthHistoryPoint> {
    std::lock_guard lock(mutex_);
    auto it = history_.find(device);
    if (it == history_.end()) {
        return {};
    }
    auto points = it->second.to_vector();
    if (days > 0) {
        const auto cutoff = util::Clock::now() - std::chrono::hours{24} * days;
        std::erase_if(points, [cutoff](const HealthHistoryPoint& p) { return p.at < cutoff; });
    }
    return points;
}

auto HealthEngine::anomalies(const std::optional<std::string>& device) const
    -> std::vector<AnomalyRecord> {
    std::lock_guard lock(mutex_);
    if (!device) {
        return anomalies_;
    }
    std::vector<AnomalyRecord> out;
    std::ranges::copy_if(anomalies_, std::back_inserter(out),
                         [&device](const AnomalyRecord& r) { return r.device == *device; });
    return out;
}

auto HealthEngine::clear_anomalies(const std::optional<std::string>& device) -> size_t {
    std::lock_guard lock(mutex_);
    const auto removed = std::erase_if(anomalies_, [&device](const AnomalyRecord& r) {
        return !device || r.device == *device;
    });

    // Current counter values become the new reference point
    for (const auto& [dev, windows] : windows_) {
        if (device && dev != *device) {
            continue;
        }
        for (const auto& [attr_id, window] : windows) {
            if (!window.empty()) {
                cleared_[dev][attr_id] = window.back();
            }
        }
    }

    anomalies_dirty_ = true;
    LOG_INFO("HealthEngine", std::format("cleared {} anomaly record(s) for {}", removed,
                                         device ? *device : std::string{"all devices"}));
    return removed;
}

auto HealthEngine::diff(const Baseline& baseline, const SmartSnapshot& current) -> BaselineDiff {
    BaselineDiff out;
    out.device = baseline.device;
    out.baseline_saved_at = baseline.saved_at;
    if (baseline.power_on_hours && current.power_on_hours) {
        out.power_on_hours_delta = static_cast<int64_t>(*current.power_on_hours) -
                                   static_cast<int64_t>(*baseline.power_on_hours);
    }

    for (const auto& base : baseline.attributes) {
        const auto* attr = current.find(base.id);
        if (attr == nullptr) {
            continue;
        }
        out.attributes.push_back(AttributeDelta{
            base.id, base.name, base.raw_value, attr->raw_value,
            static_cast<int64_t>(attr->raw_value) - static_cast<int64_t>(base.raw_value),
            static_cast<int64_t>(attr->value) - static_cast<int64_t>(base.value)});
    }
    return out;
}

auto HealthEngine::make_baseline(const std::string& device, const SmartSnapshot& snapshot,
                                 util::TimePoint saved_at) -> Baseline {
    Baseline baseline;
    baseline.device = device;
    baseline.saved_at = saved_at;
    baseline.power_on_hours = snapshot.power_on_hours;
    for (const auto& [id, attr] : snapshot.attributes) {
        baseline.attributes.push_back(BaselineAttribute{id, attr.name, attr.raw_value, attr.value});
    }
    return baseline;
}

auto HealthEngine::export_history() const -> HistoryMap {
    std::lock_guard lock(mutex_);
    HistoryMap out;
    for (const auto& [device, ring] : history_) {
        out.emplace(device, ring.to_vector());
    }
    return out;
}

void HealthEngine::import_history(const HistoryMap& history) {
    std::lock_guard lock(mutex_);
    history_.clear();
    for (const auto& [device, points] : history) {
        auto& ring = history_.try_emplace(device, HEALTH_HISTORY_CAPACITY).first->second;
        auto sorted = points;
        std::ranges::sort(sorted, {}, &HealthHistoryPoint::at);
        for (const auto& point : sorted) {
            ring.push(point);
        }
    }
}

auto HealthEngine::export_cleared() const -> ClearedMap {
    std::lock_guard lock(mutex_);
    return cleared_;
}

void HealthEngine::import_anomalies(std::vector<AnomalyRecord> records, ClearedMap cleared) {
    std::lock_guard lock(mutex_);
    anomalies_ = std::move(records);
    cleared_ = std::move(cleared);
}
