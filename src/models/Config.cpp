/**
 * @file Config.cpp
 * @brief Config validation and lookups
 */

#include "models/Config.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <format>

namespace {

auto check_pair(std::string_view key, const ThresholdPair& pair, double max) -> util::Result<void> {
    if (pair.warn < 0 || pair.crit < 0 || pair.warn > max || pair.crit > max) {
        return util::fail(util::ErrorKind::ConfigInvalid,
                          std::format("{}: thresholds must be within 0..{}", key, max));
    }
    if (pair.warn > pair.crit) {
        return util::fail(util::ErrorKind::ConfigInvalid,
                          std::format("{}: warn ({}) is above crit ({})", key, pair.warn, pair.crit));
    }
    return {};
}

auto check_positive(std::string_view key, int value) -> util::Result<void> {
    if (value <= 0) {
        return util::fail(util::ErrorKind::ConfigInvalid,
                          std::format("{} must be positive, got {}", key, value));
    }
    return {};
}

constexpr double NO_LIMIT = 1e12;

}  // namespace

auto Config::validate() const -> util::Result<void> {
    const std::pair<std::string_view, int> intervals[] = {
        {"update_interval_ms", general.update_interval_ms},
        {"smart_interval_sec", general.smart_interval_sec},
        {"fs_interval_sec", general.fs_interval_sec},
        {"nfs_interval_sec", general.nfs_interval_sec},
        {"volume_interval_sec", general.volume_interval_sec},
        {"fetch_timeout_ms", general.fetch_timeout_ms},
        {"selftest_poll_sec", general.selftest_poll_sec},
        {"selftest_short_timeout_min", general.selftest_short_timeout_min},
        {"selftest_long_timeout_min", general.selftest_long_timeout_min},
    };
    for (const auto& [key, value] : intervals) {
        if (auto ok = check_positive(key, value); !ok) {
            return ok;
        }
    }

    if (cooldown.count() < 0) {
        return util::fail(util::ErrorKind::ConfigInvalid, "cooldown_sec must not be negative");
    }

    const std::tuple<std::string_view, const ThresholdPair&, double> pairs[] = {
        {"temperature_hdd", thresholds.temperature_hdd, 150.0},
        {"temperature_ssd", thresholds.temperature_ssd, 150.0},
        {"temperature_nvme", thresholds.temperature_nvme, 150.0},
        {"filesystem_pct", thresholds.filesystem_pct, 100.0},
        {"inode_pct", thresholds.inode_pct, 100.0},
        {"io_util_pct", thresholds.io_util_pct, 100.0},
        {"latency_ms", thresholds.latency_ms, NO_LIMIT},
        {"nfs_rtt_ms", thresholds.nfs_rtt_ms, NO_LIMIT},
        {"reallocated", thresholds.reallocated, NO_LIMIT},
        {"pending", thresholds.pending, NO_LIMIT},
        {"uncorrectable", thresholds.uncorrectable, NO_LIMIT},
    };
    for (const auto& [key, pair, max] : pairs) {
        if (auto ok = check_pair(key, pair, max); !ok) {
            return ok;
        }
    }

    const auto& fill = thresholds.fill_days;
    if (fill.warn < 0 || fill.crit < 0) {
        return util::fail(util::ErrorKind::ConfigInvalid, "fill_days: must not be negative");
    }
    if (fill.warn > 0 && fill.crit > fill.warn) {
        return util::fail(util::ErrorKind::ConfigInvalid,
                          std::format("fill_days: crit ({}) is above warn ({})", fill.crit, fill.warn));
    }

    const auto& url = notifications.webhook_url;
    if (!url.empty() && !url.starts_with("http://") && !url.starts_with("https://")) {
        return util::fail(util::ErrorKind::ConfigInvalid,
                          std::format("webhook_url must start with http:// or https://: {}", url));
    }

    for (const auto& pattern : exclude) {
        if (pattern.empty()) {
            return util::fail(util::ErrorKind::ConfigInvalid, "exclude: empty pattern");
        }
    }
    return {};
}

auto Config::is_excluded(const std::string& device) const -> bool {
    return std::ranges::any_of(exclude, [&device](const std::string& pattern) {
        return ::fnmatch(pattern.c_str(), device.c_str(), 0) == 0;
    });
}

auto Config::alias_for(const std::string& device) const -> std::string {
    auto it = aliases.find(device);
    return it == aliases.end() ? std::string{} : it->second;
}

auto Config::temperature_thresholds(DeviceKind kind) const -> const ThresholdPair& {
    switch (kind) {
        case DeviceKind::HDD:
            return thresholds.temperature_hdd;
        case DeviceKind::SSD:
            return thresholds.temperature_ssd;
        case DeviceKind::NVMe:
            return thresholds.temperature_nvme;
    }
    return thresholds.temperature_hdd;
}

auto Config::is_rule_enabled(RuleKind kind) const -> bool {
    return std::ranges::find(disabled_rules, kind) == disabled_rules.end();
}

auto Config::rule(RuleKind kind) const -> AlertRule {
    AlertRule rule{kind, 1.0, 2.0, is_rule_enabled(kind)};
    auto apply = [&rule](const ThresholdPair& pair) {
        rule.warn = pair.warn;
        rule.crit = pair.crit;
    };

    switch (kind) {
        case RuleKind::ThresholdTemp:
            apply(thresholds.temperature_hdd);
            break;
        case RuleKind::ThresholdUtil:
            apply(thresholds.io_util_pct);
            break;
        case RuleKind::ThresholdFs:
            apply(thresholds.filesystem_pct);
            break;
        case RuleKind::ThresholdInode:
            apply(thresholds.inode_pct);
            break;
        case RuleKind::SectorCount:
            apply(thresholds.reallocated);
            break;
        case RuleKind::Latency:
            apply(thresholds.latency_ms);
            break;
        case RuleKind::NfsLatency:
            apply(thresholds.nfs_rtt_ms);
            break;
        case RuleKind::FsFillRate:
            apply(thresholds.fill_days);
            break;
        case RuleKind::SmartStatus:
        case RuleKind::VolumeHealth:
            break;
    }
    return rule;
}

auto Config::rules() const -> std::vector<AlertRule> {
    std::vector<AlertRule> out;
    out.reserve(ALL_RULE_KINDS.size());
    for (auto kind : ALL_RULE_KINDS) {
        out.push_back(rule(kind));
    }
    return out;
}
