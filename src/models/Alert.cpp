/**
 * @file Alert.cpp
 * @brief Alert model helpers
 */

#include "models/Alert.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace {

auto to_lower(std::string_view text) -> std::string {
    std::string out{text};
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

auto to_string(RuleKind kind) -> std::string_view {
    switch (kind) {
        case RuleKind::ThresholdTemp:
            return "threshold-temp";
        case RuleKind::ThresholdUtil:
            return "threshold-util";
        case RuleKind::ThresholdFs:
            return "threshold-fs";
        case RuleKind::ThresholdInode:
            return "threshold-inode";
        case RuleKind::SmartStatus:
            return "smart-status";
        case RuleKind::SectorCount:
            return "sector-count";
        case RuleKind::Latency:
            return "latency";
        case RuleKind::NfsLatency:
            return "nfs-latency";
        case RuleKind::VolumeHealth:
            return "volume-health";
        case RuleKind::FsFillRate:
            return "fs-fill-rate";
    }
    return "unknown";
}

auto rule_kind_from_string(std::string_view text) -> std::optional<RuleKind> {
    for (auto kind : ALL_RULE_KINDS) {
        if (to_string(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

auto to_string(Severity severity) -> std::string_view {
    return severity == Severity::Crit ? "crit" : "warn";
}

auto severity_from_string(std::string_view text) -> std::optional<Severity> {
    if (text == "crit") {
        return Severity::Crit;
    }
    if (text == "warn") {
        return Severity::Warn;
    }
    return std::nullopt;
}

auto to_string(AlertLevel level) -> std::string_view {
    switch (level) {
        case AlertLevel::Clear:
            return "clear";
        case AlertLevel::Warn:
            return "warn";
        case AlertLevel::Crit:
            return "crit";
    }
    return "clear";
}

auto Alert::make_key(std::string_view device, RuleKind rule) -> std::string {
    return std::format("{}|{}", device, to_string(rule));
}

auto AlertQuery::matches(const Alert& alert) const -> bool {
    if (active_only && alert.resolved) {
        return false;
    }
    if (since && alert.last_fired_at < *since) {
        return false;
    }
    if (min_severity && *min_severity == Severity::Crit && alert.severity != Severity::Crit) {
        return false;
    }
    if (!search.empty()) {
        auto needle = to_lower(search);
        if (!to_lower(alert.device).contains(needle) && !to_lower(alert.message).contains(needle) &&
            !std::string{to_string(alert.rule)}.contains(needle)) {
            return false;
        }
    }
    return true;
}
