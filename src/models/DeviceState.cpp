/**
 * @file DeviceState.cpp
 * @brief State model helpers
 */

#include "models/DeviceState.hpp"

#include <chrono>

#include "models/HostState.hpp"

namespace {

constexpr double SECTOR_BYTES = 512.0;

}  // namespace

auto to_string(Domain domain) -> std::string_view {
    switch (domain) {
        case Domain::Smart:
            return "smart";
        case Domain::IoCounters:
            return "io";
        case Domain::Filesystem:
            return "filesystem";
        case Domain::Nfs:
            return "nfs";
        case Domain::Volume:
            return "volume";
        case Domain::SelfTest:
            return "selftest";
    }
    return "unknown";
}

auto to_string(SelfTestType type) -> std::string_view {
    return type == SelfTestType::Long ? "long" : "short";
}

auto to_string(SelfTestState state) -> std::string_view {
    switch (state) {
        case SelfTestState::Idle:
            return "idle";
        case SelfTestState::Running:
            return "running";
        case SelfTestState::CompletedPass:
            return "completed-pass";
        case SelfTestState::CompletedFail:
            return "completed-fail";
        case SelfTestState::Aborted:
            return "aborted";
        case SelfTestState::TimedOut:
            return "timed-out";
    }
    return "idle";
}

auto self_test_state_from_string(std::string_view text) -> SelfTestState {
    for (auto state : {SelfTestState::Running, SelfTestState::CompletedPass,
                       SelfTestState::CompletedFail, SelfTestState::Aborted,
                       SelfTestState::TimedOut}) {
        if (text == to_string(state)) {
            return state;
        }
    }
    return SelfTestState::Idle;
}

auto to_string(VolumeHealth health) -> std::string_view {
    switch (health) {
        case VolumeHealth::Healthy:
            return "healthy";
        case VolumeHealth::Rebuilding:
            return "rebuilding";
        case VolumeHealth::Degraded:
            return "degraded";
        case VolumeHealth::Failed:
            return "failed";
    }
    return "healthy";
}

auto IoRates::between(const IoCounters& prev, const IoCounters& next) -> std::optional<IoRates> {
    const double elapsed_ms = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(next.captured_at - prev.captured_at)
            .count());
    if (elapsed_ms <= 0.0) {
        return std::nullopt;
    }
    if (next.reads_completed < prev.reads_completed ||
        next.writes_completed < prev.writes_completed ||
        next.sectors_read < prev.sectors_read || next.sectors_written < prev.sectors_written ||
        next.io_time_ms < prev.io_time_ms) {
        return std::nullopt;
    }

    const double seconds = elapsed_ms / 1000.0;
    const auto reads = static_cast<double>(next.reads_completed - prev.reads_completed);
    const auto writes = static_cast<double>(next.writes_completed - prev.writes_completed);

    IoRates rates;
    rates.read_bytes_per_sec =
        static_cast<double>(next.sectors_read - prev.sectors_read) * SECTOR_BYTES / seconds;
    rates.write_bytes_per_sec =
        static_cast<double>(next.sectors_written - prev.sectors_written) * SECTOR_BYTES / seconds;
    rates.read_iops = reads / seconds;
    rates.write_iops = writes / seconds;

    const auto busy_ms = static_cast<double>(next.io_time_ms - prev.io_time_ms);
    rates.util_pct = busy_ms / elapsed_ms * 100.0;
    if (rates.util_pct > 100.0) {
        rates.util_pct = 100.0;
    }

    if (reads > 0 && next.read_time_ms >= prev.read_time_ms) {
        rates.avg_read_latency_ms = static_cast<double>(next.read_time_ms - prev.read_time_ms) / reads;
    }
    if (writes > 0 && next.write_time_ms >= prev.write_time_ms) {
        rates.avg_write_latency_ms =
            static_cast<double>(next.write_time_ms - prev.write_time_ms) / writes;
    }
    return rates;
}

auto EnduranceRecord::bytes_per_day(util::TimePoint now) const -> double {
    const auto elapsed = std::chrono::duration<double>(now - first_tracked).count();
    const double days = elapsed / 86400.0;
    if (days < 1.0) {
        return static_cast<double>(bytes_written);
    }
    return static_cast<double>(bytes_written) / days;
}

auto DeviceState::is_stale(Domain domain) const -> bool {
    switch (domain) {
        case Domain::Smart:
            return smart_stale;
        case Domain::IoCounters:
            return io_stale;
        case Domain::SelfTest:
            return self_test_stale;
        case Domain::Filesystem:
        case Domain::Nfs:
        case Domain::Volume:
            return false;
    }
    return false;
}
