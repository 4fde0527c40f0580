/**
 * @file FillRateTracker.cpp
 * @brief Filesystem fill-rate projection
 */

#include "services/FillRateTracker.hpp"

#include <algorithm>
#include <chrono>
#include <set>

namespace {

constexpr double SECONDS_PER_DAY = 86400.0;

}  // namespace

void FillRateTracker::update(std::vector<FilesystemUsage>& filesystems, util::TimePoint now) {
    for (auto& fs : filesystems) {
        auto it = history_.try_emplace(fs.mount, HISTORY_CAPACITY).first;
        auto& ring = it->second;
        ring.push({now, fs.used_bytes});

        fs.fill_rate_bps.reset();
        fs.days_until_full.reset();
        if (ring.size() < MIN_SAMPLES) {
            continue;
        }

        const auto& [t0, u0] = ring.front();
        const auto& [t1, u1] = ring.back();
        const double secs = std::max(std::chrono::duration<double>(t1 - t0).count(), 0.001);
        const double rate = (static_cast<double>(u1) - static_cast<double>(u0)) / secs;

        fs.fill_rate_bps = rate;
        if (rate > 0.0 && fs.avail_bytes > 0) {
            fs.days_until_full = static_cast<double>(fs.avail_bytes) / rate / SECONDS_PER_DAY;
        }
    }
}

void FillRateTracker::retain(const std::vector<FilesystemUsage>& filesystems) {
    std::set<std::string> mounts;
    for (const auto& fs : filesystems) {
        mounts.insert(fs.mount);
    }
    std::erase_if(history_, [&mounts](const auto& item) { return !mounts.contains(item.first); });
}

auto FillRateTracker::sample_count(const std::string& mount) const -> size_t {
    auto it = history_.find(mount);
    return it == history_.end() ? 0 : it->second.size();
}
