/**
 * @file FillRateTracker.hpp
 * @brief Per-mount usage history used to project when a filesystem fills up
 */

#pragma once

#include "models/HostState.hpp"
#include "util/HistoryRing.hpp"
#include "util/Time.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

/**
 * @class FillRateTracker
 * @brief Derives fill_rate_bps and days_until_full from consecutive samples
 *
 * The rate is taken between the oldest and newest retained samples and is
 * only reported once MIN_SAMPLES samples exist for a mount. Not thread-safe;
 * the state store calls it under its host merge lock.
 */
class FillRateTracker {
public:
    static constexpr size_t HISTORY_CAPACITY = 150;
    static constexpr size_t MIN_SAMPLES = 3;

    /**
     * @brief Record a sample for each filesystem and fill in its rate fields
     */
    void update(std::vector<FilesystemUsage>& filesystems, util::TimePoint now);

    /**
     * @brief Drop history of mounts that are no longer present
     */
    void retain(const std::vector<FilesystemUsage>& filesystems);

    [[nodiscard]] auto sample_count(const std::string& mount) const -> size_t;

private:
    using Sample = std::pair<util::TimePoint, uint64_t>;
    std::map<std::string, util::HistoryRing<Sample>> history_;
};
