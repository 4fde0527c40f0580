/**
 * @file DeviceStateStore.hpp
 * @brief Authoritative, concurrently readable map of device state
 */

#pragma once

#include "models/DeviceState.hpp"
#include "models/HostState.hpp"
#include "models/Readings.hpp"
#include "services/FillRateTracker.hpp"
#include "util/Result.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

enum class HotplugEvent { Add, Remove };

/**
 * @class DeviceStateStore
 * @brief Holds one immutable DeviceState per device and the host-wide state
 *
 * Each device has a merge lock that serializes writers and a pointer that
 * readers copy. A merge copies the current record, replaces one whole
 * sub-record, runs the health evaluator (SMART only), publishes the new
 * record and then invokes the commit listener, all before the merge lock
 * is released. Evaluation for a device therefore always sees the merge
 * that triggered it before any later merge of that device.
 */
class DeviceStateStore {
public:
    using StatePtr = std::shared_ptr<const DeviceState>;
    using HostPtr = std::shared_ptr<const HostState>;

    /// Computes the health record for a SMART merge (previous and new state)
    using HealthEvaluator = std::function<HealthRecord(const DeviceState&, const DeviceState&)>;
    /// Runs after a device merge is published
    using CommitListener = std::function<void(const DeviceState&, Domain)>;
    /// Runs after a host merge is published
    using HostCommitListener = std::function<void(const HostState&, Domain)>;
    using HotplugListener = std::function<void(HotplugEvent, const std::string&)>;

    DeviceStateStore();
    ~DeviceStateStore() = default;

    DeviceStateStore(const DeviceStateStore&) = delete;
    DeviceStateStore& operator=(const DeviceStateStore&) = delete;

    void set_health_evaluator(HealthEvaluator evaluator);
    void set_commit_listener(CommitListener listener);
    void set_host_commit_listener(HostCommitListener listener);
    void set_hotplug_listener(HotplugListener listener);

    /**
     * @brief Current record of one device
     * @return NotFound for unknown devices
     */
    [[nodiscard]] auto get_snapshot(const std::string& id) const -> util::Result<StatePtr>;

    /**
     * @brief All devices ordered by id
     */
    [[nodiscard]] auto list_devices() const -> std::vector<StatePtr>;

    [[nodiscard]] auto device_ids() const -> std::vector<std::string>;
    [[nodiscard]] auto contains(const std::string& id) const -> bool;

    /**
     * @brief Apply one reading to a device
     * @return NotFound if the device is not (or no longer) enumerated
     */
    auto merge(const std::string& id, DeviceReading reading) -> util::Result<void>;

    /**
     * @brief Replace one host-wide sub-record
     */
    void merge_host(HostReading reading);

    [[nodiscard]] auto host_snapshot() const -> HostPtr;

    /**
     * @brief Flag a domain of a device as stale, keeping its last data
     */
    void mark_stale(const std::string& id, Domain domain);
    void mark_host_stale(Domain domain);

    /**
     * @brief Device arrival or departure
     *
     * Add inserts the device (or refreshes its identity); Remove purges its
     * live state. Persisted history is not touched.
     * @return true if the device set changed
     */
    auto on_hotplug(HotplugEvent event, const DeviceIdentity& identity) -> bool;

    /**
     * @brief Pre-populate a device from the SMART cache; its SMART domain
     *        stays stale until the first live poll
     */
    void seed_from_cache(const DeviceIdentity& identity, SmartSnapshot snapshot);

    /**
     * @brief Endurance counters applied when a device is added or already present
     */
    void seed_endurance(const std::map<std::string, EnduranceRecord>& records);

    /**
     * @brief Re-apply display aliases to every device
     */
    void apply_aliases(const std::map<std::string, std::string>& aliases);

private:
    struct Entry {
        std::mutex merge_mutex;
        mutable std::mutex state_mutex;
        StatePtr state;
        bool removed = false;
    };

    [[nodiscard]] auto find_entry(const std::string& id) const -> std::shared_ptr<Entry>;
    [[nodiscard]] static auto load(const Entry& entry) -> StatePtr;
    static void store(Entry& entry, StatePtr state);

    void apply_io(DeviceState& next, const DeviceState& prev, const IoCounters& counters) const;

    mutable std::shared_mutex map_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::map<std::string, EnduranceRecord> seeded_endurance_;
    std::map<std::string, std::string> aliases_;

    std::mutex host_merge_mutex_;
    mutable std::mutex host_state_mutex_;
    HostPtr host_;
    FillRateTracker fill_rate_;

    mutable std::mutex listener_mutex_;
    HealthEvaluator health_evaluator_;
    CommitListener commit_listener_;
    HostCommitListener host_commit_listener_;
    HotplugListener hotplug_listener_;
};
