/**
 * @file DeviceStateStore.cpp
 * @brief Device state store implementation
 */

#include "services/DeviceStateStore.hpp"

#include "util/Logger.hpp"

#include <format>

namespace {

constexpr uint64_t SECTOR_BYTES = 512;

}  // namespace

DeviceStateStore::DeviceStateStore() : host_(std::make_shared<const HostState>()) {}

void DeviceStateStore::set_health_evaluator(HealthEvaluator evaluator) {
    std::lock_guard lock(listener_mutex_);
    health_evaluator_ = std::move(evaluator);
}

void DeviceStateStore::set_commit_listener(CommitListener listener) {
    std::lock_guard lock(listener_mutex_);
    commit_listener_ = std::move(listener);
}

void DeviceStateStore::set_host_commit_listener(HostCommitListener listener) {
    std::lock_guard lock(listener_mutex_);
    host_commit_listener_ = std::move(listener);
}

void DeviceStateStore::set_hotplug_listener(HotplugListener listener) {
    std::lock_guard lock(listener_mutex_);
    hotplug_listener_ = std::move(listener);
}

auto DeviceStateStore::find_entry(const std::string& id) const -> std::shared_ptr<Entry> {
    std::shared_lock lock(map_mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
}

auto DeviceStateStore::load(const Entry& entry) -> StatePtr {
    std::lock_guard lock(entry.state_mutex);
    return entry.state;
}

void DeviceStateStore::store(Entry& entry, StatePtr state) {
    std::lock_guard lock(entry.state_mutex);
    entry.state = std::move(state);
}

auto DeviceStateStore::get_snapshot(const std::string& id) const -> util::Result<StatePtr> {
    auto entry = find_entry(id);
    if (!entry) {
        return util::fail(util::ErrorKind::NotFound, std::format("unknown device: {}", id));
    }
    return load(*entry);
}

auto DeviceStateStore::list_devices() const -> std::vector<StatePtr> {
    std::shared_lock lock(map_mutex_);
    std::vector<StatePtr> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        out.push_back(load(*entry));
    }
    return out;
}

auto DeviceStateStore::device_ids() const -> std::vector<std::string> {
    std::shared_lock lock(map_mutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        out.push_back(id);
    }
    return out;
}

auto DeviceStateStore::contains(const std::string& id) const -> bool {
    std::shared_lock lock(map_mutex_);
    return entries_.contains(id);
}

void DeviceStateStore::apply_io(DeviceState& next, const DeviceState& prev,
                                const IoCounters& counters) const {
    IoRecord record{counters, std::nullopt};
    if (prev.io) {
        record.rates = IoRates::between(prev.io->counters, counters);
    }
    next.io = std::move(record);
    next.io_stale = false;
    next.io_updated_at = counters.captured_at;

    if (!next.endurance) {
        next.endurance = EnduranceRecord{0, counters.captured_at, counters.sectors_written};
        return;
    }

    auto& endurance = *next.endurance;
    if (counters.sectors_written >= endurance.last_sectors_written) {
        endurance.bytes_written +=
            (counters.sectors_written - endurance.last_sectors_written) * SECTOR_BYTES;
    }
    // A smaller counter means the kernel restarted counting; resume from it.
    endurance.last_sectors_written = counters.sectors_written;
}

auto DeviceStateStore::merge(const std::string& id, DeviceReading reading) -> util::Result<void> {
    auto entry = find_entry(id);
    if (!entry) {
        return util::fail(util::ErrorKind::NotFound, std::format("unknown device: {}", id));
    }

    HealthEvaluator evaluator;
    CommitListener listener;
    {
        std::lock_guard lock(listener_mutex_);
        evaluator = health_evaluator_;
        listener = commit_listener_;
    }

    std::lock_guard merge_lock(entry->merge_mutex);
    if (entry->removed) {
        return util::fail(util::ErrorKind::NotFound, std::format("device {} was removed", id));
    }

    const auto prev = load(*entry);
    auto next = std::make_shared<DeviceState>(*prev);
    const auto domain = domain_of(reading);

    std::visit(overloaded{
                   [&](SmartReading& smart) {
                       if (smart.snapshot.captured_at == util::TimePoint{}) {
                           smart.snapshot.captured_at = util::Clock::now();
                       }
                       next->smart_updated_at = smart.snapshot.captured_at;
                       next->smart_prev = prev->smart;
                       next->smart = std::make_shared<const SmartSnapshot>(std::move(smart.snapshot));
                       next->smart_stale = false;
                       if (evaluator) {
                           next->health = evaluator(*prev, *next);
                       }
                   },
                   [&](IoReading& io) {
                       if (io.counters.captured_at == util::TimePoint{}) {
                           io.counters.captured_at = util::Clock::now();
                       }
                       apply_io(*next, *prev, io.counters);
                   },
                   [&](SelfTestReading& test) {
                       next->self_test = test.status;
                       if (test.log) {
                           next->self_test_log = std::move(*test.log);
                       }
                       next->self_test_stale = false;
                   },
               },
               reading);

    store(*entry, next);

    if (listener) {
        listener(*next, domain);
    }
    return {};
}

void DeviceStateStore::merge_host(HostReading reading) {
    HostCommitListener listener;
    {
        std::lock_guard lock(listener_mutex_);
        listener = host_commit_listener_;
    }

    std::lock_guard merge_lock(host_merge_mutex_);
    auto next = std::make_shared<HostState>(*host_snapshot());
    const auto domain = domain_of(reading);
    const auto now = util::Clock::now();

    std::visit(overloaded{
                   [&](FilesystemReading& fs) {
                       auto captured = fs.captured_at == util::TimePoint{} ? now : fs.captured_at;
                       fill_rate_.update(fs.filesystems, captured);
                       fill_rate_.retain(fs.filesystems);
                       next->filesystems = std::move(fs.filesystems);
                       next->filesystems_stale = false;
                       next->filesystems_updated_at = captured;
                   },
                   [&](NfsReading& nfs) {
                       next->nfs_mounts = std::move(nfs.mounts);
                       next->nfs_stale = false;
                       next->nfs_updated_at = now;
                   },
                   [&](VolumeReading& volumes) {
                       next->volumes = std::move(volumes.volumes);
                       next->volumes_stale = false;
                       next->volumes_updated_at = now;
                   },
               },
               reading);

    {
        std::lock_guard lock(host_state_mutex_);
        host_ = next;
    }

    if (listener) {
        listener(*next, domain);
    }
}

auto DeviceStateStore::host_snapshot() const -> HostPtr {
    std::lock_guard lock(host_state_mutex_);
    return host_;
}

void DeviceStateStore::mark_stale(const std::string& id, Domain domain) {
    auto entry = find_entry(id);
    if (!entry) {
        return;
    }

    std::lock_guard merge_lock(entry->merge_mutex);
    const auto prev = load(*entry);
    if (prev->is_stale(domain)) {
        return;
    }

    auto next = std::make_shared<DeviceState>(*prev);
    switch (domain) {
        case Domain::Smart:
            next->smart_stale = true;
            break;
        case Domain::IoCounters:
            next->io_stale = true;
            break;
        case Domain::SelfTest:
            next->self_test_stale = true;
            break;
        case Domain::Filesystem:
        case Domain::Nfs:
        case Domain::Volume:
            return;
    }
    store(*entry, std::move(next));
    LOG_DEBUG("DeviceStateStore", std::format("{} {} data marked stale", id, to_string(domain)));
}

void DeviceStateStore::mark_host_stale(Domain domain) {
    std::lock_guard merge_lock(host_merge_mutex_);
    auto next = std::make_shared<HostState>(*host_snapshot());
    switch (domain) {
        case Domain::Filesystem:
            next->filesystems_stale = true;
            break;
        case Domain::Nfs:
            next->nfs_stale = true;
            break;
        case Domain::Volume:
            next->volumes_stale = true;
            break;
        case Domain::Smart:
        case Domain::IoCounters:
        case Domain::SelfTest:
            return;
    }
    std::lock_guard lock(host_state_mutex_);
    host_ = std::move(next);
}

auto DeviceStateStore::on_hotplug(HotplugEvent event, const DeviceIdentity& identity) -> bool {
    bool changed = false;

    if (event == HotplugEvent::Add) {
        std::unique_lock lock(map_mutex_);
        auto it = entries_.find(identity.id);
        if (it == entries_.end()) {
            auto state = std::make_shared<DeviceState>();
            state->identity = identity;
            if (auto alias = aliases_.find(identity.id); alias != aliases_.end()) {
                state->alias = alias->second;
            }
            if (auto seeded = seeded_endurance_.find(identity.id); seeded != seeded_endurance_.end()) {
                state->endurance = seeded->second;
            }
            auto entry = std::make_shared<Entry>();
            entry->state = std::move(state);
            entries_.emplace(identity.id, std::move(entry));
            changed = true;
        } else {
            auto entry = it->second;
            lock.unlock();
            std::lock_guard merge_lock(entry->merge_mutex);
            auto prev = load(*entry);
            if (!(prev->identity == identity)) {
                auto next = std::make_shared<DeviceState>(*prev);
                next->identity = identity;
                store(*entry, std::move(next));
            }
        }
    } else {
        std::shared_ptr<Entry> entry;
        {
            std::unique_lock lock(map_mutex_);
            auto it = entries_.find(identity.id);
            if (it != entries_.end()) {
                entry = it->second;
                entries_.erase(it);
                changed = true;
            }
        }
        if (entry) {
            std::lock_guard merge_lock(entry->merge_mutex);
            entry->removed = true;
        }
    }

    if (changed) {
        LOG_INFO("DeviceStateStore",
                 std::format("device {} {}", identity.id,
                             event == HotplugEvent::Add ? "added" : "removed"));
        HotplugListener listener;
        {
            std::lock_guard lock(listener_mutex_);
            listener = hotplug_listener_;
        }
        if (listener) {
            listener(event, identity.id);
        }
    }
    return changed;
}

void DeviceStateStore::seed_from_cache(const DeviceIdentity& identity, SmartSnapshot snapshot) {
    on_hotplug(HotplugEvent::Add, identity);

    auto entry = find_entry(identity.id);
    if (!entry) {
        return;
    }

    std::lock_guard merge_lock(entry->merge_mutex);
    auto prev = load(*entry);
    if (prev->smart) {
        return;
    }
    auto next = std::make_shared<DeviceState>(*prev);
    next->smart_updated_at = snapshot.captured_at;
    next->smart = std::make_shared<const SmartSnapshot>(std::move(snapshot));
    next->smart_stale = true;
    store(*entry, std::move(next));
}

void DeviceStateStore::seed_endurance(const std::map<std::string, EnduranceRecord>& records) {
    std::vector<std::pair<std::shared_ptr<Entry>, EnduranceRecord>> present;
    {
        std::unique_lock lock(map_mutex_);
        for (const auto& [id, record] : records) {
            seeded_endurance_[id] = record;
            if (auto it = entries_.find(id); it != entries_.end()) {
                present.emplace_back(it->second, record);
            }
        }
    }

    for (const auto& [entry, record] : present) {
        std::lock_guard merge_lock(entry->merge_mutex);
        auto prev = load(*entry);
        if (prev->endurance) {
            continue;
        }
        auto next = std::make_shared<DeviceState>(*prev);
        next->endurance = record;
        store(*entry, std::move(next));
    }
}

void DeviceStateStore::apply_aliases(const std::map<std::string, std::string>& aliases) {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::unique_lock lock(map_mutex_);
        aliases_ = aliases;
        for (const auto& [id, entry] : entries_) {
            entries.push_back(entry);
        }
    }

    for (const auto& entry : entries) {
        std::lock_guard merge_lock(entry->merge_mutex);
        auto prev = load(*entry);
        auto it = aliases.find(prev->identity.id);
        const std::string alias = it == aliases.end() ? std::string{} : it->second;
        if (alias == prev->alias) {
            continue;
        }
        auto next = std::make_shared<DeviceState>(*prev);
        next->alias = alias;
        store(*entry, std::move(next));
    }
}
