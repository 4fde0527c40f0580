/**
 * @file PollingScheduler.cpp
 * @brief Per-domain polling threads
 */

#include "services/PollingScheduler.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <format>
#include <system_error>

namespace {

constexpr std::chrono::milliseconds CANCEL_CHECK_INTERVAL{20};

auto smart_key(const std::string& device) -> std::string {
    return std::format("SMART read of {}", device);
}

}  // namespace

PollingScheduler::PollingScheduler(std::shared_ptr<IReadingProvider> provider,
                                   std::shared_ptr<DeviceStateStore> store,
                                   std::shared_ptr<ConfigStore> config_store)
    : provider_(std::move(provider)),
      store_(std::move(store)),
      config_store_(std::move(config_store)) {}

PollingScheduler::~PollingScheduler() {
    stop();
}

auto PollingScheduler::index_of(Domain domain) -> std::optional<size_t> {
    for (size_t i = 0; i < POLLED_DOMAINS.size(); ++i) {
        if (POLLED_DOMAINS[i] == domain) {
            return i;
        }
    }
    return std::nullopt;
}

auto PollingScheduler::interval_for(Domain domain, const Config& config)
    -> std::chrono::milliseconds {
    const auto& general = config.general;
    switch (domain) {
        case Domain::Smart:
            return std::chrono::seconds(general.smart_interval_sec);
        case Domain::IoCounters:
            return std::chrono::milliseconds(general.update_interval_ms);
        case Domain::Filesystem:
            return std::chrono::seconds(general.fs_interval_sec);
        case Domain::Nfs:
            return std::chrono::seconds(general.nfs_interval_sec);
        case Domain::Volume:
            return std::chrono::seconds(general.volume_interval_sec);
        case Domain::SelfTest:
            return std::chrono::seconds(general.selftest_poll_sec);
    }
    return std::chrono::seconds(general.smart_interval_sec);
}

void PollingScheduler::set_cycle_listener(CycleListener listener) {
    std::lock_guard lock(listener_mutex_);
    cycle_listener_ = std::move(listener);
}

void PollingScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    *cancel_ = false;

    if (auto refreshed = refresh_devices(); !refreshed) {
        LOG_WARNING("PollingScheduler",
                    std::format("initial device enumeration failed: {}", refreshed.error().message));
    }

    for (auto domain : POLLED_DOMAINS) {
        threads_.emplace_back([this, domain] { domain_loop(domain); });
    }
    LOG_INFO("PollingScheduler", std::format("started {} polling threads", threads_.size()));
}

void PollingScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    *cancel_ = true;
    {
        std::lock_guard lock(wake_mutex_);
        wake_requested_.fill(true);
    }
    wake_cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    if (auto stuck = in_flight(); !stuck.empty()) {
        std::string names;
        for (const auto& key : stuck) {
            names += names.empty() ? key : ", " + key;
        }
        LOG_WARNING("PollingScheduler",
                    std::format("abandoning {} provider call(s) still running: {}", stuck.size(),
                                names));
    }
    LOG_INFO("PollingScheduler", "stopped");
}

void PollingScheduler::request_poll(Domain domain) {
    const auto idx = index_of(domain);
    if (!idx) {
        return;
    }
    {
        std::lock_guard lock(wake_mutex_);
        wake_requested_[*idx] = true;
    }
    wake_cv_.notify_all();
}

auto PollingScheduler::failure_streak(Domain domain) const -> int {
    const auto idx = index_of(domain);
    return idx ? failures_[*idx].load() : 0;
}

auto PollingScheduler::in_flight() const -> std::vector<std::string> {
    std::lock_guard lock(in_flight_->mutex);
    return {in_flight_->keys.begin(), in_flight_->keys.end()};
}

void PollingScheduler::domain_loop(Domain domain) {
    const auto idx = *index_of(domain);
    LOG_DEBUG("PollingScheduler", std::format("{} poller started", to_string(domain)));

    while (running_) {
        // Failures are logged and counted by poll_once; retried next cadence
        static_cast<void>(poll_once(domain));

        const auto interval = interval_for(domain, *config_store_->current());
        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, interval, [this, idx] { return !running_ || wake_requested_[idx]; });
        wake_requested_[idx] = false;
    }
    LOG_DEBUG("PollingScheduler", std::format("{} poller stopped", to_string(domain)));
}

auto PollingScheduler::poll_once(Domain domain) -> util::Result<void> {
    util::Result<void> result;
    switch (domain) {
        case Domain::Smart:
            result = poll_smart();
            break;
        case Domain::IoCounters:
            result = poll_io();
            break;
        case Domain::Filesystem:
        case Domain::Nfs:
        case Domain::Volume:
            result = poll_host(domain);
            break;
        case Domain::SelfTest:
            return util::fail(util::ErrorKind::InvalidArgument,
                              "self-tests are polled by the self-test scheduler");
    }
    record_outcome(domain, result);
    notify_cycle(domain);
    return result;
}

void PollingScheduler::record_outcome(Domain domain, const util::Result<void>& result) {
    const auto idx = index_of(domain);
    if (!idx) {
        return;
    }
    auto& streak = failures_[*idx];
    if (result) {
        if (streak.exchange(0) > 0) {
            LOG_INFO("PollingScheduler", std::format("{} polling recovered", to_string(domain)));
        }
        return;
    }

    const int count = ++streak;
    const auto& error = result.error();
    if (count == 1) {
        LOG_WARNING("PollingScheduler",
                    std::format("{} poll failed ({}): {}", to_string(domain),
                                util::to_string(error.kind), error.message));
    } else {
        LOG_DEBUG("PollingScheduler", std::format("{} poll failed {} times in a row: {}",
                                                  to_string(domain), count, error.message));
    }
}

void PollingScheduler::notify_cycle(Domain domain) {
    CycleListener listener;
    {
        std::lock_guard lock(listener_mutex_);
        listener = cycle_listener_;
    }
    if (listener) {
        listener(domain);
    }
}

auto PollingScheduler::make_context() const -> FetchContext {
    const auto timeout = std::chrono::milliseconds(config_store_->current()->general.fetch_timeout_ms);
    return FetchContext::with_timeout(timeout, cancel_.get());
}

// Bounded provider calls

template <typename T>
auto PollingScheduler::launch(const std::string& key, const FetchContext& ctx, Fetch<T> fetch)
    -> util::Result<std::future<util::Result<T>>> {
    {
        std::lock_guard lock(in_flight_->mutex);
        if (!in_flight_->keys.insert(key).second) {
            return util::fail(util::ErrorKind::TransientFetchError,
                              std::format("{} still running from an earlier cycle", key));
        }
    }

    std::promise<util::Result<T>> promise;
    auto future = promise.get_future();
    try {
        // Detached so a call stuck in the kernel holds neither the poller nor
        // shutdown; the worker owns the cancel flag its context points at.
        std::thread([fetch = std::move(fetch), ctx, key, promise = std::move(promise),
                     in_flight = in_flight_, cancel = cancel_]() mutable {
            FetchContext worker_ctx = ctx;
            worker_ctx.cancel = cancel.get();
            auto result = fetch(worker_ctx);
            {
                std::lock_guard lock(in_flight->mutex);
                in_flight->keys.erase(key);
            }
            promise.set_value(std::move(result));
        }).detach();
    } catch (const std::system_error& e) {
        std::lock_guard lock(in_flight_->mutex);
        in_flight_->keys.erase(key);
        return util::fail(util::ErrorKind::TransientFetchError,
                          std::format("cannot start worker for {}: {}", key, e.what()));
    }
    return future;
}

template <typename T>
auto PollingScheduler::await(const std::string& key, std::future<util::Result<T>>& future,
                             const FetchContext& ctx) -> util::Result<T> {
    for (;;) {
        const auto slice =
            std::min(ctx.deadline, std::chrono::steady_clock::now() + CANCEL_CHECK_INTERVAL);
        if (future.wait_until(slice) == std::future_status::ready) {
            return future.get();
        }
        if (ctx.expired()) {
            return util::fail(util::ErrorKind::TransientFetchError,
                              std::format("{} {}", key, ctx.cancelled() ? "cancelled" : "timed out"));
        }
    }
}

template <typename T>
auto PollingScheduler::bounded_fetch(const std::string& key, Fetch<T> fetch) -> util::Result<T> {
    const auto ctx = make_context();
    auto future = launch<T>(key, ctx, std::move(fetch));
    if (!future) {
        return std::unexpected(future.error());
    }
    return await(key, *future, ctx);
}

auto PollingScheduler::refresh_devices() -> util::Result<void> {
    const auto config = config_store_->current();
    auto listed = bounded_fetch<std::vector<DeviceIdentity>>(
        "device enumeration",
        [provider = provider_](const FetchContext& ctx) { return provider->list_devices(ctx); });
    if (!listed) {
        return std::unexpected(listed.error());
    }

    std::set<std::string> present;
    for (const auto& identity : *listed) {
        if (config->is_excluded(identity.id)) {
            continue;
        }
        present.insert(identity.id);
        if (store_->on_hotplug(HotplugEvent::Add, identity) && running_) {
            request_poll(Domain::Smart);
        }
    }

    for (const auto& id : store_->device_ids()) {
        if (!present.contains(id)) {
            DeviceIdentity gone;
            gone.id = id;
            store_->on_hotplug(HotplugEvent::Remove, gone);
        }
    }
    return {};
}

// SMART

auto PollingScheduler::launch_smart(const DeviceIdentity& identity, const FetchContext& ctx)
    -> util::Result<std::future<util::Result<SmartSnapshot>>> {
    return launch<SmartSnapshot>(smart_key(identity.id), ctx,
                                 [provider = provider_, identity](const FetchContext& fetch_ctx) {
                                     return provider->fetch_smart(identity, fetch_ctx);
                                 });
}

auto PollingScheduler::merge_smart(const std::string& device, util::Result<SmartSnapshot> snapshot)
    -> util::Result<void> {
    if (!snapshot) {
        store_->mark_stale(device, Domain::Smart);
        return std::unexpected(snapshot.error());
    }

    snapshot->derive_status();
    if (auto merged = store_->merge(device, SmartReading{std::move(*snapshot)}); !merged) {
        LOG_DEBUG("PollingScheduler",
                  std::format("SMART result for {} dropped: {}", device, merged.error().message));
    }
    return {};
}

auto PollingScheduler::poll_smart() -> util::Result<void> {
    const auto devices = store_->list_devices();
    if (devices.empty()) {
        return {};
    }

    const auto ctx = make_context();
    std::vector<std::pair<std::string, util::Result<std::future<util::Result<SmartSnapshot>>>>>
        pending;
    pending.reserve(devices.size());
    for (const auto& state : devices) {
        pending.emplace_back(state->identity.id, launch_smart(state->identity, ctx));
    }

    size_t failed = 0;
    std::optional<util::Error> first_error;
    for (auto& [device, launched] : pending) {
        auto snapshot = launched ? await(smart_key(device), *launched, ctx)
                                 : util::Result<SmartSnapshot>(std::unexpected(launched.error()));
        auto result = merge_smart(device, std::move(snapshot));
        if (!result) {
            ++failed;
            LOG_DEBUG("PollingScheduler",
                      std::format("SMART {}: {}", device, result.error().message));
            if (!first_error) {
                first_error = result.error();
            }
        }
    }

    // One unreadable drive does not fail the whole cycle
    if (failed == pending.size() && first_error) {
        return std::unexpected(*first_error);
    }
    return {};
}

auto PollingScheduler::repoll_smart(const std::string& device) -> util::Result<void> {
    auto state = store_->get_snapshot(device);
    if (!state) {
        return std::unexpected(state.error());
    }
    const auto ctx = make_context();
    auto launched = launch_smart((*state)->identity, ctx);
    auto snapshot = launched ? await(smart_key(device), *launched, ctx)
                             : util::Result<SmartSnapshot>(std::unexpected(launched.error()));
    auto result = merge_smart(device, std::move(snapshot));
    if (result) {
        LOG_INFO("PollingScheduler", std::format("SMART data of {} refreshed on request", device));
        notify_cycle(Domain::Smart);
    }
    return result;
}

// I/O counters

auto PollingScheduler::poll_io() -> util::Result<void> {
    if (auto refreshed = refresh_devices(); !refreshed) {
        for (const auto& id : store_->device_ids()) {
            store_->mark_stale(id, Domain::IoCounters);
        }
        return refreshed;
    }

    auto counters = bounded_fetch<std::map<std::string, IoCounters>>(
        "I/O counter read",
        [provider = provider_](const FetchContext& ctx) { return provider->fetch_io_counters(ctx); });
    const auto ids = store_->device_ids();
    if (!counters) {
        for (const auto& id : ids) {
            store_->mark_stale(id, Domain::IoCounters);
        }
        return std::unexpected(counters.error());
    }

    for (const auto& id : ids) {
        auto it = counters->find(id);
        if (it == counters->end()) {
            store_->mark_stale(id, Domain::IoCounters);
            continue;
        }
        if (auto merged = store_->merge(id, IoReading{it->second}); !merged) {
            LOG_DEBUG("PollingScheduler",
                      std::format("I/O counters for {} dropped: {}", id, merged.error().message));
        }
    }
    return {};
}

// Host-wide domains

auto PollingScheduler::poll_host(Domain domain) -> util::Result<void> {
    switch (domain) {
        case Domain::Filesystem: {
            auto filesystems = bounded_fetch<std::vector<FilesystemUsage>>(
                "filesystem scan", [provider = provider_](const FetchContext& ctx) {
                    return provider->fetch_filesystems(ctx);
                });
            if (!filesystems) {
                store_->mark_host_stale(domain);
                return std::unexpected(filesystems.error());
            }
            store_->merge_host(FilesystemReading{std::move(*filesystems), util::Clock::now()});
            return {};
        }
        case Domain::Nfs: {
            auto mounts = bounded_fetch<std::vector<NfsMountStats>>(
                "NFS statistics read",
                [provider = provider_](const FetchContext& ctx) { return provider->fetch_nfs(ctx); });
            if (!mounts) {
                store_->mark_host_stale(domain);
                return std::unexpected(mounts.error());
            }
            store_->merge_host(NfsReading{std::move(*mounts)});
            return {};
        }
        case Domain::Volume: {
            auto volumes = bounded_fetch<std::vector<VolumeStatus>>(
                "volume status read", [provider = provider_](const FetchContext& ctx) {
                    return provider->fetch_volumes(ctx);
                });
            if (!volumes) {
                store_->mark_host_stale(domain);
                return std::unexpected(volumes.error());
            }
            store_->merge_host(VolumeReading{std::move(*volumes)});
            return {};
        }
        case Domain::Smart:
        case Domain::IoCounters:
        case Domain::SelfTest:
            break;
    }
    return util::fail(util::ErrorKind::InvalidArgument,
                      std::format("{} is not a host-wide domain", to_string(domain)));
}
