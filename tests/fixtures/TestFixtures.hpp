/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures for drivewatch tests
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdlib.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "models/Config.hpp"
#include "models/DeviceState.hpp"
#include "models/HostState.hpp"
#include "models/SmartData.hpp"
#include "services/ConfigStore.hpp"
#include "util/Logger.hpp"

/**
 * @brief Base fixture owning a scratch directory removed after each test
 */
class TempDirFixture : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;

    void SetUp() override {
        auto pattern = (std::filesystem::temp_directory_path() / "drivewatch-test-XXXXXX").string();
        ASSERT_NE(::mkdtemp(pattern.data()), nullptr);
        temp_dir = pattern;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }

    /**
     * @brief ConfigStore backed by a file in the scratch directory, with `config` active
     */
    std::shared_ptr<ConfigStore> MakeConfigStore(const Config& config = {}) {
        auto store = std::make_shared<ConfigStore>(temp_dir / "drivewatch.conf");
        EXPECT_TRUE(store->replace(config).has_value());
        return store;
    }
};

/**
 * @brief Captures log entries through the logger sink for the lifetime of the object
 */
class LogCapture {
public:
    struct Entry {
        util::LogLevel level;
        std::string component;
        std::string message;
    };

    LogCapture() {
        util::Logger::instance().set_min_level(util::LogLevel::DEBUG);
        util::Logger::instance().set_sink(
            [this](util::LogLevel level, std::string_view component, std::string_view message) {
                std::lock_guard lock(mutex_);
                entries_.push_back(Entry{level, std::string(component), std::string(message)});
            });
    }

    ~LogCapture() {
        util::Logger::instance().set_sink(nullptr);
        util::Logger::instance().set_min_level(util::LogLevel::INFO);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool Contains(util::LogLevel level, std::string_view needle) const {
        std::lock_guard lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.level == level && entry.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    size_t Count(util::LogLevel level) const {
        std::lock_guard lock(mutex_);
        size_t count = 0;
        for (const auto& entry : entries_) {
            count += entry.level == level ? 1 : 0;
        }
        return count;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

/**
 * @brief Builders for devices and SMART snapshots
 */
namespace testdata {

inline DeviceIdentity MakeIdentity(const std::string& id = "sda",
                                   DeviceKind kind = DeviceKind::HDD) {
    DeviceIdentity identity;
    identity.id = id;
    identity.kind = kind;
    identity.model = "Test Disk";
    identity.serial = "TEST123";
    identity.transport = kind == DeviceKind::NVMe ? "nvme" : "sata";
    identity.capacity_bytes = 1'000'204'886'016ULL;
    return identity;
}

inline SmartAttribute MakeAttribute(uint32_t id, uint64_t raw, uint32_t value = 100,
                                    uint32_t threshold = 0, bool prefail = false) {
    SmartAttribute attr;
    attr.id = id;
    attr.name = std::string(smart::attribute_name(id));
    attr.value = value;
    attr.worst = value;
    attr.threshold = threshold;
    attr.prefail = prefail;
    attr.raw_value = raw;
    return attr;
}

/**
 * @brief Healthy ATA snapshot: 35 C, 1000 hours, zero sector counters
 */
inline SmartSnapshot MakeSnapshot(uint64_t reallocated = 0, int temperature = 35,
                                  util::TimePoint captured_at = util::Clock::now()) {
    SmartSnapshot snapshot;
    snapshot.captured_at = captured_at;
    snapshot.status = SmartStatus::Passed;
    snapshot.temperature_celsius = temperature;
    snapshot.power_on_hours = 1000;
    for (auto attr : {MakeAttribute(smart::REALLOCATED_SECTORS, reallocated, 100, 36, true),
                      MakeAttribute(smart::POWER_ON_HOURS, 1000),
                      MakeAttribute(smart::TEMPERATURE, static_cast<uint64_t>(temperature)),
                      MakeAttribute(smart::CURRENT_PENDING_SECTORS, 0),
                      MakeAttribute(smart::OFFLINE_UNCORRECTABLE, 0)}) {
        snapshot.attributes.emplace(attr.id, attr);
    }
    return snapshot;
}

inline SmartSnapshot MakeNvmeSnapshot(uint32_t percentage_used = 3, uint64_t media_errors = 0) {
    SmartSnapshot snapshot;
    snapshot.captured_at = util::Clock::now();
    snapshot.status = SmartStatus::Passed;
    snapshot.temperature_celsius = 40;
    snapshot.power_on_hours = 500;
    NvmeHealth nvme;
    nvme.percentage_used = percentage_used;
    nvme.media_errors = media_errors;
    snapshot.nvme = nvme;
    return snapshot;
}

inline FilesystemUsage MakeFilesystem(const std::string& mount, double used_pct,
                                      uint64_t total = 100ULL * 1024 * 1024 * 1024) {
    FilesystemUsage fs;
    fs.device = "/dev/sda1";
    fs.mount = mount;
    fs.fs_type = "ext4";
    fs.total_bytes = total;
    fs.used_bytes = static_cast<uint64_t>(static_cast<double>(total) * used_pct / 100.0);
    fs.avail_bytes = total - fs.used_bytes;
    fs.total_inodes = 1000;
    fs.free_inodes = 900;
    return fs;
}

}  // namespace testdata

/**
 * @brief Helper for testing threaded operations with timeouts
 */
class ThreadingTestHelper {
public:
    template<typename Callable>
    static bool WaitFor(Callable&& callable,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) {
        auto future = std::async(std::launch::async, std::forward<Callable>(callable));
        return future.wait_for(timeout) == std::future_status::ready;
    }

    template<typename Predicate>
    static bool WaitUntil(Predicate&& predicate,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds{5000},
                          std::chrono::milliseconds poll_interval = std::chrono::milliseconds{10}) {
        auto start = std::chrono::steady_clock::now();
        while (std::chrono::steady_clock::now() - start < timeout) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(poll_interval);
        }
        return false;
    }
};
