/**
 * @file DeviceStateStoreTest.cpp
 * @brief Unit tests for DeviceStateStore merges, staleness and hotplug
 */

#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "services/DeviceStateStore.hpp"

#include <atomic>
#include <thread>

using testdata::MakeIdentity;
using testdata::MakeSnapshot;

class DeviceStateStoreTest : public ::testing::Test {
protected:
    DeviceStateStore store;

    void SetUp() override { store.on_hotplug(HotplugEvent::Add, MakeIdentity("sda")); }

    static auto Counters(int64_t at_sec, uint64_t sectors_written, uint64_t io_time_ms = 0)
        -> IoCounters {
        IoCounters counters;
        counters.captured_at = util::from_unix_seconds(at_sec);
        counters.sectors_written = sectors_written;
        counters.writes_completed = sectors_written / 8;
        counters.io_time_ms = io_time_ms;
        return counters;
    }
};

TEST_F(DeviceStateStoreTest, GetSnapshot_UnknownDeviceIsNotFound) {
    auto result = store.get_snapshot("sdz");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::NotFound);
}

TEST_F(DeviceStateStoreTest, Merge_UnknownDeviceIsNotFound) {
    auto result = store.merge("sdz", SmartReading{MakeSnapshot()});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::NotFound);
}

TEST_F(DeviceStateStoreTest, MergeSmart_KeepsPreviousSnapshotForDiff) {
    ASSERT_TRUE(store.merge("sda", SmartReading{MakeSnapshot(0)}).has_value());
    ASSERT_TRUE(store.merge("sda", SmartReading{MakeSnapshot(5)}).has_value());

    auto state = store.get_snapshot("sda");
    ASSERT_TRUE(state.has_value());
    ASSERT_NE((*state)->smart, nullptr);
    ASSERT_NE((*state)->smart_prev, nullptr);
    EXPECT_EQ((*state)->smart->raw_or(smart::REALLOCATED_SECTORS, 0), 5u);
    EXPECT_EQ((*state)->smart_prev->raw_or(smart::REALLOCATED_SECTORS, 0), 0u);
    EXPECT_FALSE((*state)->smart_stale);
}

// Test: merges publish new records and never mutate ones readers hold
TEST_F(DeviceStateStoreTest, Merge_PublishedRecordsAreImmutable) {
    ASSERT_TRUE(store.merge("sda", SmartReading{MakeSnapshot(0)}).has_value());
    auto before = *store.get_snapshot("sda");

    ASSERT_TRUE(store.merge("sda", SmartReading{MakeSnapshot(9)}).has_value());
    auto after = *store.get_snapshot("sda");

    EXPECT_NE(before.get(), after.get());
    EXPECT_EQ(before->smart->raw_or(smart::REALLOCATED_SECTORS, 0), 0u);
}

TEST_F(DeviceStateStoreTest, MergeSmart_RunsEvaluatorThenCommitListener) {
    std::vector<std::string> calls;
    store.set_health_evaluator([&calls](const DeviceState& prev, const DeviceState& next) {
        calls.push_back("evaluate");
        EXPECT_EQ(prev.smart, nullptr);
        EXPECT_NE(next.smart, nullptr);
        return HealthRecord{73, util::Clock::now(), 0};
    });
    store.set_commit_listener([&calls](const DeviceState& state, Domain domain) {
        calls.push_back("commit");
        EXPECT_EQ(domain, Domain::Smart);
        ASSERT_TRUE(state.health.has_value());
        EXPECT_EQ(state.health->score, 73);
    });

    ASSERT_TRUE(store.merge("sda", SmartReading{MakeSnapshot()}).has_value());
    EXPECT_EQ(calls, (std::vector<std::string>{"evaluate", "commit"}));
}

TEST_F(DeviceStateStoreTest, MergeIo_FirstSampleHasNoRates) {
    ASSERT_TRUE(store.merge("sda", IoReading{Counters(1000, 800)}).has_value());

    auto state = *store.get_snapshot("sda");
    ASSERT_TRUE(state->io.has_value());
    EXPECT_FALSE(state->io->rates.has_value());
}

TEST_F(DeviceStateStoreTest, MergeIo_DerivesRatesAndEndurance) {
    ASSERT_TRUE(store.merge("sda", IoReading{Counters(1000, 800, 0)}).has_value());
    ASSERT_TRUE(store.merge("sda", IoReading{Counters(1002, 1800, 500)}).has_value());

    auto state = *store.get_snapshot("sda");
    ASSERT_TRUE(state->io->rates.has_value());
    EXPECT_DOUBLE_EQ(state->io->rates->write_bytes_per_sec, 1000.0 * 512 / 2);
    EXPECT_DOUBLE_EQ(state->io->rates->util_pct, 25.0);
    ASSERT_TRUE(state->endurance.has_value());
    EXPECT_EQ(state->endurance->bytes_written, 1000u * 512);
}

// Test: a counter reset yields no rates and does not inflate endurance
TEST_F(DeviceStateStoreTest, MergeIo_CounterResetSkipsRates) {
    ASSERT_TRUE(store.merge("sda", IoReading{Counters(1000, 5000)}).has_value());
    ASSERT_TRUE(store.merge("sda", IoReading{Counters(1002, 100)}).has_value());
    ASSERT_TRUE(store.merge("sda", IoReading{Counters(1004, 300)}).has_value());

    auto state = *store.get_snapshot("sda");
    ASSERT_TRUE(state->io->rates.has_value());
    EXPECT_EQ(state->endurance->bytes_written, 200u * 512);
}

TEST_F(DeviceStateStoreTest, MarkStale_KeepsDataAndNewMergeClears) {
    ASSERT_TRUE(store.merge("sda", SmartReading{MakeSnapshot(3)}).has_value());
    store.mark_stale("sda", Domain::Smart);

    auto stale = *store.get_snapshot("sda");
    EXPECT_TRUE(stale->smart_stale);
    ASSERT_NE(stale->smart, nullptr);
    EXPECT_EQ(stale->smart->raw_or(smart::REALLOCATED_SECTORS, 0), 3u);

    ASSERT_TRUE(store.merge("sda", SmartReading{MakeSnapshot(3)}).has_value());
    EXPECT_FALSE((*store.get_snapshot("sda"))->smart_stale);
}

TEST_F(DeviceStateStoreTest, MarkStale_AlreadyStaleKeepsRecord) {
    store.mark_stale("sda", Domain::IoCounters);
    auto first = *store.get_snapshot("sda");
    store.mark_stale("sda", Domain::IoCounters);
    EXPECT_EQ(first.get(), (*store.get_snapshot("sda")).get());
}

TEST_F(DeviceStateStoreTest, Hotplug_AddAndRemove) {
    std::vector<std::pair<HotplugEvent, std::string>> events;
    store.set_hotplug_listener([&events](HotplugEvent event, const std::string& id) {
        events.emplace_back(event, id);
    });

    EXPECT_TRUE(store.on_hotplug(HotplugEvent::Add, MakeIdentity("sdb")));
    EXPECT_FALSE(store.on_hotplug(HotplugEvent::Add, MakeIdentity("sdb")));
    EXPECT_EQ(store.device_ids(), (std::vector<std::string>{"sda", "sdb"}));

    EXPECT_TRUE(store.on_hotplug(HotplugEvent::Remove, MakeIdentity("sdb")));
    EXPECT_FALSE(store.on_hotplug(HotplugEvent::Remove, MakeIdentity("sdb")));
    EXPECT_FALSE(store.contains("sdb"));
    EXPECT_FALSE(store.merge("sdb", IoReading{Counters(1, 1)}).has_value());

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].first, HotplugEvent::Add);
    EXPECT_EQ(events[1].first, HotplugEvent::Remove);
}

TEST_F(DeviceStateStoreTest, SeedFromCache_StaysStaleUntilLivePoll) {
    auto cached = MakeSnapshot(2, 40, util::from_unix_seconds(1'700'000'000));
    store.seed_from_cache(MakeIdentity("sdc"), cached);

    auto state = *store.get_snapshot("sdc");
    ASSERT_NE(state->smart, nullptr);
    EXPECT_TRUE(state->smart_stale);
    EXPECT_EQ(*state->smart, cached);
}

TEST_F(DeviceStateStoreTest, SeedEndurance_AppliedOnLaterAdd) {
    EnduranceRecord record{4096, util::from_unix_seconds(1000), 8};
    store.seed_endurance({{"sdd", record}});
    store.on_hotplug(HotplugEvent::Add, MakeIdentity("sdd"));

    auto state = *store.get_snapshot("sdd");
    ASSERT_TRUE(state->endurance.has_value());
    EXPECT_EQ(*state->endurance, record);

    ASSERT_TRUE(store.merge("sdd", IoReading{Counters(2000, 16)}).has_value());
    EXPECT_EQ((*store.get_snapshot("sdd"))->endurance->bytes_written, 4096u + 8 * 512);
}

TEST_F(DeviceStateStoreTest, ApplyAliases_ChangesDisplayName) {
    store.apply_aliases({{"sda", "system"}});
    EXPECT_EQ((*store.get_snapshot("sda"))->display_name(), "system");

    store.on_hotplug(HotplugEvent::Add, MakeIdentity("sdb"));
    EXPECT_EQ((*store.get_snapshot("sdb"))->display_name(), "sdb");

    store.apply_aliases({});
    EXPECT_EQ((*store.get_snapshot("sda"))->display_name(), "sda");
}

TEST_F(DeviceStateStoreTest, MergeHost_ReplacesDomainAndClearsStale) {
    store.mark_host_stale(Domain::Volume);
    EXPECT_TRUE(store.host_snapshot()->volumes_stale);

    VolumeStatus md0;
    md0.name = "md0";
    md0.kind = "md";
    md0.health = VolumeHealth::Degraded;
    store.merge_host(VolumeReading{{md0}});

    auto host = store.host_snapshot();
    ASSERT_EQ(host->volumes.size(), 1u);
    EXPECT_EQ(host->volumes[0].health, VolumeHealth::Degraded);
    EXPECT_FALSE(host->volumes_stale);
}

// Test: concurrent merges of one device are serialized, none is lost
TEST_F(DeviceStateStoreTest, Merge_ConcurrentWritersSerialized) {
    std::atomic<int> commits{0};
    store.set_commit_listener([&commits](const DeviceState&, Domain) { ++commits; });

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([this, t] {
            for (int i = 0; i < 50; ++i) {
                if (t % 2 == 0) {
                    EXPECT_TRUE(store.merge("sda", SmartReading{MakeSnapshot()}).has_value());
                } else {
                    EXPECT_TRUE(store.merge("sda", IoReading{Counters(1000 + i, 8 * i)}).has_value());
                }
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_EQ(commits.load(), 200);
    auto state = *store.get_snapshot("sda");
    EXPECT_NE(state->smart, nullptr);
    EXPECT_TRUE(state->io.has_value());
}
