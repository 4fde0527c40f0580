/**
 * @file SelfTestSchedulerTest.cpp
 * @brief Unit tests for SelfTestScheduler start, tracking and waiting
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockReadingProvider.hpp"
#include "services/SelfTestScheduler.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace std::chrono_literals;
using testdata::MakeIdentity;
using testing::_;
using testing::Return;

class SelfTestSchedulerTest : public TempDirFixture {
protected:
    std::shared_ptr<MockReadingProvider> provider;
    std::shared_ptr<DeviceStateStore> store;
    std::unique_ptr<SelfTestScheduler> scheduler;

    void SetUp() override {
        TempDirFixture::SetUp();
        provider = MockReadingProvider::CreateNiceMock();
        store = std::make_shared<DeviceStateStore>();
        store->on_hotplug(HotplugEvent::Add, MakeIdentity("sda"));
        scheduler = std::make_unique<SelfTestScheduler>(provider, store, MakeConfigStore(), 5ms);
    }

    void TearDown() override {
        scheduler.reset();
        TempDirFixture::TearDown();
    }

    static auto Reading(SelfTestState state, std::optional<int> remaining = std::nullopt)
        -> util::Result<SelfTestReading> {
        SelfTestReading reading;
        reading.status.state = state;
        reading.status.percent_remaining = remaining;
        return reading;
    }
};

// ============================================================================
// Scheduling
// ============================================================================

TEST_F(SelfTestSchedulerTest, Schedule_StartsTestAndReportsRunning) {
    EXPECT_CALL(*provider, start_self_test(_, SelfTestType::Long)).Times(1);

    auto status = scheduler->schedule("sda", SelfTestType::Long);

    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, SelfTestState::Running);
    EXPECT_EQ(status->type, SelfTestType::Long);
    EXPECT_TRUE(scheduler->is_tracking("sda"));
    EXPECT_EQ(scheduler->status("sda")->state, SelfTestState::Running);
}

TEST_F(SelfTestSchedulerTest, Schedule_UnknownDeviceIsNotFound) {
    EXPECT_CALL(*provider, start_self_test(_, _)).Times(0);

    auto status = scheduler->schedule("sdz", SelfTestType::Short);

    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().kind, util::ErrorKind::NotFound);
}

TEST_F(SelfTestSchedulerTest, Schedule_SecondTestWhileTrackingRejected) {
    ASSERT_TRUE(scheduler->schedule("sda", SelfTestType::Short).has_value());

    auto again = scheduler->schedule("sda", SelfTestType::Long);

    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().kind, util::ErrorKind::InvalidArgument);
}

TEST_F(SelfTestSchedulerTest, Schedule_ProviderRefusalPropagates) {
    ON_CALL(*provider, start_self_test(_, _))
        .WillByDefault(Return(util::Result<void>(
            util::fail(util::ErrorKind::ProviderUnavailable, "device does not support self-tests"))));

    auto status = scheduler->schedule("sda", SelfTestType::Short);

    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().kind, util::ErrorKind::ProviderUnavailable);
    EXPECT_FALSE(scheduler->is_tracking("sda"));
}

// Test: a refused start frees the device for the next request
TEST_F(SelfTestSchedulerTest, Schedule_RefusalReleasesReservation) {
    EXPECT_CALL(*provider, start_self_test(_, _))
        .WillOnce(Return(util::Result<void>(
            util::fail(util::ErrorKind::TransientFetchError, "device busy"))))
        .WillOnce(Return(util::Result<void>()));

    ASSERT_FALSE(scheduler->schedule("sda", SelfTestType::Short).has_value());
    EXPECT_FALSE(scheduler->is_tracking("sda"));

    EXPECT_TRUE(scheduler->schedule("sda", SelfTestType::Short).has_value());
}

// Test: two concurrent requests for one device start a single test
TEST_F(SelfTestSchedulerTest, Schedule_ConcurrentRequestsStartOnce) {
    EXPECT_CALL(*provider, start_self_test(_, _))
        .Times(1)
        .WillOnce([](const DeviceIdentity&, SelfTestType) {
            std::this_thread::sleep_for(50ms);
            return util::Result<void>();
        });

    std::promise<void> go;
    std::shared_future<void> gate = go.get_future().share();
    auto request = [this, gate](SelfTestType type) {
        gate.wait();
        return scheduler->schedule("sda", type);
    };
    auto first = std::async(std::launch::async, request, SelfTestType::Short);
    auto second = std::async(std::launch::async, request, SelfTestType::Long);
    go.set_value();

    auto a = first.get();
    auto b = second.get();

    EXPECT_NE(a.has_value(), b.has_value());
    const auto& rejected = a.has_value() ? b : a;
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().kind, util::ErrorKind::InvalidArgument);
    EXPECT_TRUE(scheduler->is_tracking("sda"));
}

// Test: a new test is polled right away, not after a full tracking interval
TEST_F(SelfTestSchedulerTest, Schedule_WakesTrackerImmediately) {
    auto slow = std::make_unique<SelfTestScheduler>(provider, store, MakeConfigStore(), 1h);
    std::atomic<int> polls{0};
    ON_CALL(*provider, fetch_self_test(_, _))
        .WillByDefault([&polls](const DeviceIdentity&, const FetchContext&) {
            ++polls;
            return Reading(SelfTestState::Running, 90);
        });
    slow->start();

    ASSERT_TRUE(slow->schedule("sda", SelfTestType::Short).has_value());

    EXPECT_TRUE(ThreadingTestHelper::WaitUntil([&polls] { return polls.load() > 0; }, 2s));
    slow->stop();
}

// ============================================================================
// Tracking
// ============================================================================

TEST_F(SelfTestSchedulerTest, PollOnce_TerminalStateEndsTracking) {
    ASSERT_TRUE(scheduler->schedule("sda", SelfTestType::Short).has_value());
    SelfTestReading done;
    done.status.state = SelfTestState::CompletedPass;
    done.log = std::vector<SelfTestEntry>{{SelfTestType::Short, "Completed without error", 1000, true}};
    ON_CALL(*provider, fetch_self_test(_, _))
        .WillByDefault(Return(util::Result<SelfTestReading>(done)));

    scheduler->poll_once();

    EXPECT_FALSE(scheduler->is_tracking("sda"));
    auto status = scheduler->status("sda");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, SelfTestState::CompletedPass);
    EXPECT_EQ(status->type, SelfTestType::Short);
    ASSERT_EQ(scheduler->log("sda")->size(), 1u);
    EXPECT_TRUE((*scheduler->log("sda"))[0].passed);
}

TEST_F(SelfTestSchedulerTest, PollOnce_ProgressKeepsTracking) {
    ASSERT_TRUE(scheduler->schedule("sda", SelfTestType::Long).has_value());
    ON_CALL(*provider, fetch_self_test(_, _))
        .WillByDefault(Return(Reading(SelfTestState::Running, 40)));

    scheduler->poll_once();

    EXPECT_TRUE(scheduler->is_tracking("sda"));
    EXPECT_EQ(scheduler->status("sda")->percent_remaining, 40);
}

// Test: an idle drive without a verdict is still treated as testing
TEST_F(SelfTestSchedulerTest, PollOnce_IdleWithoutVerdictStaysRunning) {
    ASSERT_TRUE(scheduler->schedule("sda", SelfTestType::Short).has_value());
    ON_CALL(*provider, fetch_self_test(_, _)).WillByDefault(Return(Reading(SelfTestState::Idle)));

    scheduler->poll_once();

    EXPECT_TRUE(scheduler->is_tracking("sda"));
    EXPECT_EQ(scheduler->status("sda")->state, SelfTestState::Running);
}

TEST_F(SelfTestSchedulerTest, PollOnce_FetchErrorMarksStale) {
    ASSERT_TRUE(scheduler->schedule("sda", SelfTestType::Short).has_value());
    ON_CALL(*provider, fetch_self_test(_, _))
        .WillByDefault(Return(util::Result<SelfTestReading>(
            util::fail(util::ErrorKind::TransientFetchError, "ioctl failed"))));

    scheduler->poll_once();

    EXPECT_TRUE(scheduler->is_tracking("sda"));
    EXPECT_TRUE((*store->get_snapshot("sda"))->self_test_stale);
    EXPECT_EQ(scheduler->status("sda")->state, SelfTestState::Running);
}

TEST_F(SelfTestSchedulerTest, PollOnce_RemovedDeviceDropsTracking) {
    ASSERT_TRUE(scheduler->schedule("sda", SelfTestType::Short).has_value());
    store->on_hotplug(HotplugEvent::Remove, MakeIdentity("sda"));

    scheduler->poll_once();

    EXPECT_FALSE(scheduler->is_tracking("sda"));
}

// ============================================================================
// Waiting
// ============================================================================

TEST_F(SelfTestSchedulerTest, ScheduleAndWait_ReturnsVerdict) {
    ON_CALL(*provider, fetch_self_test(_, _))
        .WillByDefault(Return(Reading(SelfTestState::CompletedFail)));
    scheduler->start();

    auto status = scheduler->schedule_and_wait("sda", SelfTestType::Short, 5s);

    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, SelfTestState::CompletedFail);
}

// Test: hitting the wait timeout is not an error and tracking continues
TEST_F(SelfTestSchedulerTest, ScheduleAndWait_TimeoutReturnsRunning) {
    scheduler->start();

    const auto started = std::chrono::steady_clock::now();
    auto status = scheduler->schedule_and_wait("sda", SelfTestType::Long, 50ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, SelfTestState::Running);
    EXPECT_GE(elapsed, 50ms);
    EXPECT_TRUE(scheduler->is_tracking("sda"));
}

TEST_F(SelfTestSchedulerTest, Stop_ReleasesWaiter) {
    auto waiter = std::async(std::launch::async, [this] {
        return scheduler->schedule_and_wait("sda", SelfTestType::Long, 60s);
    });
    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([this] { return scheduler->is_tracking("sda"); }));

    scheduler->stop();

    ASSERT_EQ(waiter.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(waiter.get().has_value());
}
