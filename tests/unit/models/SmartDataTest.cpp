/**
 * @file SmartDataTest.cpp
 * @brief Unit tests for SMART snapshot helpers and I/O rate derivation
 */

#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "models/DeviceState.hpp"
#include "models/SmartData.hpp"

using testdata::MakeAttribute;
using testdata::MakeSnapshot;

TEST(SmartAttributeTest, AtRisk_OnlyPrefailWithinMargin) {
    EXPECT_TRUE(MakeAttribute(5, 0, 46, 36, true).is_at_risk());
    EXPECT_FALSE(MakeAttribute(5, 0, 47, 36, true).is_at_risk());
    EXPECT_FALSE(MakeAttribute(5, 0, 40, 36, false).is_at_risk());
    EXPECT_FALSE(MakeAttribute(5, 0, 5, 0, true).is_at_risk());
}

TEST(SmartAttributeTest, Failing_AtOrBelowThreshold) {
    EXPECT_TRUE(MakeAttribute(5, 0, 36, 36).is_failing());
    EXPECT_FALSE(MakeAttribute(5, 0, 37, 36).is_failing());
    EXPECT_FALSE(MakeAttribute(194, 40, 0, 0).is_failing());
}

TEST(SmartSnapshotTest, DeriveStatus_AtRiskAttributeDowngradesPassed) {
    auto snapshot = MakeSnapshot();
    snapshot.attributes[smart::REALLOCATED_SECTORS].value = 40;

    snapshot.derive_status();
    EXPECT_EQ(snapshot.status, SmartStatus::Warning);
}

TEST(SmartSnapshotTest, DeriveStatus_NeverChangesFailed) {
    auto snapshot = MakeSnapshot();
    snapshot.status = SmartStatus::Failed;
    snapshot.attributes[smart::REALLOCATED_SECTORS].value = 40;

    snapshot.derive_status();
    EXPECT_EQ(snapshot.status, SmartStatus::Failed);
}

TEST(SmartSnapshotTest, DeriveStatus_NvmeMediaErrorsWarn) {
    auto snapshot = testdata::MakeNvmeSnapshot(3, 2);
    snapshot.derive_status();
    EXPECT_EQ(snapshot.status, SmartStatus::Warning);
}

// Test: NVMe media errors are reachable through the sentinel id
TEST(SmartSnapshotTest, RawOr_NvmeSentinel) {
    auto snapshot = testdata::MakeNvmeSnapshot(3, 7);
    EXPECT_EQ(snapshot.raw_or(smart::NVME_MEDIA_ERRORS, 0), 7u);
    EXPECT_EQ(snapshot.raw_or(smart::REALLOCATED_SECTORS, 42), 42u);
}

class IoRatesTest : public ::testing::Test {
protected:
    IoCounters prev;
    IoCounters next;

    void SetUp() override {
        prev.captured_at = util::from_unix_seconds(1000);
        prev.reads_completed = 100;
        prev.sectors_read = 1000;
        prev.read_time_ms = 500;
        prev.writes_completed = 50;
        prev.sectors_written = 2000;
        prev.write_time_ms = 100;
        prev.io_time_ms = 10'000;

        next = prev;
        next.captured_at = util::from_unix_seconds(1002);
    }
};

TEST_F(IoRatesTest, Between_ComputesRatesAndLatency) {
    next.reads_completed += 20;
    next.sectors_read += 2048;
    next.read_time_ms += 100;
    next.io_time_ms += 1000;

    auto rates = IoRates::between(prev, next);
    ASSERT_TRUE(rates.has_value());
    EXPECT_DOUBLE_EQ(rates->read_bytes_per_sec, 2048.0 * 512 / 2);
    EXPECT_DOUBLE_EQ(rates->read_iops, 10.0);
    EXPECT_DOUBLE_EQ(rates->util_pct, 50.0);
    EXPECT_DOUBLE_EQ(rates->avg_read_latency_ms, 5.0);
    EXPECT_DOUBLE_EQ(rates->avg_write_latency_ms, 0.0);
}

TEST_F(IoRatesTest, Between_CounterResetYieldsNothing) {
    next.reads_completed = 5;
    EXPECT_FALSE(IoRates::between(prev, next).has_value());
}

TEST_F(IoRatesTest, Between_SameTimestampYieldsNothing) {
    next.captured_at = prev.captured_at;
    EXPECT_FALSE(IoRates::between(prev, next).has_value());
}

TEST_F(IoRatesTest, Between_UtilisationCappedAt100) {
    next.io_time_ms += 5000;
    auto rates = IoRates::between(prev, next);
    ASSERT_TRUE(rates.has_value());
    EXPECT_DOUBLE_EQ(rates->util_pct, 100.0);
}

TEST(HealthBandTest, Band_Boundaries) {
    EXPECT_EQ(health_band(100), HealthBand::Good);
    EXPECT_EQ(health_band(80), HealthBand::Good);
    EXPECT_EQ(health_band(79), HealthBand::Warn);
    EXPECT_EQ(health_band(50), HealthBand::Warn);
    EXPECT_EQ(health_band(49), HealthBand::Crit);
}
