/**
 * @file SmartIoctlTest.cpp
 * @brief Unit tests for the ATA and NVMe SMART decoders on crafted buffers
 */

#include <gtest/gtest.h>

#include "providers/SmartIoctl.hpp"

namespace {

using NvmeSmartLog = std::array<uint8_t, SmartIoctl::NVME_SMART_LOG_SIZE>;
using NvmeSelfTestLog = std::array<uint8_t, SmartIoctl::NVME_SELF_TEST_LOG_SIZE>;

void PutLe(uint8_t* at, uint64_t value, size_t bytes) {
    for (size_t i = 0; i < bytes; ++i) {
        at[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

// Attribute table entry `slot` of a SMART data sector
void PutAttribute(SmartIoctl::Sector& data, size_t slot, uint8_t id, bool prefail, uint8_t value,
                  uint8_t worst, uint64_t raw) {
    uint8_t* entry = &data[2 + slot * 12];
    entry[0] = id;
    entry[1] = prefail ? 0x03 : 0x02;
    entry[3] = value;
    entry[4] = worst;
    PutLe(entry + 5, raw, 6);
}

void PutThreshold(SmartIoctl::Sector& thresholds, size_t slot, uint8_t id, uint8_t limit) {
    thresholds[2 + slot * 12] = id;
    thresholds[2 + slot * 12 + 1] = limit;
}

// NVMe self-test log with every result slot unused
auto EmptyNvmeSelfTestLog() -> NvmeSelfTestLog {
    NvmeSelfTestLog log{};
    for (size_t i = 0; i < 20; ++i) {
        log[4 + i * 28] = 0x0F;
    }
    return log;
}

}  // namespace

// ============================================================================
// ATA attributes
// ============================================================================

TEST(SmartIoctlAtaTest, ParseAttributes_DecodesTableAndThresholds) {
    SmartIoctl::Sector data{};
    SmartIoctl::Sector thresholds{};
    PutAttribute(data, 0, smart::REALLOCATED_SECTORS, true, 100, 99, 12);
    PutAttribute(data, 1, smart::POWER_ON_HOURS, false, 95, 95, 20123);
    PutAttribute(data, 2, smart::TEMPERATURE, false, 64, 40, 0x0000'1E00'0024);  // packed min/max
    PutThreshold(thresholds, 0, smart::REALLOCATED_SECTORS, 36);

    auto attributes = SmartIoctl::parse_ata_attributes(data, thresholds);

    ASSERT_EQ(attributes.size(), 3u);
    const auto& realloc = attributes.at(smart::REALLOCATED_SECTORS);
    EXPECT_TRUE(realloc.prefail);
    EXPECT_EQ(realloc.value, 100u);
    EXPECT_EQ(realloc.worst, 99u);
    EXPECT_EQ(realloc.threshold, 36u);
    EXPECT_EQ(realloc.raw_value, 12u);
    EXPECT_EQ(realloc.name, "Reallocated_Sector_Ct");

    const auto& hours = attributes.at(smart::POWER_ON_HOURS);
    EXPECT_FALSE(hours.prefail);
    EXPECT_EQ(hours.threshold, 0u);
    EXPECT_EQ(hours.raw_value, 20123u);

    EXPECT_EQ(attributes.at(smart::TEMPERATURE).raw_value, 0x0000'1E00'0024u);
}

TEST(SmartIoctlAtaTest, ParseAttributes_EmptySectorYieldsNothing) {
    SmartIoctl::Sector data{};
    SmartIoctl::Sector thresholds{};
    EXPECT_TRUE(SmartIoctl::parse_ata_attributes(data, thresholds).empty());
}

// ============================================================================
// ATA self-tests
// ============================================================================

TEST(SmartIoctlAtaTest, ParseProgress_MapsStatusNibble) {
    EXPECT_EQ(SmartIoctl::parse_ata_progress(0x00).state, SelfTestState::CompletedPass);
    EXPECT_EQ(SmartIoctl::parse_ata_progress(0x10).state, SelfTestState::Aborted);
    EXPECT_EQ(SmartIoctl::parse_ata_progress(0x20).state, SelfTestState::Aborted);
    EXPECT_EQ(SmartIoctl::parse_ata_progress(0x70).state, SelfTestState::CompletedFail);

    auto running = SmartIoctl::parse_ata_progress(0xF3);
    EXPECT_EQ(running.state, SelfTestState::Running);
    EXPECT_EQ(running.percent_remaining, 30);
}

// Test: ring descriptors are returned oldest first starting after the newest index
TEST(SmartIoctlAtaTest, ParseSelfTestLog_OrdersRingOldestFirst) {
    SmartIoctl::Sector log{};
    auto put = [&log](size_t index, uint8_t test, uint8_t status, uint16_t hours) {
        uint8_t* descriptor = &log[2 + index * 24];
        descriptor[0] = test;
        descriptor[1] = static_cast<uint8_t>(status << 4);
        PutLe(descriptor + 2, hours, 2);
    };
    put(0, 0x01, 0x0, 1000);
    put(1, 0x02, 0x7, 1100);
    log[508] = 2;

    auto entries = SmartIoctl::parse_ata_self_test_log(log);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].type, SelfTestType::Short);
    EXPECT_TRUE(entries[0].passed);
    EXPECT_EQ(entries[0].lifetime_hours, 1000u);
    EXPECT_EQ(entries[0].status, "Completed without error");
    EXPECT_EQ(entries[1].type, SelfTestType::Long);
    EXPECT_FALSE(entries[1].passed);
    EXPECT_EQ(entries[1].status, "Completed: read failure");
}

TEST(SmartIoctlAtaTest, ParseSelfTestLog_InvalidIndexIsEmpty) {
    SmartIoctl::Sector log{};
    log[2] = 0x01;
    log[508] = 0;
    EXPECT_TRUE(SmartIoctl::parse_ata_self_test_log(log).empty());
    log[508] = 22;
    EXPECT_TRUE(SmartIoctl::parse_ata_self_test_log(log).empty());
}

TEST(SmartIoctlAtaTest, StatusText_ReservedValues) {
    EXPECT_EQ(SmartIoctl::ata_status_text(0x1), "Aborted by host");
    EXPECT_EQ(SmartIoctl::ata_status_text(0xF), "Self-test routine in progress");
    EXPECT_EQ(SmartIoctl::ata_status_text(0xA), "Reserved status 0xa");
}

// ============================================================================
// NVMe
// ============================================================================

TEST(SmartIoctlNvmeTest, ParseSmartLog_DecodesHealthFields) {
    NvmeSmartLog log{};
    log[0] = 0x04;
    PutLe(&log[1], 273 + 41, 2);
    log[3] = 100;
    log[4] = 10;
    log[5] = 7;
    PutLe(&log[48], 123456789, 8);
    PutLe(&log[128], 8760, 8);
    PutLe(&log[160], 2, 8);

    auto snapshot = SmartIoctl::parse_nvme_smart_log(log);

    EXPECT_EQ(snapshot.temperature_celsius, 41);
    EXPECT_EQ(snapshot.power_on_hours, 8760u);
    ASSERT_TRUE(snapshot.nvme.has_value());
    EXPECT_EQ(snapshot.nvme->critical_warning, 0x04u);
    EXPECT_EQ(snapshot.nvme->available_spare, 100u);
    EXPECT_EQ(snapshot.nvme->spare_threshold, 10u);
    EXPECT_EQ(snapshot.nvme->percentage_used, 7u);
    EXPECT_EQ(snapshot.nvme->data_units_written, 123456789u);
    EXPECT_EQ(snapshot.nvme->media_errors, 2u);
}

TEST(SmartIoctlNvmeTest, ParseSmartLog_ImplausibleTemperatureIgnored) {
    NvmeSmartLog log{};
    auto snapshot = SmartIoctl::parse_nvme_smart_log(log);
    EXPECT_FALSE(snapshot.temperature_celsius.has_value());
}

TEST(SmartIoctlNvmeTest, ParseSelfTestLog_RunningTest) {
    auto log = EmptyNvmeSelfTestLog();
    log[0] = 0x2;
    log[1] = 25;

    auto reading = SmartIoctl::parse_nvme_self_test_log(log);

    EXPECT_EQ(reading.status.state, SelfTestState::Running);
    EXPECT_EQ(reading.status.type, SelfTestType::Long);
    EXPECT_EQ(reading.status.percent_remaining, 75);
    ASSERT_TRUE(reading.log.has_value());
    EXPECT_TRUE(reading.log->empty());
}

// Test: with no test running the state comes from the newest stored result
TEST(SmartIoctlNvmeTest, ParseSelfTestLog_StateFromNewestResult) {
    auto log = EmptyNvmeSelfTestLog();
    log[4] = 0x27;  // newest: extended, failed segment
    PutLe(&log[4 + 4], 900, 8);
    log[4 + 28] = 0x10;  // older: short, passed
    PutLe(&log[4 + 28 + 4], 800, 8);

    auto reading = SmartIoctl::parse_nvme_self_test_log(log);

    EXPECT_EQ(reading.status.state, SelfTestState::CompletedFail);
    ASSERT_TRUE(reading.log.has_value());
    ASSERT_EQ(reading.log->size(), 2u);
    EXPECT_EQ((*reading.log)[0].lifetime_hours, 800u);
    EXPECT_TRUE((*reading.log)[0].passed);
    EXPECT_EQ((*reading.log)[1].type, SelfTestType::Long);
    EXPECT_FALSE((*reading.log)[1].passed);
}

TEST(SmartIoctlNvmeTest, ParseSelfTestLog_NoHistoryIsIdle) {
    auto reading = SmartIoctl::parse_nvme_self_test_log(EmptyNvmeSelfTestLog());
    EXPECT_EQ(reading.status.state, SelfTestState::Idle);
}

// ============================================================================
// Device access
// ============================================================================

TEST(SmartIoctlDeviceTest, ReadAta_MissingNodeFails) {
    SmartIoctl ioctl;
    auto result = ioctl.read_ata("/nonexistent/drivewatch-sdz");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::NotFound);
}
