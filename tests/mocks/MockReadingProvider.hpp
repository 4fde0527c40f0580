/**
 * @file MockReadingProvider.hpp
 * @brief Google Mock implementation of IReadingProvider
 */

#pragma once

#include "interfaces/IReadingProvider.hpp"

#include <gmock/gmock.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

class MockReadingProvider : public IReadingProvider {
public:
    MOCK_METHOD((util::Result<std::vector<DeviceIdentity>>), list_devices,
                (const FetchContext& ctx), (override));
    MOCK_METHOD((util::Result<SmartSnapshot>), fetch_smart,
                (const DeviceIdentity& device, const FetchContext& ctx), (override));
    MOCK_METHOD((util::Result<std::map<std::string, IoCounters>>), fetch_io_counters,
                (const FetchContext& ctx), (override));
    MOCK_METHOD((util::Result<std::vector<FilesystemUsage>>), fetch_filesystems,
                (const FetchContext& ctx), (override));
    MOCK_METHOD((util::Result<std::vector<NfsMountStats>>), fetch_nfs, (const FetchContext& ctx),
                (override));
    MOCK_METHOD((util::Result<std::vector<VolumeStatus>>), fetch_volumes,
                (const FetchContext& ctx), (override));
    MOCK_METHOD((util::Result<void>), start_self_test,
                (const DeviceIdentity& device, SelfTestType type), (override));
    MOCK_METHOD((util::Result<SelfTestReading>), fetch_self_test,
                (const DeviceIdentity& device, const FetchContext& ctx), (override));

    // Helper: Create a nice mock that reports `devices` and empty host readings
    static std::shared_ptr<MockReadingProvider> CreateNiceMock(
        const std::vector<DeviceIdentity>& devices = {}) {
        auto mock = std::make_shared<testing::NiceMock<MockReadingProvider>>();

        ON_CALL(*mock, list_devices(testing::_))
            .WillByDefault(testing::Return(util::Result<std::vector<DeviceIdentity>>(devices)));

        // Default: SMART unavailable until a test says otherwise
        ON_CALL(*mock, fetch_smart(testing::_, testing::_))
            .WillByDefault(testing::Return(util::Result<SmartSnapshot>(
                util::fail(util::ErrorKind::ProviderUnavailable, "no SMART in tests"))));

        ON_CALL(*mock, fetch_io_counters(testing::_))
            .WillByDefault(
                testing::Return(util::Result<std::map<std::string, IoCounters>>(
                    std::map<std::string, IoCounters>{})));
        ON_CALL(*mock, fetch_filesystems(testing::_))
            .WillByDefault(testing::Return(
                util::Result<std::vector<FilesystemUsage>>(std::vector<FilesystemUsage>{})));
        ON_CALL(*mock, fetch_nfs(testing::_))
            .WillByDefault(testing::Return(
                util::Result<std::vector<NfsMountStats>>(std::vector<NfsMountStats>{})));
        ON_CALL(*mock, fetch_volumes(testing::_))
            .WillByDefault(testing::Return(
                util::Result<std::vector<VolumeStatus>>(std::vector<VolumeStatus>{})));

        ON_CALL(*mock, start_self_test(testing::_, testing::_))
            .WillByDefault(testing::Return(util::Result<void>{}));

        // Default: test still running with 90% remaining
        SelfTestReading running;
        running.status.state = SelfTestState::Running;
        running.status.percent_remaining = 90;
        ON_CALL(*mock, fetch_self_test(testing::_, testing::_))
            .WillByDefault(testing::Return(util::Result<SelfTestReading>(running)));

        return mock;
    }
};
