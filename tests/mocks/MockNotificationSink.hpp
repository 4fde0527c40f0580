/**
 * @file MockNotificationSink.hpp
 * @brief Google Mock implementation of INotificationSink
 */

#pragma once

#include "interfaces/INotificationSink.hpp"

#include <gmock/gmock.h>

#include <memory>
#include <mutex>
#include <vector>

class MockNotificationSink : public INotificationSink {
public:
    MOCK_METHOD(void, submit, (AlertEvent event), (override));

    // Helper: Create a nice mock that records every submitted event
    static std::shared_ptr<MockNotificationSink> CreateNiceMock() {
        auto mock = std::make_shared<testing::NiceMock<MockNotificationSink>>();
        auto* raw = mock.get();
        ON_CALL(*mock, submit(testing::_)).WillByDefault([raw](AlertEvent event) {
            std::lock_guard lock(raw->mutex);
            raw->events.push_back(std::move(event));
        });
        return mock;
    }

    std::vector<AlertEvent> Events() {
        std::lock_guard lock(mutex);
        return events;
    }

    std::mutex mutex;
    std::vector<AlertEvent> events;
};
