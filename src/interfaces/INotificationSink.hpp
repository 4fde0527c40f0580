/**
 * @file INotificationSink.hpp
 * @brief Receiver of alert-fired events
 */

#pragma once

#include "models/Alert.hpp"

class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    /**
     * @brief Queue an event; must not block on delivery
     */
    virtual void submit(AlertEvent event) = 0;
};
