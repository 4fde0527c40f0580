/**
 * @file Health.cpp
 * @brief Health record helpers
 */

#include "models/Health.hpp"

auto to_string(AnomalyKind kind) -> std::string_view {
    switch (kind) {
        case AnomalyKind::FirstSeen:
            return "first-seen";
        case AnomalyKind::Jump:
            return "jump";
        case AnomalyKind::OutOfBand:
            return "out-of-band";
    }
    return "first-seen";
}

auto anomaly_kind_from_string(std::string_view text) -> AnomalyKind {
    if (text == "jump") {
        return AnomalyKind::Jump;
    }
    if (text == "out-of-band") {
        return AnomalyKind::OutOfBand;
    }
    return AnomalyKind::FirstSeen;
}
