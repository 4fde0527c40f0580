/**
 * @file JsonCodec.hpp
 * @brief jsoncpp conversions for persisted files and query results
 *
 * Timestamps are encoded as Unix seconds. Decoders never throw: wrong
 * types fall back to defaults, and a record missing a required field is
 * reported as InvalidArgument so the caller can skip it.
 */

#pragma once

#include <json/json.h>

#include <string>
#include <string_view>

#include "models/Alert.hpp"
#include "models/DeviceState.hpp"
#include "models/Health.hpp"
#include "models/HostState.hpp"
#include "models/SmartData.hpp"
#include "util/Result.hpp"

namespace codec {

/**
 * @brief Serialize without whitespace (one record per line files)
 */
[[nodiscard]] auto write_compact(const Json::Value& value) -> std::string;

/**
 * @brief Serialize with indentation (whole-file JSON documents)
 */
[[nodiscard]] auto write_pretty(const Json::Value& value) -> std::string;

[[nodiscard]] auto parse(std::string_view text) -> util::Result<Json::Value>;

// Field helpers tolerant to missing keys and wrong types
[[nodiscard]] auto get_string(const Json::Value& obj, const char* key,
                              const std::string& fallback = {}) -> std::string;
[[nodiscard]] auto get_u64(const Json::Value& obj, const char* key, uint64_t fallback = 0)
    -> uint64_t;
[[nodiscard]] auto get_i64(const Json::Value& obj, const char* key, int64_t fallback = 0)
    -> int64_t;
[[nodiscard]] auto get_double(const Json::Value& obj, const char* key, double fallback = 0.0)
    -> double;
[[nodiscard]] auto get_bool(const Json::Value& obj, const char* key, bool fallback = false)
    -> bool;
[[nodiscard]] auto get_time(const Json::Value& obj, const char* key) -> util::TimePoint;

[[nodiscard]] auto to_json(util::TimePoint tp) -> Json::Value;

[[nodiscard]] auto to_json(const DeviceIdentity& identity) -> Json::Value;
[[nodiscard]] auto identity_from_json(const Json::Value& value) -> util::Result<DeviceIdentity>;

[[nodiscard]] auto to_json(const SmartSnapshot& snapshot) -> Json::Value;
[[nodiscard]] auto snapshot_from_json(const Json::Value& value) -> util::Result<SmartSnapshot>;

[[nodiscard]] auto to_json(const Alert& alert) -> Json::Value;
[[nodiscard]] auto alert_from_json(const Json::Value& value) -> util::Result<Alert>;

[[nodiscard]] auto to_json(const AnomalyRecord& record) -> Json::Value;
[[nodiscard]] auto anomaly_from_json(const Json::Value& value) -> util::Result<AnomalyRecord>;

[[nodiscard]] auto to_json(const Baseline& baseline) -> Json::Value;
[[nodiscard]] auto baseline_from_json(const Json::Value& value) -> util::Result<Baseline>;

[[nodiscard]] auto to_json(const HealthHistoryPoint& point) -> Json::Value;

[[nodiscard]] auto to_json(const EnduranceRecord& record) -> Json::Value;
[[nodiscard]] auto endurance_from_json(const Json::Value& value) -> EnduranceRecord;

[[nodiscard]] auto to_json(const SelfTestStatus& status) -> Json::Value;
[[nodiscard]] auto to_json(const SelfTestEntry& entry) -> Json::Value;

// Query results only
[[nodiscard]] auto to_json(const DeviceState& state) -> Json::Value;
[[nodiscard]] auto to_json(const HostState& host) -> Json::Value;
[[nodiscard]] auto to_json(const BaselineDiff& diff) -> Json::Value;

}  // namespace codec
