/**
 * @file JsonCodec.cpp
 * @brief jsoncpp conversions
 */

#include "models/JsonCodec.hpp"

#include <format>
#include <memory>

namespace codec {

namespace {

auto invalid(std::string message) -> std::unexpected<util::Error> {
    return util::fail(util::ErrorKind::InvalidArgument, std::move(message));
}

auto optional_u64(const Json::Value& obj, const char* key) -> std::optional<uint64_t> {
    const auto& field = obj[key];
    if (field.isUInt64()) {
        return field.asUInt64();
    }
    return std::nullopt;
}

}  // namespace

auto write_compact(const Json::Value& value) -> std::string {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

auto write_pretty(const Json::Value& value) -> std::string {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value) + "\n";
}

auto parse(std::string_view text) -> util::Result<Json::Value> {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return invalid(std::format("malformed JSON: {}", errors));
    }
    return root;
}

auto get_string(const Json::Value& obj, const char* key, const std::string& fallback)
    -> std::string {
    const auto& field = obj[key];
    return field.isString() ? field.asString() : fallback;
}

auto get_u64(const Json::Value& obj, const char* key, uint64_t fallback) -> uint64_t {
    const auto& field = obj[key];
    return field.isUInt64() ? field.asUInt64() : fallback;
}

auto get_i64(const Json::Value& obj, const char* key, int64_t fallback) -> int64_t {
    const auto& field = obj[key];
    return field.isInt64() ? field.asInt64() : fallback;
}

auto get_double(const Json::Value& obj, const char* key, double fallback) -> double {
    const auto& field = obj[key];
    return field.isNumeric() ? field.asDouble() : fallback;
}

auto get_bool(const Json::Value& obj, const char* key, bool fallback) -> bool {
    const auto& field = obj[key];
    return field.isBool() ? field.asBool() : fallback;
}

auto get_time(const Json::Value& obj, const char* key) -> util::TimePoint {
    return util::from_unix_seconds(get_i64(obj, key, 0));
}

auto to_json(util::TimePoint tp) -> Json::Value {
    return static_cast<Json::Int64>(util::to_unix_seconds(tp));
}

// Identity

auto to_json(const DeviceIdentity& identity) -> Json::Value {
    Json::Value out;
    out["id"] = identity.id;
    out["kind"] = std::string(to_string(identity.kind));
    out["model"] = identity.model;
    out["serial"] = identity.serial;
    out["transport"] = identity.transport;
    out["capacity_bytes"] = static_cast<Json::UInt64>(identity.capacity_bytes);
    return out;
}

auto identity_from_json(const Json::Value& value) -> util::Result<DeviceIdentity> {
    if (!value.isObject() || get_string(value, "id").empty()) {
        return invalid("device identity without id");
    }
    DeviceIdentity identity;
    identity.id = get_string(value, "id");
    identity.kind = device_kind_from_string(get_string(value, "kind")).value_or(DeviceKind::HDD);
    identity.model = get_string(value, "model");
    identity.serial = get_string(value, "serial");
    identity.transport = get_string(value, "transport");
    identity.capacity_bytes = get_u64(value, "capacity_bytes");
    return identity;
}

// SMART

auto to_json(const SmartSnapshot& snapshot) -> Json::Value {
    Json::Value out;
    out["captured_at"] = to_json(snapshot.captured_at);
    out["status"] = std::string(to_string(snapshot.status));
    if (snapshot.temperature_celsius) {
        out["temperature_c"] = *snapshot.temperature_celsius;
    }
    if (snapshot.power_on_hours) {
        out["power_on_hours"] = static_cast<Json::UInt64>(*snapshot.power_on_hours);
    }

    Json::Value attributes(Json::arrayValue);
    for (const auto& [id, attr] : snapshot.attributes) {
        Json::Value a;
        a["id"] = id;
        a["name"] = attr.name;
        a["value"] = attr.value;
        a["worst"] = attr.worst;
        a["threshold"] = attr.threshold;
        a["prefail"] = attr.prefail;
        a["raw"] = static_cast<Json::UInt64>(attr.raw_value);
        attributes.append(a);
    }
    out["attributes"] = attributes;

    if (snapshot.nvme) {
        const auto& nvme = *snapshot.nvme;
        Json::Value n;
        n["critical_warning"] = nvme.critical_warning;
        n["available_spare"] = nvme.available_spare;
        n["spare_threshold"] = nvme.spare_threshold;
        n["percentage_used"] = nvme.percentage_used;
        n["data_units_written"] = static_cast<Json::UInt64>(nvme.data_units_written);
        n["media_errors"] = static_cast<Json::UInt64>(nvme.media_errors);
        out["nvme"] = n;
    }
    return out;
}

auto snapshot_from_json(const Json::Value& value) -> util::Result<SmartSnapshot> {
    if (!value.isObject()) {
        return invalid("SMART snapshot is not an object");
    }

    SmartSnapshot snapshot;
    snapshot.captured_at = get_time(value, "captured_at");
    snapshot.status = smart_status_from_string(get_string(value, "status"));
    if (value["temperature_c"].isInt()) {
        snapshot.temperature_celsius = value["temperature_c"].asInt();
    }
    snapshot.power_on_hours = optional_u64(value, "power_on_hours");

    for (const auto& a : value["attributes"]) {
        if (!a.isObject() || !a["id"].isUInt()) {
            continue;
        }
        SmartAttribute attr;
        attr.id = a["id"].asUInt();
        attr.name = get_string(a, "name", std::string(smart::attribute_name(attr.id)));
        attr.value = static_cast<uint32_t>(get_u64(a, "value"));
        attr.worst = static_cast<uint32_t>(get_u64(a, "worst"));
        attr.threshold = static_cast<uint32_t>(get_u64(a, "threshold"));
        attr.prefail = get_bool(a, "prefail");
        attr.raw_value = get_u64(a, "raw");
        snapshot.attributes.emplace(attr.id, std::move(attr));
    }

    if (const auto& n = value["nvme"]; n.isObject()) {
        NvmeHealth nvme;
        nvme.critical_warning = static_cast<uint8_t>(get_u64(n, "critical_warning"));
        nvme.available_spare = static_cast<uint32_t>(get_u64(n, "available_spare", 100));
        nvme.spare_threshold = static_cast<uint32_t>(get_u64(n, "spare_threshold", 10));
        nvme.percentage_used = static_cast<uint32_t>(get_u64(n, "percentage_used"));
        nvme.data_units_written = get_u64(n, "data_units_written");
        nvme.media_errors = get_u64(n, "media_errors");
        snapshot.nvme = nvme;
    }
    return snapshot;
}

// Alerts

auto to_json(const Alert& alert) -> Json::Value {
    Json::Value out;
    out["id"] = static_cast<Json::UInt64>(alert.id);
    out["device"] = alert.device;
    out["rule"] = std::string(to_string(alert.rule));
    out["severity"] = std::string(to_string(alert.severity));
    out["message"] = alert.message;
    out["fired_at"] = to_json(alert.fired_at);
    out["last_fired_at"] = to_json(alert.last_fired_at);
    out["cooldown_until"] = to_json(alert.cooldown_until);
    out["acknowledged"] = alert.acknowledged;
    out["resolved"] = alert.resolved;
    if (alert.resolved_at) {
        out["resolved_at"] = to_json(*alert.resolved_at);
    } else {
        out["resolved_at"] = Json::Value(Json::nullValue);
    }
    return out;
}

auto alert_from_json(const Json::Value& value) -> util::Result<Alert> {
    if (!value.isObject()) {
        return invalid("alert record is not an object");
    }
    auto rule = rule_kind_from_string(get_string(value, "rule"));
    auto severity = severity_from_string(get_string(value, "severity"));
    if (!rule || !severity || get_string(value, "device").empty()) {
        return invalid("alert record without device, rule or severity");
    }

    Alert alert;
    alert.id = get_u64(value, "id");
    alert.device = get_string(value, "device");
    alert.rule = *rule;
    alert.severity = *severity;
    alert.message = get_string(value, "message");
    alert.fired_at = get_time(value, "fired_at");
    alert.last_fired_at = get_time(value, "last_fired_at");
    alert.cooldown_until = get_time(value, "cooldown_until");
    alert.acknowledged = get_bool(value, "acknowledged");
    alert.resolved = get_bool(value, "resolved");
    if (value["resolved_at"].isInt64()) {
        alert.resolved_at = get_time(value, "resolved_at");
    }
    return alert;
}

// Anomalies

auto to_json(const AnomalyRecord& record) -> Json::Value {
    Json::Value out;
    out["device"] = record.device;
    out["attr_id"] = record.attr_id;
    out["attr_name"] = record.attr_name;
    out["kind"] = std::string(to_string(record.kind));
    out["first_value"] = static_cast<Json::UInt64>(record.first_value);
    out["last_value"] = static_cast<Json::UInt64>(record.last_value);
    out["expected_low"] = static_cast<Json::UInt64>(record.expected_low);
    out["expected_high"] = static_cast<Json::UInt64>(record.expected_high);
    out["delta"] = static_cast<Json::Int64>(record.delta);
    out["detected_at"] = to_json(record.detected_at);
    return out;
}

auto anomaly_from_json(const Json::Value& value) -> util::Result<AnomalyRecord> {
    if (!value.isObject() || get_string(value, "device").empty() || !value["attr_id"].isUInt()) {
        return invalid("anomaly record without device or attribute");
    }
    AnomalyRecord record;
    record.device = get_string(value, "device");
    record.attr_id = value["attr_id"].asUInt();
    record.attr_name = get_string(value, "attr_name", std::string(smart::attribute_name(record.attr_id)));
    record.kind = anomaly_kind_from_string(get_string(value, "kind"));
    record.first_value = get_u64(value, "first_value");
    record.last_value = get_u64(value, "last_value");
    record.expected_low = get_u64(value, "expected_low");
    record.expected_high = get_u64(value, "expected_high");
    record.delta = get_i64(value, "delta");
    record.detected_at = get_time(value, "detected_at");
    return record;
}

// Baselines

auto to_json(const Baseline& baseline) -> Json::Value {
    Json::Value out;
    out["device"] = baseline.device;
    out["saved_at"] = to_json(baseline.saved_at);
    out["saved_date"] = util::format_date(baseline.saved_at);
    if (baseline.power_on_hours) {
        out["power_on_hours"] = static_cast<Json::UInt64>(*baseline.power_on_hours);
    }
    Json::Value attributes(Json::arrayValue);
    for (const auto& attr : baseline.attributes) {
        Json::Value a;
        a["id"] = attr.id;
        a["name"] = attr.name;
        a["raw"] = static_cast<Json::UInt64>(attr.raw_value);
        a["value"] = attr.value;
        attributes.append(a);
    }
    out["attributes"] = attributes;
    return out;
}

auto baseline_from_json(const Json::Value& value) -> util::Result<Baseline> {
    if (!value.isObject() || get_string(value, "device").empty()) {
        return invalid("baseline without device");
    }
    Baseline baseline;
    baseline.device = get_string(value, "device");
    baseline.saved_at = get_time(value, "saved_at");
    baseline.power_on_hours = optional_u64(value, "power_on_hours");
    for (const auto& a : value["attributes"]) {
        if (!a.isObject() || !a["id"].isUInt()) {
            continue;
        }
        BaselineAttribute attr;
        attr.id = a["id"].asUInt();
        attr.name = get_string(a, "name");
        attr.raw_value = get_u64(a, "raw");
        attr.value = static_cast<uint32_t>(get_u64(a, "value"));
        baseline.attributes.push_back(std::move(attr));
    }
    return baseline;
}

auto to_json(const HealthHistoryPoint& point) -> Json::Value {
    Json::Value out;
    out["ts"] = to_json(point.at);
    out["score"] = point.score;
    return out;
}

auto to_json(const EnduranceRecord& record) -> Json::Value {
    Json::Value out;
    out["bytes_written"] = static_cast<Json::UInt64>(record.bytes_written);
    out["first_tracked"] = to_json(record.first_tracked);
    out["last_sectors_written"] = static_cast<Json::UInt64>(record.last_sectors_written);
    return out;
}

auto endurance_from_json(const Json::Value& value) -> EnduranceRecord {
    EnduranceRecord record;
    record.bytes_written = get_u64(value, "bytes_written");
    record.first_tracked = get_time(value, "first_tracked");
    record.last_sectors_written = get_u64(value, "last_sectors_written");
    return record;
}

// Self-tests

auto to_json(const SelfTestStatus& status) -> Json::Value {
    Json::Value out;
    out["state"] = std::string(to_string(status.state));
    out["type"] = std::string(to_string(status.type));
    if (status.percent_remaining) {
        out["percent_remaining"] = *status.percent_remaining;
    }
    out["started_at"] = to_json(status.started_at);
    out["updated_at"] = to_json(status.updated_at);
    return out;
}

auto to_json(const SelfTestEntry& entry) -> Json::Value {
    Json::Value out;
    out["type"] = std::string(to_string(entry.type));
    out["status"] = entry.status;
    out["lifetime_hours"] = static_cast<Json::UInt64>(entry.lifetime_hours);
    out["passed"] = entry.passed;
    return out;
}

// Query results

auto to_json(const DeviceState& state) -> Json::Value {
    Json::Value out = to_json(state.identity);
    out["display_name"] = state.display_name();

    if (state.smart) {
        out["smart"] = to_json(*state.smart);
    }
    out["smart_stale"] = state.smart_stale;
    out["smart_updated_at"] = to_json(state.smart_updated_at);

    if (state.io) {
        Json::Value io;
        io["reads_completed"] = static_cast<Json::UInt64>(state.io->counters.reads_completed);
        io["writes_completed"] = static_cast<Json::UInt64>(state.io->counters.writes_completed);
        io["sectors_read"] = static_cast<Json::UInt64>(state.io->counters.sectors_read);
        io["sectors_written"] = static_cast<Json::UInt64>(state.io->counters.sectors_written);
        if (state.io->rates) {
            const auto& r = *state.io->rates;
            io["read_bytes_per_sec"] = r.read_bytes_per_sec;
            io["write_bytes_per_sec"] = r.write_bytes_per_sec;
            io["read_iops"] = r.read_iops;
            io["write_iops"] = r.write_iops;
            io["util_pct"] = r.util_pct;
            io["avg_read_latency_ms"] = r.avg_read_latency_ms;
            io["avg_write_latency_ms"] = r.avg_write_latency_ms;
        }
        out["io"] = io;
    }
    out["io_stale"] = state.io_stale;

    if (state.health) {
        out["health_score"] = state.health->score;
    }

    out["self_test"] = to_json(state.self_test);
    out["self_test_stale"] = state.self_test_stale;

    if (state.endurance) {
        auto endurance = to_json(*state.endurance);
        endurance["bytes_per_day"] = state.endurance->bytes_per_day(util::Clock::now());
        out["endurance"] = endurance;
    }
    return out;
}

auto to_json(const HostState& host) -> Json::Value {
    Json::Value out;

    Json::Value filesystems(Json::arrayValue);
    for (const auto& fs : host.filesystems) {
        Json::Value f;
        f["device"] = fs.device;
        f["mount"] = fs.mount;
        f["fs_type"] = fs.fs_type;
        f["total_bytes"] = static_cast<Json::UInt64>(fs.total_bytes);
        f["used_bytes"] = static_cast<Json::UInt64>(fs.used_bytes);
        f["avail_bytes"] = static_cast<Json::UInt64>(fs.avail_bytes);
        f["use_pct"] = fs.use_pct();
        f["inode_pct"] = fs.inode_pct();
        if (fs.fill_rate_bps) {
            f["fill_rate_bps"] = *fs.fill_rate_bps;
        }
        if (fs.days_until_full) {
            f["days_until_full"] = *fs.days_until_full;
        }
        filesystems.append(f);
    }
    out["filesystems"] = filesystems;
    out["filesystems_stale"] = host.filesystems_stale;

    Json::Value nfs(Json::arrayValue);
    for (const auto& mount : host.nfs_mounts) {
        Json::Value n;
        n["device"] = mount.device;
        n["mount"] = mount.mount;
        n["read_ops"] = static_cast<Json::UInt64>(mount.read_ops);
        n["write_ops"] = static_cast<Json::UInt64>(mount.write_ops);
        n["read_rtt_ms"] = mount.read_rtt_ms;
        n["write_rtt_ms"] = mount.write_rtt_ms;
        nfs.append(n);
    }
    out["nfs"] = nfs;
    out["nfs_stale"] = host.nfs_stale;

    Json::Value volumes(Json::arrayValue);
    for (const auto& volume : host.volumes) {
        Json::Value v;
        v["name"] = volume.name;
        v["kind"] = volume.kind;
        v["level"] = volume.level;
        v["state"] = volume.state;
        v["health"] = std::string(to_string(volume.health));
        if (volume.rebuild_pct) {
            v["rebuild_pct"] = *volume.rebuild_pct;
        }
        Json::Value members(Json::arrayValue);
        for (const auto& member : volume.members) {
            members.append(member);
        }
        v["members"] = members;
        volumes.append(v);
    }
    out["volumes"] = volumes;
    out["volumes_stale"] = host.volumes_stale;
    return out;
}

auto to_json(const BaselineDiff& diff) -> Json::Value {
    Json::Value out;
    out["device"] = diff.device;
    out["baseline_saved_at"] = to_json(diff.baseline_saved_at);
    if (diff.power_on_hours_delta) {
        out["power_on_hours_delta"] = static_cast<Json::Int64>(*diff.power_on_hours_delta);
    }
    Json::Value attributes(Json::arrayValue);
    for (const auto& delta : diff.attributes) {
        Json::Value a;
        a["id"] = delta.id;
        a["name"] = delta.name;
        a["baseline_raw"] = static_cast<Json::UInt64>(delta.baseline_raw);
        a["current_raw"] = static_cast<Json::UInt64>(delta.current_raw);
        a["delta"] = static_cast<Json::Int64>(delta.delta);
        a["normalized_delta"] = static_cast<Json::Int64>(delta.normalized_delta);
        attributes.append(a);
    }
    out["attributes"] = attributes;
    return out;
}

}  // namespace codec
