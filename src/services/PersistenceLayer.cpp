/**
 * @file PersistenceLayer.cpp
 * @brief JSON files under the data directory
 */

#include "services/PersistenceLayer.hpp"

#include "models/JsonCodec.hpp"
#include "util/AtomicFile.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <sstream>

namespace fs = std::filesystem;

namespace {

constexpr auto ALERT_LOG_FILE = "alerts.log";
constexpr auto ACKED_FILE = "acked_alerts.json";
constexpr auto ALERT_STATE_FILE = "alert_state.json";
constexpr auto HISTORY_FILE = "health_history.json";
constexpr auto ANOMALY_FILE = "smart_anomalies.json";
constexpr auto ENDURANCE_FILE = "write_endurance.json";
constexpr auto SMART_CACHE_FILE = "smart_cache.json";
constexpr auto BASELINE_DIR = "baselines";

/**
 * @brief Read and parse a JSON document; a missing file yields nullopt
 */
auto read_document(const fs::path& path) -> util::Result<std::optional<Json::Value>> {
    auto text = util::read_file(path);
    if (!text) {
        if (text.error().kind == util::ErrorKind::NotFound) {
            return std::nullopt;
        }
        return std::unexpected(text.error());
    }
    auto root = codec::parse(*text);
    if (!root) {
        return util::fail(util::ErrorKind::InvalidArgument,
                          std::format("{}: {}", path.string(), root.error().message));
    }
    return std::optional<Json::Value>(std::move(*root));
}

auto write_document(const fs::path& path, const Json::Value& root) -> util::Result<void> {
    auto written = util::write_file_atomic(path, codec::write_pretty(root));
    if (!written) {
        LOG_ERROR("PersistenceLayer", std::format("{} not saved: {}", path.filename().string(),
                                                  written.error().message));
    }
    return written;
}

/**
 * @brief Device ids become file names; keep them to one path component
 */
auto file_stem(const std::string& device) -> std::string {
    std::string stem = device;
    std::ranges::replace(stem, '/', '_');
    if (stem.empty() || stem == "." || stem == "..") {
        stem = "_" + stem;
    }
    return stem;
}

}  // namespace

PersistenceLayer::PersistenceLayer(fs::path data_dir) : data_dir_(std::move(data_dir)) {}

auto PersistenceLayer::default_data_dir() -> fs::path {
    if (const char* data_home = std::getenv("XDG_DATA_HOME"); data_home && *data_home) {
        return fs::path{data_home} / "drivewatch";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path{home} / ".local" / "share" / "drivewatch";
    }
    return fs::temp_directory_path() / "drivewatch";
}

auto PersistenceLayer::alert_log_path() const -> fs::path {
    return path_of(ALERT_LOG_FILE);
}

auto PersistenceLayer::baseline_path(const std::string& device) const -> fs::path {
    return data_dir_ / BASELINE_DIR / (file_stem(device) + ".json");
}

// Alert log

auto PersistenceLayer::append_alert(const Alert& alert) -> util::Result<void> {
    std::lock_guard lock(mutex_);
    auto appended = util::append_line(alert_log_path(), codec::write_compact(codec::to_json(alert)));
    if (!appended) {
        LOG_ERROR("PersistenceLayer",
                  std::format("alert #{} not logged: {}", alert.id, appended.error().message));
    }
    return appended;
}

auto PersistenceLayer::load_alert_log() -> util::Result<std::vector<Alert>> {
    std::lock_guard lock(mutex_);
    auto text = util::read_file(alert_log_path());
    if (!text) {
        if (text.error().kind == util::ErrorKind::NotFound) {
            return std::vector<Alert>{};
        }
        return std::unexpected(text.error());
    }

    std::vector<Alert> alerts;
    std::istringstream stream(*text);
    std::string line;
    size_t line_no = 0;
    while (std::getline(stream, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }
        auto value = codec::parse(line);
        auto alert = value ? codec::alert_from_json(*value)
                           : util::Result<Alert>(std::unexpected(value.error()));
        if (!alert) {
            LOG_WARNING("PersistenceLayer", std::format("alerts.log:{} skipped: {}", line_no,
                                                        alert.error().message));
            continue;
        }
        alerts.push_back(std::move(*alert));
    }
    return alerts;
}

auto PersistenceLayer::save_acknowledged(const std::set<std::string>& keys) -> util::Result<void> {
    std::lock_guard lock(mutex_);
    Json::Value root(Json::arrayValue);
    for (const auto& key : keys) {
        root.append(key);
    }
    return write_document(path_of(ACKED_FILE), root);
}

auto PersistenceLayer::load_acknowledged() -> util::Result<std::set<std::string>> {
    std::lock_guard lock(mutex_);
    auto doc = read_document(path_of(ACKED_FILE));
    if (!doc) {
        return std::unexpected(doc.error());
    }
    std::set<std::string> keys;
    if (*doc) {
        for (const auto& key : **doc) {
            if (key.isString()) {
                keys.insert(key.asString());
            }
        }
    }
    return keys;
}

auto PersistenceLayer::save_next_alert_id(uint64_t next_id) -> util::Result<void> {
    std::lock_guard lock(mutex_);
    Json::Value root(Json::objectValue);
    root["next_alert_id"] = static_cast<Json::UInt64>(next_id);
    return write_document(path_of(ALERT_STATE_FILE), root);
}

auto PersistenceLayer::load_next_alert_id() -> util::Result<uint64_t> {
    std::lock_guard lock(mutex_);
    auto doc = read_document(path_of(ALERT_STATE_FILE));
    if (!doc) {
        return std::unexpected(doc.error());
    }
    if (!*doc || !(*doc)->isObject() || !(**doc)["next_alert_id"].isUInt64()) {
        return uint64_t{1};
    }
    return std::max<uint64_t>(1, (**doc)["next_alert_id"].asUInt64());
}

// Health history

auto PersistenceLayer::save_health_history(const HistoryMap& history) -> util::Result<void> {
    std::lock_guard lock(mutex_);
    Json::Value root(Json::objectValue);
    for (const auto& [device, points] : history) {
        Json::Value series(Json::arrayValue);
        const size_t skip =
            points.size() > HEALTH_HISTORY_CAPACITY ? points.size() - HEALTH_HISTORY_CAPACITY : 0;
        for (size_t i = skip; i < points.size(); ++i) {
            series.append(codec::to_json(points[i]));
        }
        root[device] = series;
    }
    return write_document(path_of(HISTORY_FILE), root);
}

auto PersistenceLayer::load_health_history() -> util::Result<HistoryMap> {
    std::lock_guard lock(mutex_);
    auto doc = read_document(path_of(HISTORY_FILE));
    if (!doc) {
        return std::unexpected(doc.error());
    }
    HistoryMap history;
    if (!*doc || !(*doc)->isObject()) {
        return history;
    }
    for (const auto& device : (*doc)->getMemberNames()) {
        auto& points = history[device];
        for (const auto& p : (**doc)[device]) {
            if (!p.isObject()) {
                continue;
            }
            points.push_back(HealthHistoryPoint{codec::get_time(p, "ts"),
                                                static_cast<int>(codec::get_i64(p, "score"))});
        }
    }
    return history;
}

// Anomalies

auto PersistenceLayer::save_anomalies(const std::vector<AnomalyRecord>& records,
                                      const ClearedMap& cleared) -> util::Result<void> {
    std::lock_guard lock(mutex_);
    Json::Value root;
    Json::Value list(Json::arrayValue);
    for (const auto& record : records) {
        list.append(codec::to_json(record));
    }
    root["records"] = list;

    Json::Value marks(Json::objectValue);
    for (const auto& [device, attrs] : cleared) {
        Json::Value per_device(Json::objectValue);
        for (const auto& [id, value] : attrs) {
            per_device[std::to_string(id)] = static_cast<Json::UInt64>(value);
        }
        marks[device] = per_device;
    }
    root["cleared"] = marks;
    return write_document(path_of(ANOMALY_FILE), root);
}

auto PersistenceLayer::load_anomalies() -> util::Result<AnomalyState> {
    std::lock_guard lock(mutex_);
    auto doc = read_document(path_of(ANOMALY_FILE));
    if (!doc) {
        return std::unexpected(doc.error());
    }
    AnomalyState state;
    if (!*doc || !(*doc)->isObject()) {
        return state;
    }
    const auto& root = **doc;

    for (const auto& value : root["records"]) {
        auto record = codec::anomaly_from_json(value);
        if (!record) {
            LOG_WARNING("PersistenceLayer",
                        std::format("anomaly record skipped: {}", record.error().message));
            continue;
        }
        state.records.push_back(std::move(*record));
    }

    if (const auto& marks = root["cleared"]; marks.isObject()) {
        for (const auto& device : marks.getMemberNames()) {
            const auto& per_device = marks[device];
            if (!per_device.isObject()) {
                continue;
            }
            for (const auto& id : per_device.getMemberNames()) {
                char* end = nullptr;
                const auto attr_id = std::strtoul(id.c_str(), &end, 10);
                if (end == id.c_str() || *end != '\0' || !per_device[id].isUInt64()) {
                    continue;
                }
                state.cleared[device][static_cast<uint32_t>(attr_id)] = per_device[id].asUInt64();
            }
        }
    }
    return state;
}

// Endurance

auto PersistenceLayer::save_endurance(const EnduranceMap& records) -> util::Result<void> {
    std::lock_guard lock(mutex_);
    Json::Value root(Json::objectValue);
    for (const auto& [device, record] : records) {
        root[device] = codec::to_json(record);
    }
    return write_document(path_of(ENDURANCE_FILE), root);
}

auto PersistenceLayer::load_endurance() -> util::Result<EnduranceMap> {
    std::lock_guard lock(mutex_);
    auto doc = read_document(path_of(ENDURANCE_FILE));
    if (!doc) {
        return std::unexpected(doc.error());
    }
    EnduranceMap records;
    if (!*doc || !(*doc)->isObject()) {
        return records;
    }
    for (const auto& device : (*doc)->getMemberNames()) {
        const auto& value = (**doc)[device];
        if (value.isObject()) {
            records.emplace(device, codec::endurance_from_json(value));
        }
    }
    return records;
}

// SMART cache

auto PersistenceLayer::save_smart_cache(const std::vector<CachedSmart>& entries)
    -> util::Result<void> {
    std::lock_guard lock(mutex_);
    Json::Value root(Json::arrayValue);
    for (const auto& entry : entries) {
        Json::Value item;
        item["identity"] = codec::to_json(entry.identity);
        item["smart"] = codec::to_json(entry.snapshot);
        root.append(item);
    }
    return write_document(path_of(SMART_CACHE_FILE), root);
}

auto PersistenceLayer::load_smart_cache() -> util::Result<std::vector<CachedSmart>> {
    std::lock_guard lock(mutex_);
    auto doc = read_document(path_of(SMART_CACHE_FILE));
    if (!doc) {
        return std::unexpected(doc.error());
    }
    std::vector<CachedSmart> entries;
    if (!*doc || !(*doc)->isArray()) {
        return entries;
    }
    for (const auto& item : **doc) {
        if (!item.isObject()) {
            continue;
        }
        auto identity = codec::identity_from_json(item["identity"]);
        auto snapshot = codec::snapshot_from_json(item["smart"]);
        if (!identity || !snapshot) {
            LOG_WARNING("PersistenceLayer", "SMART cache entry skipped");
            continue;
        }
        entries.push_back(CachedSmart{std::move(*identity), std::move(*snapshot)});
    }
    return entries;
}

// Baselines

auto PersistenceLayer::save_baseline(const Baseline& baseline) -> util::Result<void> {
    std::lock_guard lock(mutex_);
    const auto path = baseline_path(baseline.device);

    auto doc = read_document(path);
    if (!doc) {
        return util::fail(util::ErrorKind::PersistenceWriteFailed,
                          std::format("existing baselines unreadable: {}", doc.error().message));
    }

    Json::Value root(Json::arrayValue);
    if (*doc) {
        if ((*doc)->isArray()) {
            root = **doc;
        } else if ((*doc)->isObject()) {
            root.append(**doc);
        }
    }
    root.append(codec::to_json(baseline));

    auto written = write_document(path, root);
    if (written) {
        LOG_INFO("PersistenceLayer", std::format("baseline for {} saved ({} total)", baseline.device,
                                                 root.size()));
    }
    return written;
}

auto PersistenceLayer::load_baselines(const std::string& device)
    -> util::Result<std::vector<Baseline>> {
    std::lock_guard lock(mutex_);
    auto doc = read_document(baseline_path(device));
    if (!doc) {
        return std::unexpected(doc.error());
    }
    std::vector<Baseline> baselines;
    if (!*doc) {
        return baselines;
    }

    auto take = [&baselines](const Json::Value& value) {
        auto baseline = codec::baseline_from_json(value);
        if (baseline) {
            baselines.push_back(std::move(*baseline));
        } else {
            LOG_WARNING("PersistenceLayer",
                        std::format("baseline skipped: {}", baseline.error().message));
        }
    };

    if ((*doc)->isArray()) {
        for (const auto& value : **doc) {
            take(value);
        }
    } else {
        take(**doc);
    }
    return baselines;
}

auto PersistenceLayer::latest_baseline(const std::string& device) -> util::Result<Baseline> {
    auto baselines = load_baselines(device);
    if (!baselines) {
        return std::unexpected(baselines.error());
    }
    if (baselines->empty()) {
        return util::fail(util::ErrorKind::NotFound, std::format("no baseline saved for {}", device));
    }
    return baselines->back();
}
