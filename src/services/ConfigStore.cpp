/**
 * @file ConfigStore.cpp
 * @brief GKeyFile-backed configuration store
 */

#include "services/ConfigStore.hpp"

#include "util/AtomicFile.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <cstdlib>
#include <format>

namespace fs = std::filesystem;

namespace {

constexpr auto GROUP_GENERAL = "general";
constexpr auto GROUP_ALERTS = "alerts";
constexpr auto GROUP_THRESHOLDS = "thresholds";
constexpr auto GROUP_DEVICES = "devices";
constexpr auto GROUP_NOTIFICATIONS = "notifications";
constexpr auto GROUP_ALIASES = "aliases";

using KeyFilePtr = std::unique_ptr<GKeyFile, decltype(&g_key_file_free)>;

struct IntKey {
    const char* key;
    int GeneralConfig::*member;
};

constexpr IntKey GENERAL_KEYS[] = {
    {"update_interval_ms", &GeneralConfig::update_interval_ms},
    {"smart_interval_sec", &GeneralConfig::smart_interval_sec},
    {"fs_interval_sec", &GeneralConfig::fs_interval_sec},
    {"nfs_interval_sec", &GeneralConfig::nfs_interval_sec},
    {"volume_interval_sec", &GeneralConfig::volume_interval_sec},
    {"fetch_timeout_ms", &GeneralConfig::fetch_timeout_ms},
    {"selftest_poll_sec", &GeneralConfig::selftest_poll_sec},
    {"selftest_short_timeout_min", &GeneralConfig::selftest_short_timeout_min},
    {"selftest_long_timeout_min", &GeneralConfig::selftest_long_timeout_min},
};

struct PairKey {
    const char* warn_key;
    const char* crit_key;
    ThresholdPair Thresholds::*member;
};

constexpr PairKey THRESHOLD_KEYS[] = {
    {"temperature_warn_hdd", "temperature_crit_hdd", &Thresholds::temperature_hdd},
    {"temperature_warn_ssd", "temperature_crit_ssd", &Thresholds::temperature_ssd},
    {"temperature_warn_nvme", "temperature_crit_nvme", &Thresholds::temperature_nvme},
    {"filesystem_warn_pct", "filesystem_crit_pct", &Thresholds::filesystem_pct},
    {"inode_warn_pct", "inode_crit_pct", &Thresholds::inode_pct},
    {"io_util_warn_pct", "io_util_crit_pct", &Thresholds::io_util_pct},
    {"latency_warn_ms", "latency_crit_ms", &Thresholds::latency_ms},
    {"nfs_rtt_warn_ms", "nfs_rtt_crit_ms", &Thresholds::nfs_rtt_ms},
    {"reallocated_warn", "reallocated_crit", &Thresholds::reallocated},
    {"pending_warn", "pending_crit", &Thresholds::pending},
    {"uncorrectable_warn", "uncorrectable_crit", &Thresholds::uncorrectable},
    {"fill_days_warn", "fill_days_crit", &Thresholds::fill_days},
};

auto key_error(const char* group, const char* key, GError* error) -> std::unexpected<util::Error> {
    auto message = std::format("[{}] {}: {}", group, key, error ? error->message : "invalid value");
    g_clear_error(&error);
    return util::fail(util::ErrorKind::ConfigInvalid, std::move(message));
}

auto read_int(GKeyFile* kf, const char* group, const char* key, int& out) -> util::Result<void> {
    if (!g_key_file_has_key(kf, group, key, nullptr)) {
        return {};
    }
    GError* error = nullptr;
    const gint value = g_key_file_get_integer(kf, group, key, &error);
    if (error) {
        return key_error(group, key, error);
    }
    out = value;
    return {};
}

auto read_double(GKeyFile* kf, const char* group, const char* key, double& out)
    -> util::Result<void> {
    if (!g_key_file_has_key(kf, group, key, nullptr)) {
        return {};
    }
    GError* error = nullptr;
    const gdouble value = g_key_file_get_double(kf, group, key, &error);
    if (error) {
        return key_error(group, key, error);
    }
    out = value;
    return {};
}

auto read_bool(GKeyFile* kf, const char* group, const char* key, bool& out) -> util::Result<void> {
    if (!g_key_file_has_key(kf, group, key, nullptr)) {
        return {};
    }
    GError* error = nullptr;
    const gboolean value = g_key_file_get_boolean(kf, group, key, &error);
    if (error) {
        return key_error(group, key, error);
    }
    out = value != FALSE;
    return {};
}

auto read_string(GKeyFile* kf, const char* group, const char* key, std::string& out)
    -> util::Result<void> {
    if (!g_key_file_has_key(kf, group, key, nullptr)) {
        return {};
    }
    GError* error = nullptr;
    gchar* value = g_key_file_get_string(kf, group, key, &error);
    if (error) {
        return key_error(group, key, error);
    }
    out = value ? value : "";
    g_free(value);
    return {};
}

auto read_list(GKeyFile* kf, const char* group, const char* key, std::vector<std::string>& out)
    -> util::Result<void> {
    if (!g_key_file_has_key(kf, group, key, nullptr)) {
        return {};
    }
    GError* error = nullptr;
    gsize length = 0;
    gchar** values = g_key_file_get_string_list(kf, group, key, &length, &error);
    if (error) {
        return key_error(group, key, error);
    }
    out.clear();
    for (gsize i = 0; i < length; ++i) {
        std::string item{values[i]};
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
    }
    g_strfreev(values);
    return {};
}

auto read_config(GKeyFile* kf) -> util::Result<Config> {
    Config config;

    for (const auto& [key, member] : GENERAL_KEYS) {
        if (auto ok = read_int(kf, GROUP_GENERAL, key, config.general.*member); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (auto ok = read_string(kf, GROUP_GENERAL, "data_dir", config.general.data_dir); !ok) {
        return std::unexpected(ok.error());
    }

    int cooldown_hours = 0;
    int cooldown_sec = 0;
    if (auto ok = read_int(kf, GROUP_ALERTS, "cooldown_hours", cooldown_hours); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = read_int(kf, GROUP_ALERTS, "cooldown_sec", cooldown_sec); !ok) {
        return std::unexpected(ok.error());
    }
    config.cooldown = g_key_file_has_key(kf, GROUP_ALERTS, "cooldown_sec", nullptr)
                          ? std::chrono::seconds{cooldown_sec}
                          : std::chrono::hours{cooldown_hours};

    std::vector<std::string> disabled;
    if (auto ok = read_list(kf, GROUP_ALERTS, "disabled_rules", disabled); !ok) {
        return std::unexpected(ok.error());
    }
    for (const auto& name : disabled) {
        auto kind = rule_kind_from_string(name);
        if (!kind) {
            return util::fail(util::ErrorKind::ConfigInvalid,
                              std::format("[alerts] disabled_rules: unknown rule '{}'", name));
        }
        config.disabled_rules.push_back(*kind);
    }

    for (const auto& [warn_key, crit_key, member] : THRESHOLD_KEYS) {
        auto& pair = config.thresholds.*member;
        if (auto ok = read_double(kf, GROUP_THRESHOLDS, warn_key, pair.warn); !ok) {
            return std::unexpected(ok.error());
        }
        if (auto ok = read_double(kf, GROUP_THRESHOLDS, crit_key, pair.crit); !ok) {
            return std::unexpected(ok.error());
        }
    }

    if (auto ok = read_list(kf, GROUP_DEVICES, "exclude", config.exclude); !ok) {
        return std::unexpected(ok.error());
    }

    auto& notify = config.notifications;
    if (auto ok = read_string(kf, GROUP_NOTIFICATIONS, "webhook_url", notify.webhook_url); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = read_bool(kf, GROUP_NOTIFICATIONS, "notify_warning", notify.notify_warning); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = read_bool(kf, GROUP_NOTIFICATIONS, "notify_critical", notify.notify_critical);
        !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = read_bool(kf, GROUP_NOTIFICATIONS, "desktop", notify.desktop); !ok) {
        return std::unexpected(ok.error());
    }

    if (g_key_file_has_group(kf, GROUP_ALIASES)) {
        gsize count = 0;
        gchar** keys = g_key_file_get_keys(kf, GROUP_ALIASES, &count, nullptr);
        for (gsize i = 0; i < count; ++i) {
            std::string alias;
            if (auto ok = read_string(kf, GROUP_ALIASES, keys[i], alias); !ok) {
                g_strfreev(keys);
                return std::unexpected(ok.error());
            }
            if (!alias.empty()) {
                config.aliases.emplace(keys[i], std::move(alias));
            }
        }
        g_strfreev(keys);
    }

    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

}  // namespace

ConfigStore::ConfigStore(fs::path path)
    : path_(std::move(path)), current_(std::make_shared<const Config>()) {}

ConfigStore::~ConfigStore() {
    stop_reload_timer();
}

auto ConfigStore::default_path() -> fs::path {
    if (const char* config_home = std::getenv("XDG_CONFIG_HOME"); config_home && *config_home) {
        return fs::path{config_home} / "drivewatch" / "drivewatch.conf";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path{home} / ".config" / "drivewatch" / "drivewatch.conf";
    }
    return fs::path{"drivewatch.conf"};
}

auto ConfigStore::parse(std::string_view text) -> util::Result<Config> {
    KeyFilePtr kf{g_key_file_new(), &g_key_file_free};
    g_key_file_set_list_separator(kf.get(), ';');

    GError* error = nullptr;
    if (!g_key_file_load_from_data(kf.get(), text.data(), text.size(), G_KEY_FILE_NONE, &error)) {
        auto message = std::format("parse error: {}", error ? error->message : "unknown");
        g_clear_error(&error);
        return util::fail(util::ErrorKind::ConfigInvalid, std::move(message));
    }
    return read_config(kf.get());
}

auto ConfigStore::serialize(const Config& config) -> std::string {
    KeyFilePtr kf{g_key_file_new(), &g_key_file_free};
    g_key_file_set_list_separator(kf.get(), ';');

    for (const auto& [key, member] : GENERAL_KEYS) {
        g_key_file_set_integer(kf.get(), GROUP_GENERAL, key, config.general.*member);
    }
    if (!config.general.data_dir.empty()) {
        g_key_file_set_string(kf.get(), GROUP_GENERAL, "data_dir", config.general.data_dir.c_str());
    }

    g_key_file_set_integer(kf.get(), GROUP_ALERTS, "cooldown_sec",
                           static_cast<gint>(config.cooldown.count()));
    if (!config.disabled_rules.empty()) {
        std::vector<std::string> names;
        for (auto kind : config.disabled_rules) {
            names.emplace_back(to_string(kind));
        }
        std::vector<const gchar*> ptrs;
        for (const auto& name : names) {
            ptrs.push_back(name.c_str());
        }
        g_key_file_set_string_list(kf.get(), GROUP_ALERTS, "disabled_rules", ptrs.data(),
                                   ptrs.size());
    }

    for (const auto& [warn_key, crit_key, member] : THRESHOLD_KEYS) {
        const auto& pair = config.thresholds.*member;
        g_key_file_set_double(kf.get(), GROUP_THRESHOLDS, warn_key, pair.warn);
        g_key_file_set_double(kf.get(), GROUP_THRESHOLDS, crit_key, pair.crit);
    }

    std::vector<const gchar*> patterns;
    for (const auto& pattern : config.exclude) {
        patterns.push_back(pattern.c_str());
    }
    g_key_file_set_string_list(kf.get(), GROUP_DEVICES, "exclude", patterns.data(),
                               patterns.size());

    const auto& notify = config.notifications;
    g_key_file_set_string(kf.get(), GROUP_NOTIFICATIONS, "webhook_url", notify.webhook_url.c_str());
    g_key_file_set_boolean(kf.get(), GROUP_NOTIFICATIONS, "notify_warning", notify.notify_warning);
    g_key_file_set_boolean(kf.get(), GROUP_NOTIFICATIONS, "notify_critical",
                           notify.notify_critical);
    g_key_file_set_boolean(kf.get(), GROUP_NOTIFICATIONS, "desktop", notify.desktop);

    for (const auto& [device, alias] : config.aliases) {
        g_key_file_set_string(kf.get(), GROUP_ALIASES, device.c_str(), alias.c_str());
    }

    gsize length = 0;
    gchar* data = g_key_file_to_data(kf.get(), &length, nullptr);
    std::string text{data ? data : "", length};
    g_free(data);
    return text;
}

auto ConfigStore::load() -> util::Result<void> {
    auto content = util::read_file(path_);
    if (!content) {
        if (content.error().kind != util::ErrorKind::NotFound) {
            return std::unexpected(content.error());
        }
        LOG_INFO("ConfigStore", std::format("{} not found, using defaults", path_.string()));
        auto defaults = std::make_shared<const Config>();
        auto text = serialize(*defaults);
        if (auto written = util::write_file_atomic(path_, text); !written) {
            LOG_WARNING("ConfigStore",
                        std::format("could not write default config: {}", written.error().message));
        }
        {
            std::lock_guard lock(mutex_);
            last_content_ = std::move(text);
        }
        publish(std::move(defaults));
        return {};
    }

    auto parsed = parse(*content);
    {
        std::lock_guard lock(mutex_);
        last_content_ = *content;
    }
    if (!parsed) {
        LOG_WARNING("ConfigStore", std::format("{} rejected, using defaults: {}", path_.string(),
                                               parsed.error().message));
        return std::unexpected(parsed.error());
    }

    LOG_INFO("ConfigStore", std::format("loaded {}", path_.string()));
    publish(std::make_shared<const Config>(std::move(*parsed)));
    return {};
}

auto ConfigStore::reload() -> util::Result<bool> {
    auto content = util::read_file(path_);
    if (!content) {
        return std::unexpected(content.error());
    }

    {
        std::lock_guard lock(mutex_);
        if (*content == last_content_) {
            return false;
        }
        last_content_ = *content;
    }

    auto parsed = parse(*content);
    if (!parsed) {
        LOG_WARNING("ConfigStore", std::format("reload rejected, keeping previous config: {}",
                                               parsed.error().message));
        return std::unexpected(parsed.error());
    }

    if (*current() == *parsed) {
        return false;
    }

    LOG_INFO("ConfigStore", std::format("reloaded {}", path_.string()));
    publish(std::make_shared<const Config>(std::move(*parsed)));
    return true;
}

auto ConfigStore::replace(Config config) -> util::Result<void> {
    if (auto valid = config.validate(); !valid) {
        return valid;
    }
    publish(std::make_shared<const Config>(std::move(config)));
    return {};
}

auto ConfigStore::current() const -> std::shared_ptr<const Config> {
    std::lock_guard lock(mutex_);
    return current_;
}

void ConfigStore::subscribe(Listener listener) {
    std::lock_guard lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void ConfigStore::publish(std::shared_ptr<const Config> config) {
    std::vector<Listener> listeners;
    {
        std::lock_guard lock(mutex_);
        current_ = config;
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(config);
    }
}

void ConfigStore::start_reload_timer(std::chrono::milliseconds interval) {
    stop_reload_timer();
    {
        std::lock_guard lock(timer_mutex_);
        stop_requested_ = false;
    }
    timer_thread_ = std::thread([this, interval]() { reload_loop(interval); });
}

void ConfigStore::stop_reload_timer() {
    {
        std::lock_guard lock(timer_mutex_);
        stop_requested_ = true;
    }
    timer_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

void ConfigStore::reload_loop(std::chrono::milliseconds interval) {
    std::unique_lock lock(timer_mutex_);
    while (!timer_cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
        lock.unlock();
        if (auto result = reload(); !result && result.error().kind != util::ErrorKind::ConfigInvalid) {
            LOG_DEBUG("ConfigStore", std::format("reload skipped: {}", result.error().message));
        }
        lock.lock();
    }
}
