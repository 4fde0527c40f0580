/**
 * @file DBusService.cpp
 * @brief io.drivewatch.Monitor object implementation
 */

#include "daemon/DBusService.hpp"

#include "models/JsonCodec.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <iterator>

namespace {

// D-Bus introspection XML
const char* introspection_data = R"XML(
<node>
  <interface name="io.drivewatch.Monitor">
    <method name="ListDevices">
      <arg name="devices" type="s" direction="out"/>
    </method>
    <method name="GetDevice">
      <arg name="device" type="s" direction="in"/>
      <arg name="state" type="s" direction="out"/>
    </method>
    <method name="GetHost">
      <arg name="host" type="s" direction="out"/>
    </method>
    <method name="GetAlerts">
      <arg name="active_only" type="b" direction="in"/>
      <arg name="since_sec" type="x" direction="in"/>
      <arg name="min_severity" type="s" direction="in"/>
      <arg name="search" type="s" direction="in"/>
      <arg name="alerts" type="s" direction="out"/>
    </method>
    <method name="GetRecentAlerts">
      <arg name="alerts" type="s" direction="out"/>
    </method>
    <method name="GetHealthHistory">
      <arg name="device" type="s" direction="in"/>
      <arg name="days" type="i" direction="in"/>
      <arg name="history" type="s" direction="out"/>
    </method>
    <method name="GetAnomalies">
      <arg name="device" type="s" direction="in"/>
      <arg name="anomalies" type="s" direction="out"/>
    </method>
    <method name="GetBaselineDiff">
      <arg name="device" type="s" direction="in"/>
      <arg name="diff" type="s" direction="out"/>
    </method>
    <method name="GetSelfTestStatus">
      <arg name="device" type="s" direction="in"/>
      <arg name="status" type="s" direction="out"/>
    </method>
    <method name="GetSelfTestLog">
      <arg name="device" type="s" direction="in"/>
      <arg name="log" type="s" direction="out"/>
    </method>
    <method name="Acknowledge">
      <arg name="alert_id" type="t" direction="in"/>
    </method>
    <method name="AcknowledgeAll">
      <arg name="count" type="u" direction="out"/>
    </method>
    <method name="SaveBaseline">
      <arg name="device" type="s" direction="in"/>
      <arg name="baseline" type="s" direction="out"/>
    </method>
    <method name="ScheduleSelfTest">
      <arg name="device" type="s" direction="in"/>
      <arg name="long" type="b" direction="in"/>
      <arg name="wait" type="b" direction="in"/>
      <arg name="timeout_sec" type="u" direction="in"/>
      <arg name="status" type="s" direction="out"/>
    </method>
    <method name="ClearAnomalies">
      <arg name="device" type="s" direction="in"/>
      <arg name="removed" type="u" direction="out"/>
    </method>
    <method name="Repoll">
      <arg name="device" type="s" direction="in"/>
    </method>
    <method name="TestWebhook"/>
  </interface>
</node>
)XML";

auto json_reply(const Json::Value& value) -> GVariant* {
    return g_variant_new("(s)", codec::write_compact(value).c_str());
}

template <typename T>
auto json_array(const std::vector<T>& items) -> Json::Value {
    Json::Value out(Json::arrayValue);
    for (const auto& item : items) {
        out.append(codec::to_json(item));
    }
    return out;
}

auto string_arg(GVariant* parameters) -> std::string {
    const gchar* value = nullptr;
    g_variant_get(parameters, "(&s)", &value);
    return value != nullptr ? value : "";
}

auto optional_device(std::string device) -> std::optional<std::string> {
    if (device.empty()) {
        return std::nullopt;
    }
    return device;
}

auto empty_reply() -> GVariant* {
    return g_variant_new("()");
}

}  // namespace

DBusService::DBusService(std::shared_ptr<MonitorService> monitor) : monitor_(std::move(monitor)) {}

DBusService::~DBusService() {
    stop();
}

auto DBusService::introspection_xml() -> const char* {
    return introspection_data;
}

auto DBusService::error_name(util::ErrorKind kind) -> std::string {
    return std::format("{}{}", ERROR_PREFIX, util::to_string(kind));
}

auto DBusService::is_blocking(std::string_view method) -> bool {
    return method == "ScheduleSelfTest" || method == "Repoll" || method == "TestWebhook";
}

void DBusService::start(GBusType bus_type, NameLostHandler on_name_lost) {
    if (owner_id_ != 0) {
        return;
    }
    name_lost_handler_ = std::move(on_name_lost);
    owner_id_ = g_bus_own_name(bus_type, BUS_NAME, G_BUS_NAME_OWNER_FLAGS_NONE,
                               nullptr,  // bus acquired
                               &DBusService::on_name_acquired, &DBusService::on_name_lost, this,
                               nullptr);
}

void DBusService::stop() {
    if (registration_id_ != 0 && connection_ != nullptr) {
        g_dbus_connection_unregister_object(connection_, registration_id_);
        registration_id_ = 0;
    }
    if (owner_id_ != 0) {
        g_bus_unown_name(owner_id_);
        owner_id_ = 0;
    }
    connection_ = nullptr;
    reap_jobs(true);
}

void DBusService::on_name_acquired(GDBusConnection* connection, const gchar* name,
                                   gpointer user_data) {
    auto* self = static_cast<DBusService*>(user_data);
    self->connection_ = connection;

    GError* error = nullptr;
    GDBusNodeInfo* node = g_dbus_node_info_new_for_xml(introspection_data, &error);
    if (node == nullptr) {
        LOG_ERROR("DBusService", std::format("failed to parse introspection XML: {}",
                                             error != nullptr ? error->message : "unknown"));
        g_clear_error(&error);
        if (self->name_lost_handler_) {
            self->name_lost_handler_();
        }
        return;
    }

    static const GDBusInterfaceVTable vtable = {
        .method_call = &DBusService::on_method_call,
        .get_property = nullptr,
        .set_property = nullptr,
        .padding = {nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr, nullptr}};

    self->registration_id_ = g_dbus_connection_register_object(
        connection, OBJECT_PATH, node->interfaces[0], &vtable, self, nullptr, &error);
    g_dbus_node_info_unref(node);

    if (self->registration_id_ == 0) {
        LOG_ERROR("DBusService", std::format("failed to register {}: {}", OBJECT_PATH,
                                             error != nullptr ? error->message : "unknown"));
        g_clear_error(&error);
        if (self->name_lost_handler_) {
            self->name_lost_handler_();
        }
        return;
    }

    LOG_INFO("DBusService", std::format("acquired {}, object registered at {}", name, OBJECT_PATH));
}

void DBusService::on_name_lost(GDBusConnection* /*connection*/, const gchar* name,
                               gpointer user_data) {
    auto* self = static_cast<DBusService*>(user_data);
    LOG_ERROR("DBusService", std::format("lost or could not acquire bus name {}", name));
    self->connection_ = nullptr;
    self->registration_id_ = 0;
    if (self->name_lost_handler_) {
        self->name_lost_handler_();
    }
}

void DBusService::on_method_call(GDBusConnection* /*connection*/, const gchar* /*sender*/,
                                 const gchar* /*object_path*/, const gchar* /*interface_name*/,
                                 const gchar* method_name, GVariant* parameters,
                                 GDBusMethodInvocation* invocation, gpointer user_data) {
    auto* self = static_cast<DBusService*>(user_data);

    if (!is_blocking(method_name)) {
        self->reply(invocation, method_name, parameters);
        return;
    }

    // The invocation keeps its parameters alive until a reply is sent
    self->run_async([self, invocation, method = std::string(method_name), parameters] {
        self->reply(invocation, method, parameters);
    });
}

void DBusService::reply(GDBusMethodInvocation* invocation, std::string_view method,
                        GVariant* parameters) {
    auto result = call(method, parameters);
    if (result) {
        g_dbus_method_invocation_return_value(invocation, *result);
        return;
    }

    const auto& error = result.error();
    LOG_DEBUG("DBusService", std::format("{} failed ({}): {}", method,
                                         util::to_string(error.kind), error.message));
    g_dbus_method_invocation_return_dbus_error(invocation, error_name(error.kind).c_str(),
                                               error.message.c_str());
}

auto DBusService::call(std::string_view method, GVariant* parameters) -> util::Result<GVariant*> {
    if (method == "ListDevices") {
        Json::Value out(Json::arrayValue);
        for (const auto& state : monitor_->devices()) {
            out.append(codec::to_json(*state));
        }
        return json_reply(out);
    }

    if (method == "GetDevice") {
        auto state = monitor_->device(string_arg(parameters));
        if (!state) {
            return std::unexpected(state.error());
        }
        return json_reply(codec::to_json(**state));
    }

    if (method == "GetHost") {
        const auto host = monitor_->host();
        return json_reply(host ? codec::to_json(*host) : Json::Value(Json::objectValue));
    }

    if (method == "GetAlerts") {
        gboolean active_only = FALSE;
        gint64 since_sec = 0;
        const gchar* min_severity = nullptr;
        const gchar* search = nullptr;
        g_variant_get(parameters, "(bx&s&s)", &active_only, &since_sec, &min_severity, &search);

        AlertQuery query;
        query.active_only = active_only != FALSE;
        if (since_sec > 0) {
            query.since = util::from_unix_seconds(since_sec);
        }
        if (min_severity != nullptr && *min_severity != '\0') {
            query.min_severity = severity_from_string(min_severity);
            if (!query.min_severity) {
                return util::fail(util::ErrorKind::InvalidArgument,
                                  std::format("unknown severity '{}'", min_severity));
            }
        }
        query.search = search != nullptr ? search : "";

        auto alerts = monitor_->alerts(query);
        if (!alerts) {
            return std::unexpected(alerts.error());
        }
        return json_reply(json_array(*alerts));
    }

    if (method == "GetRecentAlerts") {
        return json_reply(json_array(monitor_->recent_alerts()));
    }

    if (method == "GetHealthHistory") {
        const gchar* device = nullptr;
        gint32 days = 0;
        g_variant_get(parameters, "(&si)", &device, &days);
        if (days <= 0) {
            return util::fail(util::ErrorKind::InvalidArgument, "days must be positive");
        }
        return json_reply(json_array(monitor_->health_history(device, days)));
    }

    if (method == "GetAnomalies") {
        return json_reply(json_array(monitor_->anomalies(optional_device(string_arg(parameters)))));
    }

    if (method == "GetBaselineDiff") {
        auto diff = monitor_->baseline_diff(string_arg(parameters));
        if (!diff) {
            return std::unexpected(diff.error());
        }
        return json_reply(codec::to_json(*diff));
    }

    if (method == "GetSelfTestStatus") {
        auto status = monitor_->self_test_status(string_arg(parameters));
        if (!status) {
            return std::unexpected(status.error());
        }
        return json_reply(codec::to_json(*status));
    }

    if (method == "GetSelfTestLog") {
        auto log = monitor_->self_test_log(string_arg(parameters));
        if (!log) {
            return std::unexpected(log.error());
        }
        return json_reply(json_array(*log));
    }

    if (method == "Acknowledge") {
        guint64 alert_id = 0;
        g_variant_get(parameters, "(t)", &alert_id);
        if (auto acked = monitor_->acknowledge(alert_id); !acked) {
            return std::unexpected(acked.error());
        }
        return empty_reply();
    }

    if (method == "AcknowledgeAll") {
        return g_variant_new("(u)", static_cast<guint32>(monitor_->acknowledge_all()));
    }

    if (method == "SaveBaseline") {
        auto baseline = monitor_->save_baseline(string_arg(parameters));
        if (!baseline) {
            return std::unexpected(baseline.error());
        }
        return json_reply(codec::to_json(*baseline));
    }

    if (method == "ScheduleSelfTest") {
        const gchar* device = nullptr;
        gboolean is_long = FALSE;
        gboolean wait = FALSE;
        guint32 timeout_sec = 0;
        g_variant_get(parameters, "(&sbbu)", &device, &is_long, &wait, &timeout_sec);

        const auto type = is_long != FALSE ? SelfTestType::Long : SelfTestType::Short;
        std::optional<std::chrono::milliseconds> wait_for;
        if (wait != FALSE) {
            if (timeout_sec > 0) {
                wait_for = std::chrono::seconds(timeout_sec);
            } else {
                // Without an explicit timeout, wait as long as the test may take
                const auto config = monitor_->config();
                const auto& general = config->general;
                wait_for = std::chrono::minutes(type == SelfTestType::Long
                                                    ? general.selftest_long_timeout_min
                                                    : general.selftest_short_timeout_min);
            }
        }

        auto status = monitor_->schedule_self_test(device, type, wait_for);
        if (!status) {
            return std::unexpected(status.error());
        }
        return json_reply(codec::to_json(*status));
    }

    if (method == "ClearAnomalies") {
        const auto removed = monitor_->clear_anomalies(optional_device(string_arg(parameters)));
        return g_variant_new("(u)", static_cast<guint32>(removed));
    }

    if (method == "Repoll") {
        if (auto polled = monitor_->repoll(string_arg(parameters)); !polled) {
            return std::unexpected(polled.error());
        }
        return empty_reply();
    }

    if (method == "TestWebhook") {
        if (auto sent = monitor_->test_webhook(); !sent) {
            return std::unexpected(sent.error());
        }
        return empty_reply();
    }

    return util::fail(util::ErrorKind::InvalidArgument, std::format("unknown method {}", method));
}

void DBusService::run_async(std::function<void()> job) {
    reap_jobs(false);
    std::lock_guard lock(jobs_mutex_);
    jobs_.push_back(std::async(std::launch::async, std::move(job)));
}

void DBusService::reap_jobs(bool wait) {
    std::vector<std::future<void>> done;
    {
        std::lock_guard lock(jobs_mutex_);
        if (wait) {
            done = std::move(jobs_);
            jobs_.clear();
        } else {
            auto finished = std::ranges::partition(jobs_, [](const std::future<void>& job) {
                return job.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
            });
            std::move(finished.begin(), finished.end(), std::back_inserter(done));
            jobs_.erase(finished.begin(), finished.end());
        }
    }
    for (auto& job : done) {
        job.get();
    }
}
