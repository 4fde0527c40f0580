/**
 * @file WebhookNotifier.cpp
 * @brief Webhook POST through libcurl with a jsoncpp payload
 */

#include "services/WebhookNotifier.hpp"
#include "util/Logger.hpp"

#include <curl/curl.h>
#include <glib.h>
#include <json/json.h>

#include <format>
#include <memory>
#include <mutex>

namespace {

constexpr long MAX_REDIRECTS = 5;

using UriPtr = std::unique_ptr<GUri, decltype(&g_uri_unref)>;
using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::once_flag curl_init_flag;

// Response bodies are not inspected; only the status code matters.
auto discard_body(char* /*data*/, size_t size, size_t count, void* /*userdata*/) -> size_t {
    return size * count;
}

}  // namespace

WebhookNotifier::WebhookNotifier() : sender_(&WebhookNotifier::post_json) {
    std::call_once(curl_init_flag, [] {
        if (const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK) {
            LOG_ERROR("WebhookNotifier",
                      std::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
        }
    });
}

WebhookNotifier::WebhookNotifier(HttpSender sender) : sender_(std::move(sender)) {}

auto WebhookNotifier::build_payload(const AlertEvent& event) -> std::string {
    const auto severity = to_string(event.alert.severity);

    Json::Value root;
    root["text"] = std::format("[{}] {}: {}{}", severity == "crit" ? "CRIT" : "WARN",
                               event.display_name, event.alert.message,
                               event.escalation ? " (escalated)" : "");
    root["severity"] = std::string(severity);
    root["device"] = event.alert.device;
    root["rule"] = std::string(to_string(event.alert.rule));
    root["message"] = event.alert.message;
    root["alert_id"] = static_cast<Json::UInt64>(event.alert.id);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

auto WebhookNotifier::parse_url(const std::string& url) -> util::Result<WebhookTarget> {
    GError* error = nullptr;
    UriPtr uri(g_uri_parse(url.c_str(), G_URI_FLAGS_NONE, &error), &g_uri_unref);
    if (!uri) {
        auto message = std::format("invalid webhook URL: {}", error ? error->message : url);
        g_clear_error(&error);
        return util::fail(util::ErrorKind::InvalidArgument, std::move(message));
    }

    WebhookTarget target;
    target.url = url;
    const std::string scheme = g_uri_get_scheme(uri.get()) ? g_uri_get_scheme(uri.get()) : "";
    if (scheme == "https") {
        target.tls = true;
    } else if (scheme != "http") {
        return util::fail(util::ErrorKind::InvalidArgument,
                          std::format("unsupported webhook scheme '{}'", scheme));
    }

    const char* host = g_uri_get_host(uri.get());
    if (host == nullptr || *host == '\0') {
        return util::fail(util::ErrorKind::InvalidArgument, "webhook URL has no host");
    }
    target.host = host;

    const gint port = g_uri_get_port(uri.get());
    target.port = port > 0 ? static_cast<uint16_t>(port) : (target.tls ? 443 : 80);

    const char* path = g_uri_get_path(uri.get());
    target.path = (path != nullptr && *path != '\0') ? path : "/";
    if (const char* query = g_uri_get_query(uri.get()); query != nullptr) {
        target.path += '?';
        target.path += query;
    }
    return target;
}

auto WebhookNotifier::post_json(const WebhookTarget& target, const std::string& body)
    -> util::Result<int> {
    CurlPtr handle(curl_easy_init(), &curl_easy_cleanup);
    if (!handle) {
        return util::fail(util::ErrorKind::NotificationDeliveryFailed,
                          "failed to initialise libcurl handle");
    }

    HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"),
                       &curl_slist_free_all);
    // An empty Expect header disables the 100-continue round trip.
    if (!headers || curl_slist_append(headers.get(), "Expect:") == nullptr) {
        return util::fail(util::ErrorKind::NotificationDeliveryFailed,
                          "failed to build webhook headers");
    }

    const long timeout_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(REQUEST_TIMEOUT).count();

    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, target.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "drivewatch");
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, MAX_REDIRECTS);
    // Keep POST semantics across 301/302/303 redirects.
    curl_easy_setopt(curl, CURLOPT_POSTREDIR, CURL_REDIR_POST_ALL);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &discard_body);

    if (const CURLcode rc = curl_easy_perform(curl); rc != CURLE_OK) {
        return util::fail(util::ErrorKind::NotificationDeliveryFailed,
                          std::format("POST {}:{}: {}", target.host, target.port,
                                      curl_easy_strerror(rc)));
    }

    long status = 0;
    if (const CURLcode rc = curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        rc != CURLE_OK || status == 0) {
        return util::fail(util::ErrorKind::NotificationDeliveryFailed,
                          "webhook returned no HTTP status");
    }
    return static_cast<int>(status);
}

auto WebhookNotifier::deliver(const AlertEvent& event, const NotificationsConfig& config)
    -> util::Result<void> {
    auto target = parse_url(config.webhook_url);
    if (!target) {
        return util::fail(util::ErrorKind::NotificationDeliveryFailed, target.error().message);
    }

    auto status = sender_(*target, build_payload(event));
    if (!status) {
        return util::fail(util::ErrorKind::NotificationDeliveryFailed, status.error().message);
    }
    if (*status < 200 || *status >= 300) {
        return util::fail(util::ErrorKind::NotificationDeliveryFailed,
                          std::format("webhook returned HTTP {}", *status), *status);
    }
    return {};
}
