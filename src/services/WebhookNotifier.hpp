/**
 * @file WebhookNotifier.hpp
 * @brief HTTP(S) webhook delivery of alert events
 */

#pragma once

#include "interfaces/INotificationChannel.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

/**
 * @struct WebhookTarget
 * @brief Validated webhook URL
 */
struct WebhookTarget {
    std::string url;  ///< Full URL handed to the transfer
    bool tls = false;
    std::string host;
    uint16_t port = 0;
    std::string path = "/";  ///< Path plus query

    auto operator==(const WebhookTarget&) const -> bool = default;
};

/**
 * @class WebhookNotifier
 * @brief POSTs a Slack/Discord compatible JSON payload per alert event
 *
 * The payload carries a preformatted "text" field plus severity, device,
 * rule and message. Any non-2xx status, connect failure or timeout is
 * reported as NotificationDeliveryFailed.
 *
 * @example
 * ```cpp
 * auto notifier = std::make_shared<WebhookNotifier>();
 * dispatcher = std::make_shared<NotificationDispatcher>(config_store,
 *     std::vector<std::shared_ptr<INotificationChannel>>{notifier});
 * ```
 */
class WebhookNotifier : public INotificationChannel {
public:
    static constexpr std::chrono::seconds REQUEST_TIMEOUT{10};

    /// Sends a body to a target and returns the HTTP status code
    using HttpSender = std::function<util::Result<int>(const WebhookTarget& target,
                                                       const std::string& body)>;

    WebhookNotifier();
    explicit WebhookNotifier(HttpSender sender);

    [[nodiscard]] auto name() const -> std::string_view override { return "webhook"; }

    [[nodiscard]] auto is_enabled(const NotificationsConfig& config) const -> bool override {
        return !config.webhook_url.empty();
    }

    auto deliver(const AlertEvent& event, const NotificationsConfig& config)
        -> util::Result<void> override;

    /**
     * @brief JSON body for one event
     */
    [[nodiscard]] static auto build_payload(const AlertEvent& event) -> std::string;

    /**
     * @brief Split an http:// or https:// URL into connection parameters
     * @return InvalidArgument for other schemes or a missing host
     */
    [[nodiscard]] static auto parse_url(const std::string& url) -> util::Result<WebhookTarget>;

    /**
     * @brief Blocking POST through a libcurl easy handle
     *
     * Redirects are followed, TLS and proxies come from libcurl. The
     * returned status is the final response code after any interim
     * 1xx responses.
     */
    [[nodiscard]] static auto post_json(const WebhookTarget& target, const std::string& body)
        -> util::Result<int>;

private:
    HttpSender sender_;
};
