// Funding Arb Engine - Webhook Notifier Implementation

#include <fundarb/adapters/webhook.hpp>
#include <fundarb/errors.hpp>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fundarb::adapters {

WebhookNotifier::WebhookNotifier(const NotificationConfig& config, int timeout_ms)
    : webhook_url_(config.webhook_url),
      telegram_token_(config.telegram_token),
      telegram_chat_id_(config.telegram_chat_id),
      timeout_ms_(timeout_ms) {
    if (webhook_url_.empty() && (telegram_token_.empty() || telegram_chat_id_.empty())) {
        throw ConfigError("WebhookNotifier needs webhook_url or telegram_token and telegram_chat_id");
    }
}

std::string WebhookNotifier::endpoint() const {
    if (uses_telegram()) {
        return "https://api.telegram.org/bot" + telegram_token_ + "/sendMessage";
    }
    return webhook_url_;
}

std::string WebhookNotifier::payload(const std::string& text) const {
    nlohmann::json body;
    if (uses_telegram()) {
        body["chat_id"] = telegram_chat_id_;
        body["text"] = text;
        body["disable_web_page_preview"] = true;
    } else {
        body["text"] = text;
        body["source"] = "funding_bot";
        body["timestamp"] = now_ms();
    }
    return body.dump();
}

bool WebhookNotifier::send_message(const std::string& text) {
    cpr::Response r = cpr::Post(
        cpr::Url{endpoint()},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{payload(text)},
        cpr::Timeout{timeout_ms_});

    if (r.error) {
        spdlog::error("Notification delivery failed: {}", r.error.message);
        return false;
    }
    if (r.status_code < 200 || r.status_code >= 300) {
        spdlog::error("Notification endpoint returned HTTP {}: {}", r.status_code, r.text);
        return false;
    }
    return true;
}

}  // namespace fundarb::adapters
