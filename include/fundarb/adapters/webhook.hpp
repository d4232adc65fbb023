// Funding Arb Engine - Webhook Notifier
// NotificationPort over HTTP: a generic JSON webhook or the Telegram Bot API

#pragma once

#include <fundarb/config.hpp>
#include <fundarb/notification.hpp>
#include <string>

namespace fundarb::adapters {

class WebhookNotifier : public NotificationPort {
public:
    explicit WebhookNotifier(const NotificationConfig& config, int timeout_ms = 5000);

    bool send_message(const std::string& text) override;

    [[nodiscard]] bool uses_telegram() const noexcept { return !telegram_token_.empty(); }

    // Endpoint and body a message is delivered with
    [[nodiscard]] std::string endpoint() const;
    [[nodiscard]] std::string payload(const std::string& text) const;

private:
    std::string webhook_url_;
    std::string telegram_token_;
    std::string telegram_chat_id_;
    int timeout_ms_;
};

}  // namespace fundarb::adapters
