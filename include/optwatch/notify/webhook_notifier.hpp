// include/optwatch/notify/webhook_notifier.hpp
#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "optwatch/notify/notifier.hpp"

namespace optwatch {

struct WebhookSettings {
    std::string url;
    std::vector<std::string> extra_urls;  // only during trading hours
    std::vector<std::string> mentioned_list;
    std::string message_prefix{"[optwatch]"};
    long timeout_seconds{10};
    long extra_timeout_seconds{5};
};

/**
 * @brief Posts summaries to a group-chat bot webhook
 *
 * Payload: {"msgtype": "text", "text": {"content": ..., "mentioned_list": [...]}}.
 * The bot acknowledges with {"errcode": 0}; anything else is a failure. After a
 * successful primary post the message is copied to the extra URLs, but only
 * while the summary's market is trading; failures there are logged only.
 */
class WebhookNotifier : public Notifier {
public:
    using TradingHoursCheck = std::function<bool(Market)>;

    WebhookNotifier(WebhookSettings settings, TradingHoursCheck in_trading_hours);

    Result<void> notify(const TradeSummary& summary) override;

    std::string name() const override {
        return "webhook";
    }

    /**
     * @brief Send an arbitrary text message through the primary webhook
     */
    Result<void> send_text(const std::string& content, Market market);

    static nlohmann::json build_payload(const std::string& content,
                                        const std::vector<std::string>& mentioned_list);

    /**
     * @brief Check the bot's acknowledgement body
     */
    static Result<void> check_reply(const std::string& body);

private:
    Result<std::string> post(const std::string& url, const std::string& body,
                             long timeout_seconds) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* out);

    WebhookSettings settings_;
    TradingHoursCheck in_trading_hours_;
};

}  // namespace optwatch
