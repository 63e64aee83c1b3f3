// src/notify/webhook_notifier.cpp

#include "optwatch/notify/webhook_notifier.hpp"
#include <curl/curl.h>
#include "optwatch/core/logger.hpp"
#include "optwatch/marketdata/field_coercion.hpp"
#include "optwatch/notify/summary_formatter.hpp"

namespace optwatch {

WebhookNotifier::WebhookNotifier(WebhookSettings settings, TradingHoursCheck in_trading_hours)
    : settings_(std::move(settings)), in_trading_hours_(std::move(in_trading_hours)) {}

size_t WebhookNotifier::write_callback(void* contents, size_t size, size_t nmemb,
                                       std::string* out) {
    out->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json WebhookNotifier::build_payload(const std::string& content,
                                              const std::vector<std::string>& mentioned_list) {
    nlohmann::json payload;
    payload["msgtype"] = "text";
    payload["text"]["content"] = content;
    payload["text"]["mentioned_list"] = mentioned_list;
    return payload;
}

Result<void> WebhookNotifier::check_reply(const std::string& body) {
    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::NOTIFICATION_ERROR,
                                std::string("Unreadable webhook reply: ") + e.what(),
                                "WebhookNotifier");
    }

    if (!reply.is_object() || !reply.contains("errcode")) {
        return make_error<void>(ErrorCode::NOTIFICATION_ERROR,
                                "Webhook reply has no errcode: " + body, "WebhookNotifier");
    }

    const Count errcode = FieldCoercion::json_count(reply["errcode"], -1);
    if (errcode != 0) {
        return make_error<void>(ErrorCode::NOTIFICATION_ERROR,
                                "Webhook rejected message (errcode " + std::to_string(errcode) +
                                    "): " + FieldCoercion::json_string(reply.value("errmsg", "")),
                                "WebhookNotifier");
    }
    return Result<void>();
}

Result<std::string> WebhookNotifier::post(const std::string& url, const std::string& body,
                                          long timeout_seconds) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<std::string>(ErrorCode::NOTIFICATION_ERROR, "Failed to initialize CURL",
                                       "WebhookNotifier");
    }

    std::string response;
    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WebhookNotifier::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return make_error<std::string>(ErrorCode::NOTIFICATION_ERROR,
                                       "Webhook post failed: " +
                                           std::string(curl_easy_strerror(res)),
                                       "WebhookNotifier");
    }
    if (http_status != 200) {
        return make_error<std::string>(ErrorCode::NOTIFICATION_ERROR,
                                       "Webhook returned HTTP " + std::to_string(http_status),
                                       "WebhookNotifier");
    }
    return Result<std::string>(std::move(response));
}

Result<void> WebhookNotifier::send_text(const std::string& content, Market market) {
    if (settings_.url.empty()) {
        return make_error<void>(ErrorCode::CONFIG_ERROR, "Webhook URL is not configured",
                                "WebhookNotifier");
    }

    const std::string body =
        build_payload(settings_.message_prefix.empty() ? content
                                                       : settings_.message_prefix + " " + content,
                      settings_.mentioned_list)
            .dump();

    auto reply = post(settings_.url, body, settings_.timeout_seconds);
    if (reply.is_error()) {
        return make_error<void>(reply.error()->code(), reply.error()->what(), "WebhookNotifier");
    }
    auto accepted = check_reply(reply.value());
    if (accepted.is_error()) {
        return accepted;
    }
    INFO("Webhook notification sent");

    if (settings_.extra_urls.empty()) {
        return Result<void>();
    }
    if (!in_trading_hours_ || !in_trading_hours_(market)) {
        INFO("Market " << market_to_string(market) << " closed, skipping extra webhooks");
        return Result<void>();
    }

    for (const auto& extra_url : settings_.extra_urls) {
        auto extra = post(extra_url, body, settings_.extra_timeout_seconds);
        if (extra.is_error()) {
            WARN("Extra webhook failed: " << extra.error()->what());
        } else {
            DEBUG("Extra webhook sent");
        }
    }
    return Result<void>();
}

Result<void> WebhookNotifier::notify(const TradeSummary& summary) {
    if (summary.trades.empty()) {
        return Result<void>();
    }
    return send_text(SummaryFormatter::format(summary), summary.market);
}

}  // namespace optwatch
