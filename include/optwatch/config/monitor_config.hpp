// include/optwatch/config/monitor_config.hpp
#pragma once

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "optwatch/calendar/trading_calendar.hpp"
#include "optwatch/classify/threshold_rules.hpp"
#include "optwatch/core/config_base.hpp"
#include "optwatch/core/logger.hpp"
#include "optwatch/core/types.hpp"
#include "optwatch/marketdata/rest_market_data_client.hpp"
#include "optwatch/notify/webhook_notifier.hpp"
#include "optwatch/scheduling/retry_invoker.hpp"

namespace optwatch {

/**
 * @brief Configuration validation error
 */
struct ConfigValidationError {
    std::string field;
    std::string message;
};

/**
 * @brief What to watch in one market
 */
struct MarketConfig {
    Market market{Market::HK};
    bool enabled{true};
    bool monitor_off_hours{false};
    std::vector<std::string> underlyings;
    std::map<std::string, Price> default_prices;  // used when no quote is available
    std::map<std::string, std::string> names;
    CalendarSettings calendar;
    std::string database_name;

    /**
     * @brief Enabled with at least one underlying to watch
     */
    bool is_active() const {
        return enabled && !underlyings.empty();
    }

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Cadence of the worker loops and the shared API turn
 */
struct SchedulerConfig {
    std::chrono::milliseconds min_api_interval{std::chrono::seconds(5)};
    std::chrono::milliseconds scan_interval_single{std::chrono::seconds(60)};
    std::chrono::milliseconds scan_interval_multi{std::chrono::seconds(120)};
    std::chrono::milliseconds turn_poll_interval{std::chrono::seconds(5)};
    int max_wait_cycles{60};
    std::chrono::milliseconds stagger_delay{std::chrono::seconds(60)};
    std::chrono::milliseconds recovery_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds status_interval{std::chrono::seconds(600)};

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

struct ScannerConfig {
    int expiry_window_days{30};
    size_t fallback_expiry_count{3};
    std::chrono::milliseconds api_pacing{std::chrono::seconds(1)};
    std::chrono::milliseconds price_cache_ttl{std::chrono::seconds(300)};
    std::chrono::seconds notify_cooldown{0};

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

struct NotificationConfig {
    bool console{true};
    bool webhook_enabled{false};
    WebhookSettings webhook;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Complete monitor configuration, one JSON document
 */
struct MonitorConfig : public ConfigBase {
    LoggerConfig logging;
    RestClientOptions gateway;
    std::map<Market, MarketConfig> markets;
    ThresholdTable thresholds;
    SchedulerConfig scheduler;
    RetryPolicy retry;
    ScannerConfig scanner;
    NotificationConfig notification;

    MonitorConfig();

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Markets with at least one underlying and not disabled, HK first
     */
    std::vector<Market> active_markets() const;

    std::vector<ConfigValidationError> validate() const;
};

}  // namespace optwatch
