// src/config/monitor_config.cpp
#include "optwatch/config/monitor_config.hpp"

#include <stdexcept>

namespace optwatch {

namespace {

std::chrono::milliseconds read_ms(const nlohmann::json& j, const char* key,
                                  std::chrono::milliseconds current) {
    if (!j.contains(key))
        return current;
    return std::chrono::milliseconds(j.at(key).get<long long>());
}

}  // namespace

nlohmann::json MarketConfig::to_json() const {
    nlohmann::json j;
    j["enabled"] = enabled;
    j["monitor_off_hours"] = monitor_off_hours;
    j["underlyings"] = underlyings;
    j["default_prices"] = default_prices;
    j["names"] = names;
    j["calendar"] = calendar.to_json();
    j["database_name"] = database_name;
    return j;
}

void MarketConfig::from_json(const nlohmann::json& j) {
    if (j.contains("enabled"))
        enabled = j.at("enabled").get<bool>();
    if (j.contains("monitor_off_hours"))
        monitor_off_hours = j.at("monitor_off_hours").get<bool>();
    if (j.contains("underlyings"))
        underlyings = j.at("underlyings").get<std::vector<std::string>>();
    if (j.contains("default_prices"))
        default_prices = j.at("default_prices").get<std::map<std::string, Price>>();
    if (j.contains("names"))
        names = j.at("names").get<std::map<std::string, std::string>>();
    if (j.contains("calendar"))
        calendar.from_json(j.at("calendar"));
    if (j.contains("database_name"))
        database_name = j.at("database_name").get<std::string>();
}

nlohmann::json SchedulerConfig::to_json() const {
    nlohmann::json j;
    j["min_api_interval_ms"] = min_api_interval.count();
    j["scan_interval_single_ms"] = scan_interval_single.count();
    j["scan_interval_multi_ms"] = scan_interval_multi.count();
    j["turn_poll_interval_ms"] = turn_poll_interval.count();
    j["max_wait_cycles"] = max_wait_cycles;
    j["stagger_delay_ms"] = stagger_delay.count();
    j["recovery_interval_ms"] = recovery_interval.count();
    j["status_interval_ms"] = status_interval.count();
    return j;
}

void SchedulerConfig::from_json(const nlohmann::json& j) {
    min_api_interval = read_ms(j, "min_api_interval_ms", min_api_interval);
    scan_interval_single = read_ms(j, "scan_interval_single_ms", scan_interval_single);
    scan_interval_multi = read_ms(j, "scan_interval_multi_ms", scan_interval_multi);
    turn_poll_interval = read_ms(j, "turn_poll_interval_ms", turn_poll_interval);
    if (j.contains("max_wait_cycles"))
        max_wait_cycles = j.at("max_wait_cycles").get<int>();
    stagger_delay = read_ms(j, "stagger_delay_ms", stagger_delay);
    recovery_interval = read_ms(j, "recovery_interval_ms", recovery_interval);
    status_interval = read_ms(j, "status_interval_ms", status_interval);
}

nlohmann::json ScannerConfig::to_json() const {
    nlohmann::json j;
    j["expiry_window_days"] = expiry_window_days;
    j["fallback_expiry_count"] = fallback_expiry_count;
    j["api_pacing_ms"] = api_pacing.count();
    j["price_cache_ttl_ms"] = price_cache_ttl.count();
    j["notify_cooldown_seconds"] = notify_cooldown.count();
    return j;
}

void ScannerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("expiry_window_days"))
        expiry_window_days = j.at("expiry_window_days").get<int>();
    if (j.contains("fallback_expiry_count"))
        fallback_expiry_count = j.at("fallback_expiry_count").get<size_t>();
    api_pacing = read_ms(j, "api_pacing_ms", api_pacing);
    price_cache_ttl = read_ms(j, "price_cache_ttl_ms", price_cache_ttl);
    if (j.contains("notify_cooldown_seconds"))
        notify_cooldown = std::chrono::seconds(j.at("notify_cooldown_seconds").get<long long>());
}

nlohmann::json NotificationConfig::to_json() const {
    nlohmann::json j;
    j["console"] = console;
    j["webhook_enabled"] = webhook_enabled;
    nlohmann::json w;
    w["url"] = webhook.url;
    w["extra_urls"] = webhook.extra_urls;
    w["mentioned_list"] = webhook.mentioned_list;
    w["message_prefix"] = webhook.message_prefix;
    w["timeout_seconds"] = webhook.timeout_seconds;
    w["extra_timeout_seconds"] = webhook.extra_timeout_seconds;
    j["webhook"] = w;
    return j;
}

void NotificationConfig::from_json(const nlohmann::json& j) {
    if (j.contains("console"))
        console = j.at("console").get<bool>();
    if (j.contains("webhook_enabled"))
        webhook_enabled = j.at("webhook_enabled").get<bool>();
    if (!j.contains("webhook"))
        return;
    const auto& w = j.at("webhook");
    if (w.contains("url"))
        webhook.url = w.at("url").get<std::string>();
    if (w.contains("extra_urls"))
        webhook.extra_urls = w.at("extra_urls").get<std::vector<std::string>>();
    if (w.contains("mentioned_list"))
        webhook.mentioned_list = w.at("mentioned_list").get<std::vector<std::string>>();
    if (w.contains("message_prefix"))
        webhook.message_prefix = w.at("message_prefix").get<std::string>();
    if (w.contains("timeout_seconds"))
        webhook.timeout_seconds = w.at("timeout_seconds").get<long>();
    if (w.contains("extra_timeout_seconds"))
        webhook.extra_timeout_seconds = w.at("extra_timeout_seconds").get<long>();
}

MonitorConfig::MonitorConfig() {
    MarketConfig hk;
    hk.market = Market::HK;
    hk.calendar = CalendarSettings::hong_kong();
    hk.database_name = "hk_options";
    markets[Market::HK] = hk;

    MarketConfig us;
    us.market = Market::US;
    us.calendar = CalendarSettings::united_states();
    us.database_name = "us_options";
    markets[Market::US] = us;
}

nlohmann::json MonitorConfig::to_json() const {
    nlohmann::json j;
    j["logging"] = logging.to_json();

    nlohmann::json gw;
    gw["base_url"] = gateway.base_url;
    gw["api_key"] = gateway.api_key;
    gw["timeout_seconds"] = gateway.timeout_seconds;
    j["gateway"] = gw;

    nlohmann::json m = nlohmann::json::object();
    for (const auto& [market, cfg] : markets) {
        m[market_to_string(market)] = cfg.to_json();
    }
    j["markets"] = m;

    j["thresholds"] = thresholds.to_json();
    j["scheduler"] = scheduler.to_json();
    j["retry"] = retry.to_json();
    j["scanner"] = scanner.to_json();
    j["notification"] = notification.to_json();
    return j;
}

void MonitorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));

    if (j.contains("gateway")) {
        const auto& gw = j.at("gateway");
        if (gw.contains("base_url"))
            gateway.base_url = gw.at("base_url").get<std::string>();
        if (gw.contains("api_key"))
            gateway.api_key = gw.at("api_key").get<std::string>();
        if (gw.contains("timeout_seconds"))
            gateway.timeout_seconds = gw.at("timeout_seconds").get<long>();
    }

    if (j.contains("markets")) {
        for (const auto& [key, value] : j.at("markets").items()) {
            Market market;
            if (!market_from_string(key, market)) {
                throw std::invalid_argument("Unknown market in configuration: " + key);
            }
            auto& cfg = markets[market];
            cfg.market = market;
            cfg.from_json(value);
        }
    }

    if (j.contains("thresholds"))
        thresholds.from_json(j.at("thresholds"));
    if (j.contains("scheduler"))
        scheduler.from_json(j.at("scheduler"));
    if (j.contains("retry"))
        retry.from_json(j.at("retry"));
    if (j.contains("scanner"))
        scanner.from_json(j.at("scanner"));
    if (j.contains("notification"))
        notification.from_json(j.at("notification"));
}

std::vector<Market> MonitorConfig::active_markets() const {
    std::vector<Market> result;
    for (Market market : {Market::HK, Market::US}) {
        auto it = markets.find(market);
        if (it != markets.end() && it->second.is_active()) {
            result.push_back(market);
        }
    }
    return result;
}

std::vector<ConfigValidationError> MonitorConfig::validate() const {
    std::vector<ConfigValidationError> errors;

    if (gateway.base_url.empty()) {
        errors.push_back({"gateway.base_url", "Must not be empty"});
    }
    if (gateway.timeout_seconds <= 0) {
        errors.push_back({"gateway.timeout_seconds", "Must be positive"});
    }

    if (active_markets().empty()) {
        errors.push_back({"markets", "At least one market must be enabled with underlyings"});
    }

    for (const auto& [market, cfg] : markets) {
        const std::string prefix = "markets." + market_to_string(market);
        if (!cfg.is_active())
            continue;
        if (cfg.calendar.sessions.empty()) {
            errors.push_back({prefix + ".calendar.sessions", "At least one session required"});
        }
        for (const auto& session : cfg.calendar.sessions) {
            if (session.open_minute >= session.close_minute) {
                errors.push_back({prefix + ".calendar.sessions",
                                  "Session " + session.to_string() + " closes before it opens"});
            }
        }
        for (const auto& code : cfg.underlyings) {
            if (code.rfind(market_to_string(market) + ".", 0) != 0) {
                errors.push_back({prefix + ".underlyings",
                                  "Code " + code + " does not belong to this market"});
            }
        }
        for (const auto& [code, price] : cfg.default_prices) {
            if (price <= 0.0) {
                errors.push_back({prefix + ".default_prices." + code, "Must be positive"});
            }
        }
        if (cfg.database_name.empty()) {
            errors.push_back({prefix + ".database_name", "Must not be empty"});
        }
    }

    for (RuleKey key : {RuleKey::HSI_OPTIONS, RuleKey::HSCEI_OPTIONS, RuleKey::US_DEFAULT,
                        RuleKey::HK_DEFAULT}) {
        const auto& r = thresholds.rule(key);
        const std::string field = "thresholds." + rule_key_to_string(key);
        if (r.min_volume < 0 || r.min_turnover < 0.0 || r.min_volume_delta < 0) {
            errors.push_back({field, "Thresholds must be non-negative"});
        }
        if (r.strike_range_fraction <= 0.0) {
            errors.push_back({field + ".price_range", "Must be positive"});
        }
    }

    if (scheduler.min_api_interval.count() < 0) {
        errors.push_back({"scheduler.min_api_interval_ms", "Must be non-negative"});
    }
    if (scheduler.scan_interval_single.count() <= 0 || scheduler.scan_interval_multi.count() <= 0) {
        errors.push_back({"scheduler.scan_interval", "Must be positive"});
    }
    if (scheduler.turn_poll_interval.count() <= 0) {
        errors.push_back({"scheduler.turn_poll_interval_ms", "Must be positive"});
    }
    if (scheduler.max_wait_cycles <= 0) {
        errors.push_back({"scheduler.max_wait_cycles", "Must be positive"});
    }
    if (scheduler.recovery_interval.count() <= 0) {
        errors.push_back({"scheduler.recovery_interval_ms", "Must be positive"});
    }

    if (retry.max_retries < 1) {
        errors.push_back({"retry.max_retries", "Must be at least 1"});
    }
    if (retry.delay.count() < 0) {
        errors.push_back({"retry.delay_ms", "Must be non-negative"});
    }

    if (scanner.expiry_window_days < 0) {
        errors.push_back({"scanner.expiry_window_days", "Must be non-negative"});
    }
    if (scanner.fallback_expiry_count == 0) {
        errors.push_back({"scanner.fallback_expiry_count", "Must be positive"});
    }

    if (notification.webhook_enabled && notification.webhook.url.empty()) {
        errors.push_back({"notification.webhook.url", "Required when webhook is enabled"});
    }

    return errors;
}

}  // namespace optwatch
