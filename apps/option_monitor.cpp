#include <atomic>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include "optwatch/calendar/trading_calendar.hpp"
#include "optwatch/classify/big_trade_classifier.hpp"
#include "optwatch/config/credential_store.hpp"
#include "optwatch/config/monitor_config.hpp"
#include "optwatch/core/holiday_checker.hpp"
#include "optwatch/core/logger.hpp"
#include "optwatch/marketdata/rest_market_data_client.hpp"
#include "optwatch/monitor/market_worker.hpp"
#include "optwatch/monitor/option_scanner.hpp"
#include "optwatch/monitor/supervisor.hpp"
#include "optwatch/notify/console_notifier.hpp"
#include "optwatch/notify/notifier.hpp"
#include "optwatch/notify/webhook_notifier.hpp"
#include "optwatch/scheduling/turn_coordinator.hpp"
#include "optwatch/storage/postgres_trade_store.hpp"
#include "optwatch/tracking/delta_tracker.hpp"

using namespace optwatch;

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested = true;
}

std::string build_connection_string(const CredentialStore& credentials,
                                    const std::string& database_name) {
    const std::string username =
        credentials.get_with_default<std::string>("database", "username", "postgres");
    const std::string password =
        credentials.get_with_default<std::string>("database", "password", "");
    const std::string host =
        credentials.get_with_default<std::string>("database", "host", "localhost");
    auto numeric_port = credentials.get<int>("database", "port");
    const std::string port =
        numeric_port.is_ok()
            ? std::to_string(numeric_port.value())
            : credentials.get_with_default<std::string>("database", "port", "5432");

    return "postgresql://" + username + (password.empty() ? "" : ":" + password) + "@" + host +
           ":" + port + "/" + database_name;
}

std::shared_ptr<OptionTradeStore> open_store(const CredentialStore& credentials,
                                             const MarketConfig& market) {
    const std::string name = market_to_string(market.market);
    if (!credentials.has_credential("database", "host")) {
        WARN("No database configured, " << name << " runs without persistence");
        return nullptr;
    }

    auto store = std::make_shared<PostgresTradeStore>(
        build_connection_string(credentials, market.database_name), market.market);
    auto connected = store->connect();
    if (connected.is_error()) {
        ERROR("Database for " << name << " unavailable, running without persistence: "
                              << connected.error()->what());
        return nullptr;
    }
    auto schema = store->ensure_schema();
    if (schema.is_error()) {
        ERROR("Failed to prepare schema for " << name << ": " << schema.error()->what());
        return nullptr;
    }
    INFO("Connected " << name << " store to database " << market.database_name);
    return store;
}

std::shared_ptr<const TradingCalendar> make_calendar(const CalendarSettings& settings) {
    auto holidays = std::make_shared<HolidayChecker>();
    if (!settings.holiday_file.empty()) {
        auto loaded = holidays->load_file(settings.holiday_file);
        if (loaded.is_error()) {
            WARN("Holiday file not loaded: " << loaded.error()->what());
        } else {
            INFO("Loaded " << holidays->size() << " holidays from " << settings.holiday_file);
        }
    }
    return std::make_shared<TradingCalendar>(settings, holidays);
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path = "./config.json";
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else {
                std::cerr << "Invalid argument: " << arg << std::endl;
                std::cerr << "Usage: " << argv[0] << " [--config path/to/config.json]"
                          << std::endl;
                return 1;
            }
        }

        auto credentials = std::make_shared<CredentialStore>(config_path);

        MonitorConfig config;
        config.from_json(credentials->document());

        Logger::instance().initialize(config.logging);
        Logger::register_component("Main");
        INFO("Configuration loaded from " << credentials->path());

        auto problems = config.validate();
        for (const auto& problem : problems) {
            ERROR("Invalid configuration " << problem.field << ": " << problem.message);
        }
        const auto markets = config.active_markets();
        if (markets.empty()) {
            ERROR("No enabled market with underlyings configured, exiting");
            return 1;
        }
        if (!problems.empty()) {
            return 1;
        }

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        auto client = std::make_shared<RestMarketDataClient>(config.gateway);

        std::map<Market, std::shared_ptr<const TradingCalendar>> calendars;
        for (Market market : markets) {
            calendars[market] = make_calendar(config.markets.at(market).calendar);
        }

        auto notifier = std::make_shared<CompositeNotifier>();
        if (config.notification.console) {
            notifier->add(std::make_shared<ConsoleNotifier>());
        }
        if (config.notification.webhook_enabled) {
            notifier->add(std::make_shared<WebhookNotifier>(
                config.notification.webhook, [calendars](Market market) {
                    auto it = calendars.find(market);
                    return it != calendars.end() &&
                           it->second->is_trading_time(std::chrono::system_clock::now());
                }));
        }

        TurnTimings timings;
        timings.min_api_interval = config.scheduler.min_api_interval;
        timings.poll_interval = config.scheduler.turn_poll_interval;
        timings.max_wait_cycles = config.scheduler.max_wait_cycles;
        TurnCoordinator coordinator(timings);

        MultiMarketMonitor monitor(config.scheduler);
        for (Market market : markets) {
            const MarketConfig& market_config = config.markets.at(market);
            auto calendar = calendars.at(market);

            ScannerDependencies deps;
            deps.client = client;
            deps.store = open_store(*credentials, market_config);
            deps.tracker = std::make_shared<DeltaTracker>(deps.store, [calendar] {
                return calendar->trading_day_key(std::chrono::system_clock::now());
            });
            deps.classifier = std::make_shared<BigTradeClassifier>(
                config.thresholds, config.scanner.notify_cooldown);
            deps.notifier = notifier;
            deps.calendar = calendar;

            auto scanner = std::make_shared<OptionScanner>(market_config, config.scanner,
                                                           config.retry, deps);
            monitor.add_worker(std::make_shared<MarketWorker>(
                market, scanner, calendar, coordinator, config.scheduler,
                market_config.monitor_off_hours));

            INFO("Watching " << market_config.underlyings.size() << " underlyings in "
                             << market_to_string(market) << ", "
                             << calendar->describe(std::chrono::system_clock::now()));
        }

        auto started = monitor.start();
        if (started.is_error()) {
            ERROR("Failed to start monitor: " << started.error()->what());
            return 1;
        }

        monitor.run_until(g_stop_requested);
        INFO("Option monitor exited cleanly");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        if (Logger::instance().is_initialized()) {
            ERROR("Unexpected error: " << e.what());
        }
        return 1;
    }
}
