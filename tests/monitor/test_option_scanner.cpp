#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "../mocks/test_doubles.hpp"
#include "optwatch/monitor/option_scanner.hpp"

using namespace optwatch;
using namespace optwatch::testing;

namespace {

// Monday 2025-09-01 11:00 Hong Kong time
const Timestamp kMondayMorning = std::chrono::system_clock::from_time_t(1756695600);

const std::string kCall600 = "HK.TCH250929C600000";
const std::string kCall650 = "HK.TCH250929C650000";
const std::string kPut550 = "HK.TCH250929P550000";
const std::string kPut400 = "HK.TCH250929P400000";
const std::string kCall900 = "HK.TCH250929C900000";

}  // namespace

class OptionScannerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        now = kMondayMorning;

        client = std::make_shared<FakeMarketDataClient>();
        store = std::make_shared<InMemoryTradeStore>();
        notifier = std::make_shared<RecordingNotifier>();
        calendar = std::make_shared<TradingCalendar>(CalendarSettings::hong_kong());

        client->set_underlying("HK.00700", "TENCENT", 600.0);
        client->set_expiries("HK.00700",
                             {"2025-08-28", "2025-09-29", "2025-10-30", "2025-12-30"});
        client->add_option("HK.00700", "2025-09-29",
                           {kPut400, 400.0, "PUT", 0.1, 20, 2000.0, 300, 5});
        client->add_option("HK.00700", "2025-09-29",
                           {kPut550, 550.0, "PUT", 1.2, 0, 0.0, 800, 0});
        client->add_option("HK.00700", "2025-09-29",
                           {kCall600, 600.0, "CALL", 8.0, 5, 1000.0, 1200, -3});
        client->add_option("HK.00700", "2025-09-29",
                           {kCall650, 650.0, "CALL", 2.4, 500, 120000.0, 4000, 60});
        client->add_option("HK.00700", "2025-09-29",
                           {kCall900, 900.0, "CALL", 0.01, 900, 900000.0, 100, 0});

        market.market = Market::HK;
        market.underlyings = {"HK.00700"};
        market.calendar = CalendarSettings::hong_kong();
        market.database_name = "hk_options";

        settings.api_pacing = std::chrono::milliseconds(0);
        retry.max_retries = 2;
        retry.delay = std::chrono::milliseconds(0);
    }

    std::shared_ptr<OptionScanner> make_scanner(bool with_store = true) {
        deps.client = client;
        deps.store = with_store ? std::shared_ptr<OptionTradeStore>(store) : nullptr;
        auto day_calendar = calendar;
        Timestamp* clock = &now;
        deps.tracker = std::make_shared<DeltaTracker>(
            deps.store, [day_calendar, clock] { return day_calendar->trading_day_key(*clock); });
        deps.classifier = std::make_shared<BigTradeClassifier>(ThresholdTable());
        deps.notifier = notifier;
        deps.calendar = calendar;
        return std::make_shared<OptionScanner>(market, settings, retry, deps,
                                               [clock] { return *clock; });
    }

    Timestamp now;
    std::shared_ptr<FakeMarketDataClient> client;
    std::shared_ptr<InMemoryTradeStore> store;
    std::shared_ptr<RecordingNotifier> notifier;
    std::shared_ptr<TradingCalendar> calendar;
    MarketConfig market;
    ScannerConfig settings;
    RetryPolicy retry;
    ScannerDependencies deps;
};

TEST_F(OptionScannerTest, ScanPersistsAndAnnouncesBigTrades) {
    auto scanner = make_scanner();
    auto result = scanner->scan();
    ASSERT_TRUE(result.is_ok());
    const ScanReport& report = result.value();

    EXPECT_EQ(report.market, Market::HK);
    EXPECT_EQ(report.underlyings_scanned, 1u);
    EXPECT_EQ(report.options_selected, 4u);
    EXPECT_EQ(report.options_quoted, 4u);
    EXPECT_EQ(report.rows_persisted, 3u);
    EXPECT_EQ(report.big_trades, 1u);
    EXPECT_EQ(report.notified, 1u);

    EXPECT_EQ(client->chain_requests,
              std::vector<std::string>{"HK.00700|2025-09-29|2025-09-29"});
    EXPECT_EQ(std::count(client->last_snapshot_codes.begin(), client->last_snapshot_codes.end(),
                         kCall900),
              0);

    ASSERT_EQ(store->saved.size(), 3u);
    EXPECT_EQ(store->days.front(), "2025-09-01");
    ASSERT_EQ(store->quotes.size(), 1u);
    EXPECT_EQ(store->quotes.front().name, "TENCENT");

    ASSERT_EQ(notifier->summaries.size(), 1u);
    const TradeSummary& summary = notifier->summaries.front();
    ASSERT_EQ(summary.trades.size(), 1u);
    const TradeEvent& trade = summary.trades.front();
    EXPECT_EQ(trade.snapshot.option_code, kCall650);
    EXPECT_EQ(trade.snapshot.underlying_code, "HK.00700");
    EXPECT_EQ(trade.underlying_name, "TENCENT");
    EXPECT_EQ(trade.volume_delta, 500);
    EXPECT_EQ(trade.option_class, OptionClass::CALL);
    EXPECT_DOUBLE_EQ(trade.strike_distance, 50.0);
    EXPECT_TRUE(trade.is_big_trade);
}

TEST_F(OptionScannerTest, RepeatedScanAnnouncesOnlyNewVolume) {
    auto scanner = make_scanner();
    ASSERT_TRUE(scanner->scan().is_ok());

    auto unchanged = scanner->scan();
    ASSERT_TRUE(unchanged.is_ok());
    EXPECT_EQ(unchanged.value().big_trades, 0u);
    EXPECT_EQ(notifier->summaries.size(), 1u);

    client->update_option(kCall650, 900, 210000.0, 4300, 75);
    auto grown = scanner->scan();
    ASSERT_TRUE(grown.is_ok());
    EXPECT_EQ(grown.value().big_trades, 1u);
    ASSERT_EQ(notifier->summaries.size(), 2u);
    const TradeEvent& trade = notifier->summaries.back().trades.front();
    EXPECT_EQ(trade.previous_volume, 500);
    EXPECT_EQ(trade.volume_delta, 400);
    EXPECT_EQ(trade.open_interest_delta, 300);
    EXPECT_EQ(trade.net_open_interest_delta, 15);
}

TEST_F(OptionScannerTest, RestartedScannerContinuesFromStoredVolumes) {
    ASSERT_TRUE(make_scanner()->scan().is_ok());

    client->update_option(kCall650, 530, 127000.0, 4000, 60);
    auto restarted = make_scanner();
    auto result = restarted->scan();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().big_trades, 1u);
    EXPECT_EQ(store->saved.back().previous_volume, 500);
}

TEST_F(OptionScannerTest, PersistenceFailureDoesNotStopScan) {
    store->fail_writes = true;
    auto result = make_scanner()->scan();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().rows_persisted, 0u);
    EXPECT_EQ(result.value().persist_failures, 3u);
    EXPECT_EQ(result.value().notified, 1u);
}

TEST_F(OptionScannerTest, ScanWithoutStoreOrNotifierDelivery) {
    notifier->fail = true;
    auto result = make_scanner(false)->scan();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().rows_persisted, 0u);
    EXPECT_EQ(result.value().big_trades, 1u);
    EXPECT_EQ(result.value().notified, 0u);
    EXPECT_TRUE(store->saved.empty());
}

TEST_F(OptionScannerTest, ContractTermsFallBackToCode) {
    client->report_api_terms = false;
    auto result = make_scanner()->scan();
    ASSERT_TRUE(result.is_ok());

    auto it = std::find_if(store->saved.begin(), store->saved.end(), [](const TradeEvent& e) {
        return e.snapshot.option_code == kPut400;
    });
    ASSERT_NE(it, store->saved.end());
    EXPECT_DOUBLE_EQ(it->strike_price, 400.0);
    EXPECT_EQ(it->option_class, OptionClass::PUT);
    EXPECT_EQ(it->expiry_date, "2025-09-29");
}

TEST_F(OptionScannerTest, OptionSnapshotFailureIsReported) {
    client->option_snapshot_failures = 5;
    auto result = make_scanner()->scan();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::RETRIES_EXHAUSTED);
    EXPECT_TRUE(store->saved.empty());
}

TEST_F(OptionScannerTest, TransientSnapshotFailureIsRetried) {
    client->option_snapshot_failures = 1;
    auto result = make_scanner()->scan();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().options_quoted, 4u);
}

TEST_F(OptionScannerTest, ExpiryFailureSkipsUnderlying) {
    client->fail_expiries = true;
    auto result = make_scanner()->scan();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().underlyings_skipped, 1u);
    EXPECT_EQ(result.value().options_selected, 0u);
    EXPECT_EQ(client->expiry_calls, 2u);
    EXPECT_EQ(client->chain_calls, 0u);
}

TEST_F(OptionScannerTest, SelectsExpiriesWithinWindow) {
    auto scanner = make_scanner();
    EXPECT_EQ(scanner->select_expiries({"2025-08-29", "2025-09-01", "2025-09-30", "2025-10-01",
                                        "2025-10-02", "bad"},
                                       now),
              (std::vector<std::string>{"2025-09-01", "2025-09-30", "2025-10-01"}));
}

TEST_F(OptionScannerTest, FarExpiriesFallBackToFirstFew) {
    auto scanner = make_scanner();
    EXPECT_EQ(scanner->select_expiries({"2025-12-30", "2026-01-29", "2026-03-30", "2026-06-29"},
                                       now),
              (std::vector<std::string>{"2025-12-30", "2026-01-29", "2026-03-30"}));
    EXPECT_TRUE(scanner->select_expiries({}, now).empty());
}

TEST_F(OptionScannerTest, QuoteFallsBackToCacheThenDefault) {
    market.default_prices["HK.00700"] = 580.0;
    auto scanner = make_scanner();

    auto live = scanner->fetch_underlying_quotes(now);
    ASSERT_EQ(live.count("HK.00700"), 1u);
    EXPECT_DOUBLE_EQ(live.at("HK.00700").last_price, 600.0);
    EXPECT_FALSE(live.at("HK.00700").from_fallback);

    client->fail_underlying_snapshots = true;
    auto cached = scanner->fetch_underlying_quotes(now + std::chrono::seconds(120));
    EXPECT_DOUBLE_EQ(cached.at("HK.00700").last_price, 600.0);
    EXPECT_FALSE(cached.at("HK.00700").from_fallback);

    auto fallback = scanner->fetch_underlying_quotes(now + std::chrono::seconds(400));
    EXPECT_DOUBLE_EQ(fallback.at("HK.00700").last_price, 580.0);
    EXPECT_TRUE(fallback.at("HK.00700").from_fallback);
    EXPECT_EQ(store->quotes.size(), 1u);
}

TEST_F(OptionScannerTest, UnderlyingWithoutAnyPriceIsSkipped) {
    client->fail_underlying_snapshots = true;
    auto result = make_scanner()->scan();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().underlyings_skipped, 1u);
    EXPECT_EQ(client->expiry_calls, 0u);
    EXPECT_TRUE(notifier->summaries.empty());
}

TEST_F(OptionScannerTest, BuildEventUsesApiTermsWhenPresent) {
    auto scanner = make_scanner();
    UnderlyingQuote quote;
    quote.code = "HK.00700";
    quote.name = "TENCENT";
    quote.last_price = 600.0;

    OptionSnapshot snapshot;
    snapshot.option_code = kCall650;
    snapshot.api_strike_price = 660.0;
    snapshot.api_option_type = "";

    TradeEvent event = scanner->build_event(snapshot, quote);
    EXPECT_DOUBLE_EQ(event.strike_price, 660.0);
    EXPECT_EQ(event.option_class, OptionClass::CALL);
    EXPECT_DOUBLE_EQ(event.strike_distance, 60.0);
    EXPECT_DOUBLE_EQ(event.strike_distance_pct, 10.0);
    EXPECT_EQ(event.expiry_date, "2025-09-29");

    snapshot.option_code = "HK.GARBAGE";
    snapshot.api_strike_price = 0.0;
    TradeEvent unknown = scanner->build_event(snapshot, quote);
    EXPECT_EQ(unknown.option_class, OptionClass::UNKNOWN);
    EXPECT_DOUBLE_EQ(unknown.strike_distance, 0.0);
}

TEST_F(OptionScannerTest, ClearedRunningFlagStopsScan) {
    std::atomic<bool> running{false};
    auto result = make_scanner()->scan(&running);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().underlyings_scanned, 0u);
    EXPECT_EQ(client->expiry_calls, 0u);
}

TEST_F(OptionScannerTest, RequiresCollaborators) {
    deps.client = client;
    deps.calendar = calendar;
    EXPECT_THROW(OptionScanner(market, settings, retry, deps), std::invalid_argument);
}
