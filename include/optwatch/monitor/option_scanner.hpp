// include/optwatch/monitor/option_scanner.hpp
#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "optwatch/calendar/trading_calendar.hpp"
#include "optwatch/classify/big_trade_classifier.hpp"
#include "optwatch/config/monitor_config.hpp"
#include "optwatch/core/error.hpp"
#include "optwatch/core/types.hpp"
#include "optwatch/marketdata/market_data_client.hpp"
#include "optwatch/notify/notifier.hpp"
#include "optwatch/scheduling/retry_invoker.hpp"
#include "optwatch/storage/option_trade_store.hpp"
#include "optwatch/tracking/delta_tracker.hpp"

namespace optwatch {

/**
 * @brief Counters of one scan pass
 */
struct ScanReport {
    Market market{Market::HK};
    size_t underlyings_scanned{0};
    size_t underlyings_skipped{0};
    size_t options_selected{0};
    size_t options_quoted{0};
    size_t rows_persisted{0};
    size_t persist_failures{0};
    size_t big_trades{0};
    size_t notified{0};
};

/**
 * @brief Collaborators a scanner works with. store and notifier may be null.
 */
struct ScannerDependencies {
    std::shared_ptr<MarketDataClient> client;
    std::shared_ptr<OptionTradeStore> store;
    std::shared_ptr<DeltaTracker> tracker;
    std::shared_ptr<BigTradeClassifier> classifier;
    std::shared_ptr<Notifier> notifier;
    std::shared_ptr<const TradingCalendar> calendar;
};

/**
 * @brief One fetch, persist and notify pass over a market's underlyings
 *
 * Quotes the underlyings, selects near expiries and strikes around the
 * underlying price, snapshots the selected options in one batch, computes
 * deltas, persists every row with volume, and announces new big trades.
 * Failures of a single underlying or row are logged and skipped.
 */
class OptionScanner {
public:
    using NowSupplier = std::function<Timestamp()>;

    OptionScanner(MarketConfig market, ScannerConfig settings, RetryPolicy retry,
                  ScannerDependencies deps, NowSupplier now = NowSupplier());

    /**
     * @brief Run one pass
     * @param running Optional flag; a cleared flag stops between API calls
     * @return Report, or the error of the batched option snapshot
     */
    Result<ScanReport> scan(const std::atomic<bool>* running = nullptr);

    /**
     * @brief Quote every configured underlying, falling back to cached then default prices
     */
    std::unordered_map<std::string, UnderlyingQuote> fetch_underlying_quotes(const Timestamp& now);

    /**
     * @brief Expiries within the window from today, else the first few listed
     */
    std::vector<std::string> select_expiries(const std::vector<std::string>& expiries,
                                             const Timestamp& now) const;

    /**
     * @brief Fill contract terms and underlying context for a snapshot row
     */
    TradeEvent build_event(const OptionSnapshot& snapshot, const UnderlyingQuote& quote) const;

    Market market() const {
        return market_.market;
    }

private:
    std::vector<std::string> collect_option_codes(const UnderlyingQuote& quote,
                                                  const Timestamp& now,
                                                  const std::atomic<bool>* running);
    bool pace(const std::atomic<bool>* running) const;
    std::string display_name(const std::string& code) const;

    MarketConfig market_;
    ScannerConfig settings_;
    RetryPolicy retry_;
    ScannerDependencies deps_;
    NowSupplier now_;
    std::unordered_map<std::string, UnderlyingQuote> price_cache_;
};

}  // namespace optwatch
