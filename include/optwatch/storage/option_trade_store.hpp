// include/optwatch/storage/option_trade_store.hpp
#pragma once

#include <string>
#include <unordered_map>
#include "optwatch/core/error.hpp"
#include "optwatch/core/types.hpp"

namespace optwatch {

/**
 * @brief Open interest pair as last recorded for an instrument
 */
struct OpenInterestPair {
    Count open_interest{0};
    Count net_open_interest{0};
};

/**
 * @brief Durable history of observed option quotes
 *
 * Trading days are market-local YYYY-MM-DD keys. Lookups for an instrument with
 * no rows on the given day succeed with zero values.
 */
class OptionTradeStore {
public:
    virtual ~OptionTradeStore() = default;

    virtual Result<void> save_trade(const TradeEvent& event, const std::string& trading_day) = 0;

    /**
     * @brief Highest volume recorded for the instrument on the trading day
     */
    virtual Result<Count> get_previous_volume(const std::string& option_code,
                                              const std::string& trading_day) = 0;

    /**
     * @brief Open interest of the most recent row for the instrument on the trading day
     */
    virtual Result<OpenInterestPair> get_previous_open_interest(
        const std::string& option_code, const std::string& trading_day) = 0;

    /**
     * @brief Highest recorded volume per instrument for the trading day
     */
    virtual Result<std::unordered_map<std::string, Count>> get_today_volumes(
        const std::string& trading_day) = 0;

    virtual Result<void> save_underlying_quote(Market market, const UnderlyingQuote& quote) = 0;
};

}  // namespace optwatch
