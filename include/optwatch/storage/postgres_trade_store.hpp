// include/optwatch/storage/postgres_trade_store.hpp

#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "optwatch/core/error.hpp"
#include "optwatch/core/types.hpp"
#include "optwatch/storage/option_trade_store.hpp"

namespace optwatch {

/**
 * @brief OptionTradeStore on PostgreSQL
 *
 * One instance per market, each with its own connection. Calls on an instance
 * are serialized.
 */
class PostgresTradeStore : public OptionTradeStore {
public:
    /**
     * @param connection_string libpq connection string
     * @param market Market whose rows this store writes
     */
    PostgresTradeStore(std::string connection_string, Market market);

    ~PostgresTradeStore() override;

    PostgresTradeStore(const PostgresTradeStore&) = delete;
    PostgresTradeStore& operator=(const PostgresTradeStore&) = delete;
    PostgresTradeStore(PostgresTradeStore&&) = delete;
    PostgresTradeStore& operator=(PostgresTradeStore&&) = delete;

    Result<void> connect();
    void disconnect();
    bool is_connected() const;

    /**
     * @brief Create the option_trades and underlying_quotes tables if missing
     */
    Result<void> ensure_schema();

    Result<void> save_trade(const TradeEvent& event, const std::string& trading_day) override;

    Result<Count> get_previous_volume(const std::string& option_code,
                                      const std::string& trading_day) override;

    Result<OpenInterestPair> get_previous_open_interest(const std::string& option_code,
                                                        const std::string& trading_day) override;

    Result<std::unordered_map<std::string, Count>> get_today_volumes(
        const std::string& trading_day) override;

    Result<void> save_underlying_quote(Market market, const UnderlyingQuote& quote) override;

private:
    Result<void> validate_connection() const;
    std::string format_timestamp(const Timestamp& ts) const;

    std::string connection_string_;
    Market market_;
    std::unique_ptr<pqxx::connection> connection_;
    std::string component_id_;
    mutable std::mutex mutex_;
};

}  // namespace optwatch
