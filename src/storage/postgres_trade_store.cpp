// src/storage/postgres_trade_store.cpp

#include "optwatch/storage/postgres_trade_store.hpp"
#include <iomanip>
#include <optional>
#include <sstream>
#include "optwatch/core/logger.hpp"
#include "optwatch/core/state_manager.hpp"
#include "optwatch/core/time_utils.hpp"

namespace optwatch {

namespace {

const char* const kCreateOptionTrades = R"(
CREATE TABLE IF NOT EXISTS option_trades (
    id BIGSERIAL PRIMARY KEY,
    market VARCHAR(4) NOT NULL,
    trading_day DATE NOT NULL,
    option_code VARCHAR(64) NOT NULL,
    underlying_code VARCHAR(32) NOT NULL,
    underlying_name TEXT,
    last_price DOUBLE PRECISION,
    volume BIGINT NOT NULL,
    turnover DOUBLE PRECISION,
    change_rate DOUBLE PRECISION,
    strike_price DOUBLE PRECISION,
    option_type VARCHAR(8),
    expiry_date DATE,
    underlying_price DOUBLE PRECISION,
    strike_distance DOUBLE PRECISION,
    strike_distance_pct DOUBLE PRECISION,
    previous_volume BIGINT,
    volume_diff BIGINT,
    open_interest BIGINT,
    net_open_interest BIGINT,
    open_interest_diff BIGINT,
    net_open_interest_diff BIGINT,
    is_big_trade BOOLEAN NOT NULL DEFAULT FALSE,
    update_time TEXT,
    observed_at TIMESTAMPTZ NOT NULL
))";

const char* const kCreateOptionTradesIndex =
    "CREATE INDEX IF NOT EXISTS idx_option_trades_code_day "
    "ON option_trades (option_code, trading_day)";

const char* const kCreateUnderlyingQuotes = R"(
CREATE TABLE IF NOT EXISTS underlying_quotes (
    market VARCHAR(4) NOT NULL,
    code VARCHAR(32) NOT NULL,
    name TEXT,
    last_price DOUBLE PRECISION,
    updated_at TIMESTAMPTZ NOT NULL,
    PRIMARY KEY (market, code)
))";

}  // namespace

PostgresTradeStore::PostgresTradeStore(std::string connection_string, Market market)
    : connection_string_(std::move(connection_string)), market_(market) {}

PostgresTradeStore::~PostgresTradeStore() {
    disconnect();
}

Result<void> PostgresTradeStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresTradeStore");
        }
    } catch (const std::exception& e) {
        connection_.reset();
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresTradeStore");
    }

    std::string id = "STORE_" + market_to_string(market_);
    ComponentInfo info{ComponentType::DATABASE, ComponentState::INITIALIZED, id, "",
                       std::chrono::system_clock::now(), {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Failed to register " << id << " with StateManager: " << registered.error()->what());
    } else {
        component_id_ = id;
        report_health(component_id_, ComponentState::RUNNING);
    }

    INFO("Connected to PostgreSQL for market " << market_to_string(market_));
    return Result<void>();
}

void PostgresTradeStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_) {
        connection_->close();
        connection_.reset();

        if (!component_id_.empty()) {
            auto removed = StateManager::instance().unregister_component(component_id_);
            if (removed.is_error()) {
                DEBUG("Unregistering " << component_id_ << " skipped: " << removed.error()->what());
            }
            component_id_.clear();
        }
        INFO("Disconnected from PostgreSQL for market " << market_to_string(market_));
    }
}

bool PostgresTradeStore::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresTradeStore::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresTradeStore");
    }
    return Result<void>();
}

std::string PostgresTradeStore::format_timestamp(const Timestamp& ts) const {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info{};
    core::safe_gmtime(&time_t, &time_info);
    std::stringstream ss;
    ss << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S") << "+00";
    return ss.str();
}

Result<void> PostgresTradeStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return validation;

    try {
        pqxx::work txn(*connection_);
        txn.exec(kCreateOptionTrades);
        txn.exec(kCreateOptionTradesIndex);
        txn.exec(kCreateUnderlyingQuotes);
        txn.commit();
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to create schema: " + std::string(e.what()),
                                "PostgresTradeStore");
    }
}

Result<void> PostgresTradeStore::save_trade(const TradeEvent& event,
                                            const std::string& trading_day) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return validation;

    const std::optional<std::string> expiry =
        event.expiry_date.empty() ? std::nullopt : std::optional<std::string>(event.expiry_date);

    try {
        pqxx::work txn(*connection_);
        txn.exec_params(
            "INSERT INTO option_trades (market, trading_day, option_code, underlying_code, "
            "underlying_name, last_price, volume, turnover, change_rate, strike_price, "
            "option_type, expiry_date, underlying_price, strike_distance, strike_distance_pct, "
            "previous_volume, volume_diff, open_interest, net_open_interest, open_interest_diff, "
            "net_open_interest_diff, is_big_trade, update_time, observed_at) "
            "VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12::date, $13, $14, "
            "$15, $16, $17, $18, $19, $20, $21, $22, $23, $24::timestamptz)",
            market_to_string(event.market), trading_day, event.snapshot.option_code,
            event.snapshot.underlying_code, event.underlying_name, event.snapshot.last_price,
            event.snapshot.volume, event.snapshot.turnover, event.snapshot.change_rate,
            event.strike_price, option_class_to_string(event.option_class), expiry,
            event.underlying_price, event.strike_distance, event.strike_distance_pct,
            event.previous_volume, event.volume_delta, event.snapshot.open_interest,
            event.snapshot.net_open_interest, event.open_interest_delta,
            event.net_open_interest_delta, event.is_big_trade, event.snapshot.update_time,
            format_timestamp(event.snapshot.observed_at));
        txn.commit();
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to save " + event.snapshot.option_code + ": " + e.what(),
                                "PostgresTradeStore");
    }
}

Result<Count> PostgresTradeStore::get_previous_volume(const std::string& option_code,
                                                      const std::string& trading_day) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<Count>(validation.error()->code(), validation.error()->what(),
                                 "PostgresTradeStore");
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT COALESCE(MAX(volume), 0) FROM option_trades "
            "WHERE option_code = $1 AND trading_day = $2::date",
            option_code, trading_day);
        txn.commit();

        if (result.empty() || result[0][0].is_null()) {
            return Result<Count>(Count{0});
        }
        return Result<Count>(result[0][0].as<Count>());
    } catch (const std::exception& e) {
        return make_error<Count>(ErrorCode::DATABASE_ERROR,
                                 "Failed to read volume of " + option_code + ": " + e.what(),
                                 "PostgresTradeStore");
    }
}

Result<OpenInterestPair> PostgresTradeStore::get_previous_open_interest(
    const std::string& option_code, const std::string& trading_day) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<OpenInterestPair>(validation.error()->code(),
                                            validation.error()->what(), "PostgresTradeStore");
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT COALESCE(open_interest, 0), COALESCE(net_open_interest, 0) "
            "FROM option_trades WHERE option_code = $1 AND trading_day = $2::date "
            "ORDER BY observed_at DESC, id DESC LIMIT 1",
            option_code, trading_day);
        txn.commit();

        OpenInterestPair pair;
        if (!result.empty()) {
            pair.open_interest = result[0][0].as<Count>();
            pair.net_open_interest = result[0][1].as<Count>();
        }
        return Result<OpenInterestPair>(pair);
    } catch (const std::exception& e) {
        return make_error<OpenInterestPair>(
            ErrorCode::DATABASE_ERROR,
            "Failed to read open interest of " + option_code + ": " + e.what(),
            "PostgresTradeStore");
    }
}

Result<std::unordered_map<std::string, Count>> PostgresTradeStore::get_today_volumes(
    const std::string& trading_day) {
    using VolumeMap = std::unordered_map<std::string, Count>;

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<VolumeMap>(validation.error()->code(), validation.error()->what(),
                                     "PostgresTradeStore");
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec_params(
            "SELECT option_code, MAX(volume) FROM option_trades "
            "WHERE market = $1 AND trading_day = $2::date GROUP BY option_code",
            market_to_string(market_), trading_day);
        txn.commit();

        VolumeMap volumes;
        for (const auto& row : result) {
            volumes[row[0].as<std::string>()] = row[1].as<Count>();
        }
        return Result<VolumeMap>(std::move(volumes));
    } catch (const std::exception& e) {
        return make_error<VolumeMap>(ErrorCode::DATABASE_ERROR,
                                     "Failed to read today's volumes: " + std::string(e.what()),
                                     "PostgresTradeStore");
    }
}

Result<void> PostgresTradeStore::save_underlying_quote(Market market,
                                                       const UnderlyingQuote& quote) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return validation;

    try {
        pqxx::work txn(*connection_);
        txn.exec_params(
            "INSERT INTO underlying_quotes (market, code, name, last_price, updated_at) "
            "VALUES ($1, $2, $3, $4, $5::timestamptz) "
            "ON CONFLICT (market, code) DO UPDATE SET name = EXCLUDED.name, "
            "last_price = EXCLUDED.last_price, updated_at = EXCLUDED.updated_at",
            market_to_string(market), quote.code, quote.name, quote.last_price,
            format_timestamp(quote.observed_at));
        txn.commit();
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to save quote of " + quote.code + ": " + e.what(),
                                "PostgresTradeStore");
    }
}

}  // namespace optwatch
