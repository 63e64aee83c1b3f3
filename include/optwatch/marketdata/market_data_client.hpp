// include/optwatch/marketdata/market_data_client.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "optwatch/core/error.hpp"

namespace optwatch {

using TableResult = Result<std::shared_ptr<arrow::Table>>;

/**
 * @brief Option chain filter on contract class
 */
enum class ChainFilter {
    ALL,
    CALL,
    PUT
};

inline std::string chain_filter_to_string(ChainFilter filter) {
    switch (filter) {
        case ChainFilter::CALL:
            return "CALL";
        case ChainFilter::PUT:
            return "PUT";
        default:
            return "ALL";
    }
}

/**
 * @brief Quote gateway the monitor polls
 *
 * Every call returns the gateway's rows as an arrow table. A non-success status
 * from the gateway is reported as an API_ERROR result; transport failures as
 * CONNECTION_ERROR. An empty table is a valid reply; callers that require rows
 * treat it as a failure themselves.
 *
 * Expected columns:
 *   expiration dates: strike_time
 *   option chain:     code, strike_price, strike_time
 *   market snapshot:  code, name, last_price, volume, turnover, change_rate,
 *                     update_time, option_open_interest, option_net_open_interest,
 *                     option_strike_price, option_type
 */
class MarketDataClient {
public:
    virtual ~MarketDataClient() = default;

    virtual TableResult get_expiration_dates(const std::string& underlying_code) = 0;

    /**
     * @brief List contracts of an underlying expiring within [start_date, end_date]
     * @param start_date YYYY-MM-DD
     * @param end_date YYYY-MM-DD
     */
    virtual TableResult get_option_chain(const std::string& underlying_code,
                                         const std::string& start_date,
                                         const std::string& end_date,
                                         ChainFilter filter = ChainFilter::ALL) = 0;

    /**
     * @brief Batched quote snapshot for underlyings or option contracts
     */
    virtual TableResult get_market_snapshot(const std::vector<std::string>& codes) = 0;
};

}  // namespace optwatch
