// include/optwatch/marketdata/rest_market_data_client.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "optwatch/marketdata/market_data_client.hpp"

namespace optwatch {

struct RestClientOptions {
    std::string base_url{"http://127.0.0.1:11112"};
    std::string api_key;
    long timeout_seconds{30};
};

/**
 * @brief MarketDataClient speaking JSON over HTTP to a quote gateway
 *
 * Replies have the shape {"ret_code": 0, "ret_msg": "", "data": [ {...}, ... ]}.
 * A non-zero ret_code is reported as API_ERROR with ret_msg as the message.
 */
class RestMarketDataClient : public MarketDataClient {
public:
    explicit RestMarketDataClient(RestClientOptions options);
    ~RestMarketDataClient() override;

    RestMarketDataClient(const RestMarketDataClient&) = delete;
    RestMarketDataClient& operator=(const RestMarketDataClient&) = delete;

    TableResult get_expiration_dates(const std::string& underlying_code) override;

    TableResult get_option_chain(const std::string& underlying_code, const std::string& start_date,
                                 const std::string& end_date,
                                 ChainFilter filter = ChainFilter::ALL) override;

    TableResult get_market_snapshot(const std::vector<std::string>& codes) override;

    /**
     * @brief Decode a gateway reply body into a table
     */
    static TableResult parse_reply(const std::string& body);

    /**
     * @brief Build a table from an array of JSON objects
     *
     * Columns appear in first-seen key order. A column whose non-null values are
     * all numbers becomes float64, any other column utf8. Missing keys are nulls.
     */
    static TableResult rows_to_table(const nlohmann::json& rows);

private:
    Result<std::string> perform_request(const std::string& method, const std::string& endpoint,
                                        const std::string& payload);

    std::string escape(const std::string& value) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* out);

    RestClientOptions options_;
};

}  // namespace optwatch
