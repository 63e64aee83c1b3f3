// include/optwatch/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace optwatch {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

using Price = double;

/**
 * @brief Cumulative daily counters (volume, open interest) reported by the API
 */
using Count = int64_t;

/**
 * @brief Markets the monitor can poll
 */
enum class Market {
    HK,
    US
};

inline std::string market_to_string(Market market) {
    switch (market) {
        case Market::HK:
            return "HK";
        case Market::US:
            return "US";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Parse a market prefix ("HK", "US")
 * @return true on success
 */
inline bool market_from_string(const std::string& text, Market& out) {
    if (text == "HK") {
        out = Market::HK;
        return true;
    }
    if (text == "US") {
        out = Market::US;
        return true;
    }
    return false;
}

enum class OptionClass {
    CALL,
    PUT,
    UNKNOWN
};

inline std::string option_class_to_string(OptionClass option_class) {
    switch (option_class) {
        case OptionClass::CALL:
            return "CALL";
        case OptionClass::PUT:
            return "PUT";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief One row of an options market snapshot, typed at the API boundary
 */
struct OptionSnapshot {
    std::string underlying_code;  // e.g. "HK.00700"
    std::string option_code;      // e.g. "HK.TCH250919C650000"
    Price last_price{0.0};
    Count volume{0};            // cumulative for the trading day
    double turnover{0.0};       // cumulative for the trading day
    double change_rate{0.0};    // percent
    Count open_interest{0};     // cumulative
    Count net_open_interest{0};
    Price api_strike_price{0.0};     // 0 when the API did not report it
    std::string api_option_type;     // "CALL"/"PUT" or empty
    std::string update_time;
    Timestamp observed_at;
};

/**
 * @brief Last price of an underlying, as quoted or as configured fallback
 */
struct UnderlyingQuote {
    std::string code;
    std::string name;
    Price last_price{0.0};
    Timestamp observed_at;
    bool from_fallback{false};
};

/**
 * @brief One contract listed in an option chain
 */
struct ChainEntry {
    std::string option_code;
    Price strike_price{0.0};
};

/**
 * @brief A snapshot enriched with everything needed to classify and persist it
 */
struct TradeEvent {
    OptionSnapshot snapshot;
    Market market{Market::HK};

    // Resolved contract terms
    Price strike_price{0.0};
    OptionClass option_class{OptionClass::UNKNOWN};
    std::string expiry_date;  // YYYY-MM-DD, empty when unknown

    // Underlying context
    Price underlying_price{0.0};
    std::string underlying_name;
    Price strike_distance{0.0};      // strike - underlying
    double strike_distance_pct{0.0};

    // Deltas against the previous observation this trading day
    Count previous_volume{0};
    Count volume_delta{0};
    Count open_interest_delta{0};
    Count net_open_interest_delta{0};

    bool is_big_trade{false};
};

}  // namespace optwatch
