// include/optwatch/options/option_code_parser.hpp
#pragma once

#include <string>
#include "optwatch/core/types.hpp"

namespace optwatch {

/**
 * @brief Structured form of an option contract code
 *
 * All fields are zero or empty when is_valid is false.
 */
struct ParsedOptionCode {
    Market market{Market::HK};
    std::string underlying;  // ticker as embedded in the code, e.g. "TCH", "AAPL"
    Price strike_price{0.0};
    OptionClass option_class{OptionClass::UNKNOWN};
    std::string expiry_date;  // YYYY-MM-DD
    bool is_valid{false};
};

/**
 * @brief Decodes contract codes of the form <MARKET>.<TICKER><YYMMDD><C|P><STRIKE>
 *
 * Examples: HK.TCH250919C650000, US.AAPL250926C155000. The strike numeral is
 * zero-padded with three implied decimals, so 650000 is 650.0 and 002500 is 2.5.
 * Parsing never throws.
 */
class OptionCodeParser {
public:
    static ParsedOptionCode parse(const std::string& code);

    /**
     * @brief Encode a strike back into its numeral
     * @param strike Strike price
     * @param width Minimum number of digits, zero-padded on the left
     */
    static std::string format_strike(Price strike, size_t width = 6);

    /**
     * @brief Compose a contract code from its parts
     * @param expiry_date YYYY-MM-DD within 2000-2099
     * @return Empty string when expiry_date or option_class cannot be encoded
     */
    static std::string format_code(Market market, const std::string& ticker,
                                   const std::string& expiry_date, OptionClass option_class,
                                   Price strike, size_t strike_width = 6);
};

}  // namespace optwatch
