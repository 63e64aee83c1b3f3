// include/optwatch/notify/summary_formatter.hpp
#pragma once

#include <string>
#include "optwatch/notify/notifier.hpp"

namespace optwatch {

/**
 * @brief Renders a TradeSummary as a plain-text report
 *
 * Trades are grouped by underlying, groups ordered by total turnover, and each
 * group lists its top kTopPerUnderlying trades with volume and open interest
 * changes.
 */
class SummaryFormatter {
public:
    static constexpr size_t kTopPerUnderlying = 3;
    static constexpr double kNotableTurnover = 1000000.0;

    static std::string format(const TradeSummary& summary);

    /**
     * @brief 1234567 -> "1,234,567"
     */
    static std::string group_thousands(long long value);

    static std::string currency_for(Market market);
};

}  // namespace optwatch
