// src/notify/summary_formatter.cpp

#include "optwatch/notify/summary_formatter.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include "optwatch/core/time_utils.hpp"

namespace optwatch {

constexpr size_t SummaryFormatter::kTopPerUnderlying;
constexpr double SummaryFormatter::kNotableTurnover;

namespace {

struct UnderlyingGroup {
    std::string code;
    std::string name;
    Price price{0.0};
    double turnover{0.0};
    std::vector<const TradeEvent*> trades;
};

std::string signed_grouped(long long value) {
    return (value >= 0 ? "+" : "-") + SummaryFormatter::group_thousands(std::llabs(value));
}

}  // namespace

std::string SummaryFormatter::group_thousands(long long value) {
    const bool negative = value < 0;
    std::string digits = std::to_string(negative ? -value : value);
    for (int pos = static_cast<int>(digits.size()) - 3; pos > 0; pos -= 3) {
        digits.insert(static_cast<size_t>(pos), ",");
    }
    return negative ? "-" + digits : digits;
}

std::string SummaryFormatter::currency_for(Market market) {
    return market == Market::US ? "USD" : "HKD";
}

std::string SummaryFormatter::format(const TradeSummary& summary) {
    const std::string currency = currency_for(summary.market);

    double total_turnover = 0.0;
    double notable_turnover = 0.0;
    size_t notable_count = 0;
    std::map<std::string, UnderlyingGroup> groups;

    for (const auto& trade : summary.trades) {
        total_turnover += trade.snapshot.turnover;
        if (trade.snapshot.turnover >= kNotableTurnover) {
            ++notable_count;
            notable_turnover += trade.snapshot.turnover;
        }

        UnderlyingGroup& group = groups[trade.snapshot.underlying_code];
        group.code = trade.snapshot.underlying_code;
        if (group.name.empty()) {
            group.name = trade.underlying_name.empty() ? group.code : trade.underlying_name;
        }
        if (trade.underlying_price > 0.0) {
            group.price = trade.underlying_price;
        }
        group.turnover += trade.snapshot.turnover;
        group.trades.push_back(&trade);
    }

    std::vector<UnderlyingGroup*> ordered;
    for (auto& entry : groups) {
        ordered.push_back(&entry.second);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const UnderlyingGroup* a, const UnderlyingGroup* b) {
                         return a->turnover > b->turnover;
                     });

    std::ostringstream out;
    out << std::fixed;
    out << "[" << market_to_string(summary.market) << "] Options big trade summary\n";

    const std::time_t generated = std::chrono::system_clock::to_time_t(summary.generated_at);
    std::tm local{};
    core::safe_localtime(&generated, &local);
    out << "Time: " << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "\n";

    out << "Trades: " << summary.trades.size() << " announced of " << summary.big_trades_seen
        << " big (" << notable_count << " at or above "
        << group_thousands(static_cast<long long>(kNotableTurnover)) << " " << currency << ")\n";
    out << "Turnover: " << group_thousands(std::llround(total_turnover)) << " " << currency
        << " (notable: " << group_thousands(std::llround(notable_turnover)) << " " << currency
        << ")\n";

    for (const UnderlyingGroup* group : ordered) {
        out << "\n* " << group->name << " (" << group->code << "): " << group->trades.size()
            << " trades, " << group_thousands(std::llround(group->turnover)) << " " << currency;
        if (group->price > 0.0) {
            out << " (price " << std::setprecision(2) << group->price << ")";
        }
        out << "\n";

        std::vector<const TradeEvent*> top = group->trades;
        std::stable_sort(top.begin(), top.end(), [](const TradeEvent* a, const TradeEvent* b) {
            return a->snapshot.turnover > b->snapshot.turnover;
        });
        if (top.size() > kTopPerUnderlying) {
            top.resize(kTopPerUnderlying);
        }

        int rank = 1;
        for (const TradeEvent* trade : top) {
            out << "  " << rank++ << ". " << trade->snapshot.option_code << ": "
                << option_class_to_string(trade->option_class) << " " << std::setprecision(2)
                << trade->strike_price << ", " << std::setprecision(3)
                << trade->snapshot.last_price << " x " << group_thousands(trade->snapshot.volume)
                << " (" << signed_grouped(trade->volume_delta) << "), " << std::setprecision(1)
                << trade->snapshot.turnover / 1000.0 << "k"
                << ", OI " << group_thousands(trade->snapshot.open_interest) << " ("
                << signed_grouped(trade->open_interest_delta) << "), net OI "
                << group_thousands(trade->snapshot.net_open_interest) << " ("
                << signed_grouped(trade->net_open_interest_delta) << ")\n";
        }
    }

    return out.str();
}

}  // namespace optwatch
