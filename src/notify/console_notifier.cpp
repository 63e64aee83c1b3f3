// src/notify/console_notifier.cpp

#include "optwatch/notify/console_notifier.hpp"
#include "optwatch/core/logger.hpp"
#include "optwatch/notify/summary_formatter.hpp"

namespace optwatch {

Result<void> ConsoleNotifier::notify(const TradeSummary& summary) {
    if (!summary.trades.empty()) {
        INFO("\n" << SummaryFormatter::format(summary));
    }
    return Result<void>();
}

}  // namespace optwatch
