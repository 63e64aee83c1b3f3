// include/optwatch/notify/console_notifier.hpp
#pragma once

#include "optwatch/notify/notifier.hpp"

namespace optwatch {

/**
 * @brief Writes summaries to the log
 */
class ConsoleNotifier : public Notifier {
public:
    Result<void> notify(const TradeSummary& summary) override;

    std::string name() const override {
        return "console";
    }
};

}  // namespace optwatch
