// include/optwatch/classify/big_trade_classifier.hpp
#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>
#include "optwatch/classify/threshold_rules.hpp"
#include "optwatch/core/types.hpp"

namespace optwatch {

/**
 * @brief When an instrument was last announced, and at what cumulative volume
 */
struct NotificationRecord {
    Timestamp last_notified;
    Count volume{0};
};

/**
 * @brief Flags big trades and keeps the session's announcement history
 */
class BigTradeClassifier {
public:
    explicit BigTradeClassifier(ThresholdTable thresholds,
                                std::chrono::seconds notify_cooldown = std::chrono::seconds(0));

    /**
     * @brief True when volume, turnover and volume delta all reach the rule's floors
     */
    bool classify(const TradeEvent& event) const;

    /**
     * @brief Decide whether a big trade should be announced, and record it if so
     *
     * An instrument announced before in this session is announced again only
     * once its cumulative volume has grown past the announced volume and the
     * cooldown has elapsed.
     */
    bool should_notify(const TradeEvent& event, const Timestamp& now);

    /**
     * @brief Classify a batch, flag is_big_trade, and return the big trades by turnover
     */
    std::vector<TradeEvent> select_big_trades(std::vector<TradeEvent>& events) const;

    /**
     * @brief Big trades that pass deduplication, by turnover descending
     */
    std::vector<TradeEvent> select_notifications(const std::vector<TradeEvent>& big_trades,
                                                 const Timestamp& now);

    const ThresholdRule& rule_for(const TradeEvent& event) const;

    const ThresholdTable& thresholds() const {
        return thresholds_;
    }

    size_t notified_instruments() const {
        return history_.size();
    }

private:
    ThresholdTable thresholds_;
    std::chrono::seconds notify_cooldown_;
    std::unordered_map<std::string, NotificationRecord> history_;
};

}  // namespace optwatch
