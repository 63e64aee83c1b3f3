// src/classify/big_trade_classifier.cpp

#include "optwatch/classify/big_trade_classifier.hpp"
#include <algorithm>
#include "optwatch/core/logger.hpp"

namespace optwatch {

namespace {
void sort_by_turnover(std::vector<TradeEvent>& events) {
    std::stable_sort(events.begin(), events.end(), [](const TradeEvent& a, const TradeEvent& b) {
        return a.snapshot.turnover > b.snapshot.turnover;
    });
}
}  // namespace

BigTradeClassifier::BigTradeClassifier(ThresholdTable thresholds,
                                       std::chrono::seconds notify_cooldown)
    : thresholds_(std::move(thresholds)), notify_cooldown_(notify_cooldown) {}

const ThresholdRule& BigTradeClassifier::rule_for(const TradeEvent& event) const {
    return thresholds_.rule_for(event.market, event.snapshot.underlying_code);
}

bool BigTradeClassifier::classify(const TradeEvent& event) const {
    const ThresholdRule& rule = rule_for(event);
    return event.snapshot.volume >= rule.min_volume &&
           event.snapshot.turnover >= rule.min_turnover &&
           event.volume_delta >= rule.min_volume_delta;
}

bool BigTradeClassifier::should_notify(const TradeEvent& event, const Timestamp& now) {
    auto it = history_.find(event.snapshot.option_code);
    if (it != history_.end()) {
        const NotificationRecord& record = it->second;
        if (event.snapshot.volume <= record.volume) {
            DEBUG(event.snapshot.option_code << " already announced at volume " << record.volume);
            return false;
        }
        if (now - record.last_notified < notify_cooldown_) {
            DEBUG(event.snapshot.option_code << " is big again but still cooling down");
            return false;
        }
    }

    history_[event.snapshot.option_code] = NotificationRecord{now, event.snapshot.volume};
    return true;
}

std::vector<TradeEvent> BigTradeClassifier::select_big_trades(
    std::vector<TradeEvent>& events) const {
    std::vector<TradeEvent> big_trades;
    for (auto& event : events) {
        event.is_big_trade = classify(event);
        if (!event.is_big_trade) {
            continue;
        }

        const ThresholdRule& rule = rule_for(event);
        INFO("Big trade " << event.snapshot.option_code << " [" << rule_key_to_string(
                                 select_rule_key(event.market, event.snapshot.underlying_code))
                          << "] volume " << event.snapshot.volume << " (+" << event.volume_delta
                          << ", min " << rule.min_volume << "/+" << rule.min_volume_delta
                          << ") turnover " << event.snapshot.turnover << " (min "
                          << rule.min_turnover << ")");
        big_trades.push_back(event);
    }

    sort_by_turnover(big_trades);
    return big_trades;
}

std::vector<TradeEvent> BigTradeClassifier::select_notifications(
    const std::vector<TradeEvent>& big_trades, const Timestamp& now) {
    std::vector<TradeEvent> selected;
    for (const auto& event : big_trades) {
        if (should_notify(event, now)) {
            selected.push_back(event);
        }
    }
    sort_by_turnover(selected);
    return selected;
}

}  // namespace optwatch
