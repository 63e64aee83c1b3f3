// include/optwatch/notify/notifier.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "optwatch/core/error.hpp"
#include "optwatch/core/types.hpp"

namespace optwatch {

/**
 * @brief One scan's worth of announced big trades
 */
struct TradeSummary {
    Market market{Market::HK};
    Timestamp generated_at;
    std::vector<TradeEvent> trades;  // announced this scan, by turnover descending
    size_t big_trades_seen{0};       // including ones suppressed as duplicates
};

class Notifier {
public:
    virtual ~Notifier() = default;

    virtual Result<void> notify(const TradeSummary& summary) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Fans a summary out to several notifiers
 *
 * Each failure is logged. Succeeds when at least one notifier succeeded.
 */
class CompositeNotifier : public Notifier {
public:
    CompositeNotifier() = default;
    explicit CompositeNotifier(std::vector<std::shared_ptr<Notifier>> notifiers);

    void add(std::shared_ptr<Notifier> notifier);

    size_t size() const {
        return notifiers_.size();
    }

    Result<void> notify(const TradeSummary& summary) override;

    std::string name() const override {
        return "composite";
    }

private:
    std::vector<std::shared_ptr<Notifier>> notifiers_;
};

}  // namespace optwatch
