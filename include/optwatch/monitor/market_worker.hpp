// include/optwatch/monitor/market_worker.hpp
#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "optwatch/calendar/trading_calendar.hpp"
#include "optwatch/config/monitor_config.hpp"
#include "optwatch/core/state_manager.hpp"
#include "optwatch/monitor/option_scanner.hpp"
#include "optwatch/scheduling/turn_coordinator.hpp"

namespace optwatch {

enum class IterationOutcome {
    SCANNED,
    SCAN_FAILED,
    OFF_HOURS,
    TURN_TIMEOUT,
    STOPPED
};

inline std::string iteration_outcome_to_string(IterationOutcome outcome) {
    switch (outcome) {
        case IterationOutcome::SCANNED:
            return "SCANNED";
        case IterationOutcome::SCAN_FAILED:
            return "SCAN_FAILED";
        case IterationOutcome::OFF_HOURS:
            return "OFF_HOURS";
        case IterationOutcome::TURN_TIMEOUT:
            return "TURN_TIMEOUT";
        case IterationOutcome::STOPPED:
            return "STOPPED";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Polling loop of one market
 *
 * Each iteration checks trading hours, waits for the shared API turn and
 * the per-market cooldown, runs one scan under a TurnLease, then sleeps the
 * scan interval (single or multi market). Exceptions escaping a scan are
 * logged and followed by the recovery interval. A worker that is not the
 * first market to register delays its first iteration by the stagger delay.
 * State and counters are published to the StateManager after every iteration.
 */
class MarketWorker {
public:
    using NowSupplier = std::function<Timestamp()>;

    MarketWorker(Market market, std::shared_ptr<OptionScanner> scanner,
                 std::shared_ptr<const TradingCalendar> calendar, TurnCoordinator& coordinator,
                 SchedulerConfig scheduler, bool monitor_off_hours,
                 NowSupplier now = NowSupplier());
    virtual ~MarketWorker() = default;

    MarketWorker(const MarketWorker&) = delete;
    MarketWorker& operator=(const MarketWorker&) = delete;

    /**
     * @brief Loop until running is cleared. Registers with the coordinator for its duration.
     */
    virtual void run(const std::atomic<bool>& running);

    /**
     * @brief One iteration without the trailing sleep. Caller must be registered.
     */
    IterationOutcome run_once(const std::atomic<bool>* running = nullptr);

    /**
     * @brief Inter-scan sleep for the current number of active markets
     */
    std::chrono::milliseconds scan_interval() const;

    Market market() const {
        return market_;
    }

    std::string component_id() const {
        return "WORKER_" + market_to_string(market_);
    }

    bool in_trading_hours() const {
        return calendar_->is_trading_time(now_());
    }

    std::string last_outcome() const;

    size_t scans_completed() const {
        return scans_completed_.load();
    }

    size_t scans_failed() const {
        return scans_failed_.load();
    }

    size_t iterations() const {
        return iterations_.load();
    }

private:
    void set_health(ComponentState state, const std::string& message = "");
    void publish_metrics(const ScanReport* report);

    Market market_;
    std::shared_ptr<OptionScanner> scanner_;
    std::shared_ptr<const TradingCalendar> calendar_;
    TurnCoordinator& coordinator_;
    SchedulerConfig scheduler_;
    bool monitor_off_hours_;
    std::atomic<bool> started_before_{false};
    NowSupplier now_;

    std::atomic<size_t> iterations_{0};
    std::atomic<size_t> scans_completed_{0};
    std::atomic<size_t> scans_failed_{0};
    std::atomic<size_t> big_trades_total_{0};

    mutable std::mutex status_mutex_;
    std::string last_outcome_{"NONE"};
};

}  // namespace optwatch
