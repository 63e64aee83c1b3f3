// src/monitor/market_worker.cpp

#include "optwatch/monitor/market_worker.hpp"
#include <stdexcept>
#include "optwatch/core/logger.hpp"
#include "optwatch/scheduling/sliced_sleep.hpp"

namespace optwatch {

MarketWorker::MarketWorker(Market market, std::shared_ptr<OptionScanner> scanner,
                           std::shared_ptr<const TradingCalendar> calendar,
                           TurnCoordinator& coordinator, SchedulerConfig scheduler,
                           bool monitor_off_hours, NowSupplier now)
    : market_(market),
      scanner_(std::move(scanner)),
      calendar_(std::move(calendar)),
      coordinator_(coordinator),
      scheduler_(std::move(scheduler)),
      monitor_off_hours_(monitor_off_hours),
      now_(std::move(now)) {
    if (!scanner_ || !calendar_) {
        throw std::invalid_argument("MarketWorker requires a scanner and a calendar");
    }
    if (!now_) {
        now_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::chrono::milliseconds MarketWorker::scan_interval() const {
    return coordinator_.active_count() > 1 ? scheduler_.scan_interval_multi
                                           : scheduler_.scan_interval_single;
}

void MarketWorker::set_health(ComponentState state, const std::string& message) {
    report_health(component_id(), state, message);
}

void MarketWorker::publish_metrics(const ScanReport* report) {
    std::unordered_map<std::string, double> metrics = {
        {"iterations", static_cast<double>(iterations_.load())},
        {"scans_completed", static_cast<double>(scans_completed_.load())},
        {"scans_failed", static_cast<double>(scans_failed_.load())}};
    if (report) {
        big_trades_total_ += report->big_trades;
        metrics["options_quoted"] = static_cast<double>(report->options_quoted);
        metrics["rows_persisted"] = static_cast<double>(report->rows_persisted);
        metrics["persist_failures"] = static_cast<double>(report->persist_failures);
        metrics["big_trades"] = static_cast<double>(report->big_trades);
        metrics["notified"] = static_cast<double>(report->notified);
    }
    metrics["big_trades_total"] = static_cast<double>(big_trades_total_.load());

    auto result = StateManager::instance().update_metrics(component_id(), metrics);
    if (result.is_error()) {
        DEBUG("Metrics update for " << component_id() << " skipped: " << result.error()->what());
    }
}

IterationOutcome MarketWorker::run_once(const std::atomic<bool>* running) {
    ++iterations_;
    const std::string name = market_to_string(market_);
    IterationOutcome outcome = IterationOutcome::SCANNED;

    const Timestamp now = now_();
    if (!monitor_off_hours_ && !calendar_->is_trading_time(now)) {
        INFO(name << " market closed (" << calendar_->describe(now) << "), skipping scan");
        if (coordinator_.yield_turn(market_)) {
            DEBUG(name << " passed the API turn on");
        }
        outcome = IterationOutcome::OFF_HOURS;
    } else {
        const TurnOutcome turn = coordinator_.acquire_turn(market_, running);
        if (turn == TurnOutcome::TIMED_OUT) {
            WARN(name << " did not get the API turn in time, skipping this cycle");
            outcome = IterationOutcome::TURN_TIMEOUT;
        } else if (turn == TurnOutcome::STOPPED) {
            outcome = IterationOutcome::STOPPED;
        } else {
            TurnLease lease(coordinator_, market_);

            const auto wait = coordinator_.cooldown_remaining(market_);
            if (wait.count() > 0) {
                DEBUG(name << " waiting " << wait.count() << "ms for API cooldown");
            }
            if (!sleep_while_running(wait, running)) {
                outcome = IterationOutcome::STOPPED;
            } else {
                INFO(name << " got the API turn, scanning");
                auto report = scanner_->scan(running);
                lease.release();

                if (report.is_error()) {
                    ++scans_failed_;
                    ERROR(name << " scan failed: " << report.error()->what());
                    outcome = IterationOutcome::SCAN_FAILED;
                } else {
                    ++scans_completed_;
                    publish_metrics(&report.value());
                }
            }
        }
    }

    if (outcome != IterationOutcome::SCANNED) {
        publish_metrics(nullptr);
    }
    std::lock_guard<std::mutex> lock(status_mutex_);
    last_outcome_ = iteration_outcome_to_string(outcome);
    return outcome;
}

void MarketWorker::run(const std::atomic<bool>& running) {
    const std::string name = market_to_string(market_);
    Logger::register_component("Worker." + name);

    ComponentInfo info{ComponentType::MARKET_WORKER, ComponentState::INITIALIZED, component_id(),
                       "", std::chrono::system_clock::now(), {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        // still marked live by a run that ended without stopping
        DEBUG("Taking over health entry: " << registered.error()->what());
        set_health(ComponentState::STOPPED);
        set_health(ComponentState::INITIALIZED);
    }

    MarketRegistration registration(coordinator_, market_);
    INFO(name << " worker started as market " << registration.position() << " in the rotation");

    const bool first_run = !started_before_.exchange(true);
    if (first_run && registration.position() > 1 && scheduler_.stagger_delay.count() > 0) {
        INFO(name << " staggering first scan by " << scheduler_.stagger_delay.count() << "ms");
        sleep_while_running(scheduler_.stagger_delay, &running);
    }

    set_health(ComponentState::RUNNING);
    while (running.load()) {
        try {
            if (run_once(&running) == IterationOutcome::STOPPED) {
                break;
            }
            sleep_while_running(scan_interval(), &running);
        } catch (const std::exception& e) {
            ++scans_failed_;
            ERROR(name << " worker iteration failed: " << e.what() << ", recovering in "
                       << scheduler_.recovery_interval.count() << "ms");
            set_health(ComponentState::ERR_STATE, e.what());
            sleep_while_running(scheduler_.recovery_interval, &running);
            set_health(ComponentState::INITIALIZED);
            set_health(ComponentState::RUNNING);
        }
    }

    set_health(ComponentState::STOPPED);
    INFO(name << " worker stopped after " << iterations_.load() << " iterations");
}

std::string MarketWorker::last_outcome() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_outcome_;
}

}  // namespace optwatch
