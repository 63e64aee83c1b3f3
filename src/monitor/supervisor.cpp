// src/monitor/supervisor.cpp

#include "optwatch/monitor/supervisor.hpp"
#include <sstream>
#include <stdexcept>
#include "optwatch/core/logger.hpp"
#include "optwatch/scheduling/sliced_sleep.hpp"

namespace optwatch {

namespace {
const std::string kSupervisorId = "SUPERVISOR";
}

MultiMarketMonitor::MultiMarketMonitor(SchedulerConfig scheduler)
    : scheduler_(std::move(scheduler)) {}

MultiMarketMonitor::~MultiMarketMonitor() {
    stop();
}

void MultiMarketMonitor::add_worker(std::shared_ptr<MarketWorker> worker) {
    if (!worker) {
        throw std::invalid_argument("Cannot supervise a null worker");
    }
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto slot = std::make_unique<WorkerSlot>();
    slot->worker = std::move(worker);
    slots_.push_back(std::move(slot));
}

size_t MultiMarketMonitor::worker_count() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return slots_.size();
}

void MultiMarketMonitor::set_health(ComponentState state, const std::string& message) {
    report_health(kSupervisorId, state, message);
}

std::string MultiMarketMonitor::describe_worker(const MarketWorker& worker, bool thread_alive) {
    std::ostringstream out;
    out << market_to_string(worker.market()) << " "
        << (worker.in_trading_hours() ? "trading" : "closed") << ", thread "
        << (thread_alive ? "alive" : "finished");

    auto health = StateManager::instance().get_state(worker.component_id());
    if (health.is_error()) {
        out << ", no health published";
        return out.str();
    }

    const ComponentInfo& info = health.value();
    auto metric = [&info](const std::string& name) {
        auto it = info.metrics.find(name);
        return it == info.metrics.end() ? 0L : static_cast<long>(it->second);
    };

    out << ", " << component_state_to_string(info.state);
    if (!info.error_message.empty()) {
        out << " (" << info.error_message << ")";
    }
    out << ", " << metric("iterations") << " iterations, " << metric("scans_completed")
        << " scans, " << metric("scans_failed") << " failures, " << metric("big_trades_total")
        << " big trades, last " << worker.last_outcome();
    return out.str();
}

void MultiMarketMonitor::launch(WorkerSlot& slot) {
    slot.finished = false;
    std::shared_ptr<MarketWorker> worker = slot.worker;
    std::atomic<bool>* finished = &slot.finished;
    slot.thread = std::thread([this, worker, finished] {
        try {
            worker->run(running_);
        } catch (const std::exception& e) {
            ERROR("Worker " << market_to_string(worker->market())
                            << " terminated: " << e.what());
        }
        *finished = true;
    });
}

Result<void> MultiMarketMonitor::start() {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    if (slots_.empty()) {
        return make_error<void>(ErrorCode::CONFIG_ERROR, "No enabled market to monitor",
                                "MultiMarketMonitor");
    }
    if (running_.exchange(true)) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Monitor is already running",
                                "MultiMarketMonitor");
    }

    ComponentInfo info{ComponentType::SUPERVISOR, ComponentState::INITIALIZED, kSupervisorId, "",
                       std::chrono::system_clock::now(), {}};
    if (StateManager::instance().register_component(info).is_error()) {
        set_health(ComponentState::INITIALIZED);
    }
    set_health(ComponentState::RUNNING);

    for (auto& slot : slots_) {
        INFO("Starting " << market_to_string(slot->worker->market()) << " worker");
        launch(*slot);
    }
    INFO("Monitoring " << slots_.size() << " market(s)");
    return Result<void>();
}

size_t MultiMarketMonitor::check_workers() {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    size_t restarted = 0;
    for (auto& slot : slots_) {
        const bool alive = slot->thread.joinable() && !slot->finished.load();
        INFO("Status " << describe_worker(*slot->worker, alive));

        if (alive || !running_.load()) {
            continue;
        }
        if (slot->thread.joinable()) {
            slot->thread.join();
        }
        WARN("Restarting " << market_to_string(slot->worker->market()) << " worker");
        launch(*slot);
        ++restarted;
        ++restarts_;
    }
    if (!StateManager::instance().is_healthy()) {
        WARN("Not every component is healthy");
    }
    return restarted;
}

void MultiMarketMonitor::run_until(const std::atomic<bool>& stop_requested) {
    Logger::register_component("Supervisor");
    auto next_status = std::chrono::steady_clock::now() + scheduler_.status_interval;

    while (running_.load() && !stop_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() >= next_status) {
            check_workers();
            next_status = std::chrono::steady_clock::now() + scheduler_.status_interval;
        }
    }

    if (stop_requested.load()) {
        INFO("Shutdown requested");
    }
    stop();
}

void MultiMarketMonitor::stop() {
    const bool was_running = running_.exchange(false);

    std::lock_guard<std::mutex> lock(slots_mutex_);
    for (auto& slot : slots_) {
        if (slot->thread.joinable()) {
            slot->thread.join();
        }
    }
    if (was_running) {
        set_health(ComponentState::STOPPED);
        INFO("All market workers stopped");
    }
}

}  // namespace optwatch
