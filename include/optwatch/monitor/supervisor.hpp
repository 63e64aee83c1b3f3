// include/optwatch/monitor/supervisor.hpp
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "optwatch/config/monitor_config.hpp"
#include "optwatch/core/error.hpp"
#include "optwatch/monitor/market_worker.hpp"

namespace optwatch {

/**
 * @brief Runs one thread per market worker and keeps them alive
 *
 * Every status interval the supervisor logs each market's health as
 * published to the StateManager and restarts workers whose thread has
 * finished while the monitor is still running.
 */
class MultiMarketMonitor {
public:
    explicit MultiMarketMonitor(SchedulerConfig scheduler);
    ~MultiMarketMonitor();

    MultiMarketMonitor(const MultiMarketMonitor&) = delete;
    MultiMarketMonitor& operator=(const MultiMarketMonitor&) = delete;

    void add_worker(std::shared_ptr<MarketWorker> worker);

    /**
     * @brief Start every worker thread
     * @return CONFIG_ERROR if no worker was added, NOT_INITIALIZED if already running
     */
    Result<void> start();

    /**
     * @brief Supervise until stop_requested is set or stop() is called, then stop
     */
    void run_until(const std::atomic<bool>& stop_requested);

    /**
     * @brief Log status and restart finished workers
     * @return Number of workers restarted
     */
    size_t check_workers();

    /**
     * @brief Status line of one worker from its StateManager entry
     */
    static std::string describe_worker(const MarketWorker& worker, bool thread_alive);

    /**
     * @brief Clear the running flag and join every worker thread
     */
    void stop();

    bool is_running() const {
        return running_.load();
    }

    size_t worker_count() const;
    size_t restart_count() const {
        return restarts_.load();
    }

private:
    struct WorkerSlot {
        std::shared_ptr<MarketWorker> worker;
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void launch(WorkerSlot& slot);
    void set_health(ComponentState state, const std::string& message = "");

    SchedulerConfig scheduler_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> restarts_{0};
    mutable std::mutex slots_mutex_;
    std::vector<std::unique_ptr<WorkerSlot>> slots_;
};

}  // namespace optwatch
