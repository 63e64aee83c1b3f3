// include/optwatch/scheduling/turn_coordinator.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include "optwatch/core/types.hpp"

namespace optwatch {

/**
 * @brief Outcome of a request for the shared API
 */
enum class TurnOutcome {
    ACQUIRED,   // caller holds the token and must release it
    TIMED_OUT,  // not the caller's turn within the wait bound; skip this cycle
    STOPPED     // the running flag was cleared while waiting
};

inline std::string turn_outcome_to_string(TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::ACQUIRED:
            return "ACQUIRED";
        case TurnOutcome::TIMED_OUT:
            return "TIMED_OUT";
        case TurnOutcome::STOPPED:
            return "STOPPED";
        default:
            return "UNKNOWN";
    }
}

struct TurnTimings {
    std::chrono::milliseconds min_api_interval{std::chrono::seconds(5)};
    std::chrono::milliseconds poll_interval{std::chrono::seconds(5)};
    int max_wait_cycles{60};
};

/**
 * @brief Grants the shared market-data API to one market worker at a time
 *
 * Markets register in order; the first registrant owns the initial turn. With a
 * single active market a worker only ever waits for the token. With several,
 * a worker waits until the turn is its own, takes the token, and on release the
 * turn passes to the next active market in registration order. Removing the
 * market that owns the turn passes it on immediately so the others never starve.
 */
class TurnCoordinator {
public:
    explicit TurnCoordinator(TurnTimings timings = TurnTimings{});

    TurnCoordinator(const TurnCoordinator&) = delete;
    TurnCoordinator& operator=(const TurnCoordinator&) = delete;

    /**
     * @brief Add a market to the rotation
     * @return The market's 1-based position in registration order
     */
    size_t register_market(Market market);

    /**
     * @brief Remove a market; releases the token if it still holds it
     */
    void unregister_market(Market market);

    /**
     * @brief Wait for the caller's turn and take the access token
     * @param market Requesting market, must be registered
     * @param running Optional cooperative stop flag checked while waiting
     */
    TurnOutcome acquire_turn(Market market, const std::atomic<bool>* running = nullptr);

    /**
     * @brief Record the call time, return the token and rotate the turn
     * @return false if the market did not hold the token
     */
    bool release(Market market);

    /**
     * @brief Pass an owned turn on without using the API
     * @return true if the turn moved to another market
     */
    bool yield_turn(Market market);

    /**
     * @brief Time left before the market may call the API again
     */
    std::chrono::milliseconds cooldown_remaining(Market market) const;

    size_t active_count() const;
    bool is_registered(Market market) const;
    std::vector<Market> active_markets() const;
    std::optional<Market> current_turn() const;
    std::optional<Market> token_holder() const;

    const TurnTimings& timings() const {
        return timings_;
    }

private:
    using Clock = std::chrono::steady_clock;

    struct TurnState {
        std::vector<Market> active;  // registration order
        std::optional<Market> current;
        std::optional<Market> holder;
        std::map<Market, Clock::time_point> last_call;
    };

    // Callers hold mutex_
    bool is_active_locked(Market market) const;
    Market next_after_locked(Market market) const;
    bool try_take_token_locked(Market market);
    void return_token_locked(Market market);

    TurnTimings timings_;
    mutable std::mutex mutex_;
    std::condition_variable changed_;
    TurnState state_;
};

/**
 * @brief Keeps a market registered for the lifetime of a worker run
 */
class MarketRegistration {
public:
    MarketRegistration(TurnCoordinator& coordinator, Market market)
        : coordinator_(&coordinator), market_(market) {
        position_ = coordinator_->register_market(market_);
    }

    // 1-based position in registration order at the time of registering
    size_t position() const {
        return position_;
    }

    ~MarketRegistration() {
        if (coordinator_) {
            coordinator_->unregister_market(market_);
        }
    }

    MarketRegistration(const MarketRegistration&) = delete;
    MarketRegistration& operator=(const MarketRegistration&) = delete;

    MarketRegistration(MarketRegistration&& other) noexcept
        : coordinator_(other.coordinator_), market_(other.market_), position_(other.position_) {
        other.coordinator_ = nullptr;
    }

private:
    TurnCoordinator* coordinator_;
    Market market_;
    size_t position_{0};
};

/**
 * @brief Releases an acquired turn when the unit of work ends, on any path
 */
class TurnLease {
public:
    TurnLease(TurnCoordinator& coordinator, Market market)
        : coordinator_(&coordinator), market_(market) {}

    ~TurnLease() {
        release();
    }

    void release() {
        if (coordinator_) {
            coordinator_->release(market_);
            coordinator_ = nullptr;
        }
    }

    TurnLease(const TurnLease&) = delete;
    TurnLease& operator=(const TurnLease&) = delete;

    TurnLease(TurnLease&& other) noexcept
        : coordinator_(other.coordinator_), market_(other.market_) {
        other.coordinator_ = nullptr;
    }

private:
    TurnCoordinator* coordinator_;
    Market market_;
};

}  // namespace optwatch
