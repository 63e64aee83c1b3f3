// src/scheduling/turn_coordinator.cpp

#include "optwatch/scheduling/turn_coordinator.hpp"
#include <algorithm>
#include "optwatch/core/logger.hpp"

namespace optwatch {

TurnCoordinator::TurnCoordinator(TurnTimings timings) : timings_(timings) {}

bool TurnCoordinator::is_active_locked(Market market) const {
    return std::find(state_.active.begin(), state_.active.end(), market) != state_.active.end();
}

Market TurnCoordinator::next_after_locked(Market market) const {
    auto it = std::find(state_.active.begin(), state_.active.end(), market);
    if (it == state_.active.end() || state_.active.size() == 1) {
        return state_.active.empty() ? market : state_.active.front();
    }
    ++it;
    return it == state_.active.end() ? state_.active.front() : *it;
}

bool TurnCoordinator::try_take_token_locked(Market market) {
    if (state_.holder) {
        return false;
    }
    state_.holder = market;
    return true;
}

void TurnCoordinator::return_token_locked(Market market) {
    state_.last_call[market] = Clock::now();
    state_.holder.reset();
}

size_t TurnCoordinator::register_market(Market market) {
    size_t position = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(state_.active.begin(), state_.active.end(), market);
        if (it != state_.active.end()) {
            return static_cast<size_t>(it - state_.active.begin()) + 1;
        }
        state_.active.push_back(market);
        position = state_.active.size();
        if (!state_.current || !is_active_locked(*state_.current)) {
            state_.current = market;
        }
        INFO("Market " << market_to_string(market) << " registered, " << state_.active.size()
                       << " active, turn: " << market_to_string(*state_.current));
    }
    changed_.notify_all();
    return position;
}

void TurnCoordinator::unregister_market(Market market) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_active_locked(market)) {
            return;
        }

        // Decide the successor while the market is still in the rotation
        const Market successor = next_after_locked(market);

        if (state_.holder == market) {
            WARN("Market " << market_to_string(market)
                           << " unregistered while holding the API token, releasing it");
            return_token_locked(market);
        }

        state_.active.erase(std::remove(state_.active.begin(), state_.active.end(), market),
                            state_.active.end());

        if (state_.active.empty()) {
            state_.current.reset();
        } else if (state_.current == market) {
            state_.current = successor;
        }

        INFO("Market " << market_to_string(market) << " unregistered, " << state_.active.size()
                       << " active");
    }
    changed_.notify_all();
}

TurnOutcome TurnCoordinator::acquire_turn(Market market, const std::atomic<bool>* running) {
    auto stopped = [running] { return running != nullptr && !running->load(); };

    const auto deadline = Clock::now() + timings_.poll_interval * timings_.max_wait_cycles;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (stopped()) {
            return TurnOutcome::STOPPED;
        }
        if (!is_active_locked(market)) {
            WARN("Market " << market_to_string(market) << " requested a turn while unregistered");
            return TurnOutcome::TIMED_OUT;
        }

        if (state_.active.size() <= 1) {
            // Alone in the rotation: wait on the token only, without a bound
            if (try_take_token_locked(market)) {
                return TurnOutcome::ACQUIRED;
            }
            changed_.wait_for(lock, timings_.poll_interval);
            continue;
        }

        if (state_.current == market && try_take_token_locked(market)) {
            DEBUG("Market " << market_to_string(market) << " acquired the API turn");
            return TurnOutcome::ACQUIRED;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            WARN("Market " << market_to_string(market) << " timed out waiting for its turn"
                           << " (current: "
                           << (state_.current ? market_to_string(*state_.current) : "none")
                           << "), skipping this cycle");
            return TurnOutcome::TIMED_OUT;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        changed_.wait_for(lock, std::min(timings_.poll_interval, remaining));
    }
}

bool TurnCoordinator::release(Market market) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.holder != market) {
            WARN("Market " << market_to_string(market)
                           << " released an API turn it does not hold");
            return false;
        }

        return_token_locked(market);

        if (state_.active.size() > 1 && is_active_locked(market)) {
            state_.current = next_after_locked(market);
            DEBUG("API turn released by " << market_to_string(market)
                                          << ", next: " << market_to_string(*state_.current));
        }
    }
    changed_.notify_all();
    return true;
}

bool TurnCoordinator::yield_turn(Market market) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.active.size() <= 1 || state_.current != market || state_.holder == market) {
            return false;
        }
        state_.current = next_after_locked(market);
        DEBUG("Market " << market_to_string(market) << " yielded its turn to "
                        << market_to_string(*state_.current));
    }
    changed_.notify_all();
    return true;
}

std::chrono::milliseconds TurnCoordinator::cooldown_remaining(Market market) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.last_call.find(market);
    if (it == state_.last_call.end()) {
        return std::chrono::milliseconds(0);
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - it->second);
    if (elapsed >= timings_.min_api_interval) {
        return std::chrono::milliseconds(0);
    }
    return timings_.min_api_interval - elapsed;
}

size_t TurnCoordinator::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.active.size();
}

bool TurnCoordinator::is_registered(Market market) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_active_locked(market);
}

std::vector<Market> TurnCoordinator::active_markets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.active;
}

std::optional<Market> TurnCoordinator::current_turn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.current;
}

std::optional<Market> TurnCoordinator::token_holder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.holder;
}

}  // namespace optwatch
