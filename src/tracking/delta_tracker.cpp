// src/tracking/delta_tracker.cpp

#include "optwatch/tracking/delta_tracker.hpp"
#include <algorithm>
#include <stdexcept>
#include "optwatch/core/logger.hpp"

namespace optwatch {

DeltaTracker::DeltaTracker(std::shared_ptr<OptionTradeStore> store, DayKeySupplier day_key)
    : store_(std::move(store)), day_key_(std::move(day_key)) {
    if (!day_key_) {
        throw std::invalid_argument("DeltaTracker requires a trading day supplier");
    }
}

void DeltaTracker::roll_day_locked() {
    std::string today = day_key_();
    if (today == current_day_) {
        return;
    }

    if (!current_day_.empty()) {
        INFO("Trading day changed from " << current_day_ << " to " << today << ", dropping "
                                         << cache_.size() << " cached instruments");
    }
    cache_.clear();
    warmed_ = false;
    current_day_ = std::move(today);
}

VolumeState& DeltaTracker::state_locked(const std::string& option_code) {
    roll_day_locked();
    return cache_[option_code];
}

Count DeltaTracker::get_previous_volume(const std::string& option_code, Count current_volume) {
    std::lock_guard<std::mutex> lock(mutex_);
    VolumeState& state = state_locked(option_code);

    if (!state.volume_hydrated) {
        state.volume_hydrated = true;
        if (store_) {
            auto stored = store_->get_previous_volume(option_code, current_day_);
            if (stored.is_ok()) {
                state.previous_volume = stored.value();
            } else {
                WARN("Volume history unavailable for " << option_code << ", assuming 0: "
                                                       << stored.error()->what());
            }
        }
        TRACE(option_code << " hydrated previous volume " << state.previous_volume
                          << " (current " << current_volume << ")");
    }

    return state.previous_volume;
}

OpenInterestPair DeltaTracker::get_previous_open_interest(const std::string& option_code,
                                                          Count current_open_interest) {
    std::lock_guard<std::mutex> lock(mutex_);
    VolumeState& state = state_locked(option_code);

    if (!state.open_interest_hydrated) {
        state.open_interest_hydrated = true;
        if (store_) {
            auto stored = store_->get_previous_open_interest(option_code, current_day_);
            if (stored.is_ok()) {
                state.previous_open_interest = stored.value().open_interest;
                state.previous_net_open_interest = stored.value().net_open_interest;
            } else {
                WARN("Open interest history unavailable for " << option_code
                                                              << ", assuming 0: "
                                                              << stored.error()->what());
            }
        }
        TRACE(option_code << " hydrated previous open interest " << state.previous_open_interest
                          << " (current " << current_open_interest << ")");
    }

    return OpenInterestPair{state.previous_open_interest, state.previous_net_open_interest};
}

void DeltaTracker::record_current(const std::string& option_code, Count volume,
                                  Count open_interest, Count net_open_interest) {
    std::lock_guard<std::mutex> lock(mutex_);
    VolumeState& state = state_locked(option_code);

    state.previous_volume = std::max(state.previous_volume, volume);
    state.previous_open_interest = open_interest;
    state.previous_net_open_interest = net_open_interest;
    state.volume_hydrated = true;
    state.open_interest_hydrated = true;
}

DeltaSet DeltaTracker::compute(const OptionSnapshot& snapshot) {
    DeltaSet deltas;
    deltas.previous_volume = get_previous_volume(snapshot.option_code, snapshot.volume);
    deltas.volume_delta = snapshot.volume - deltas.previous_volume;

    const OpenInterestPair previous =
        get_previous_open_interest(snapshot.option_code, snapshot.open_interest);
    deltas.open_interest_delta = snapshot.open_interest - previous.open_interest;
    deltas.net_open_interest_delta = snapshot.net_open_interest - previous.net_open_interest;
    return deltas;
}

size_t DeltaTracker::warm_up() {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_day_locked();
    if (warmed_ || !store_) {
        return 0;
    }

    auto volumes = store_->get_today_volumes(current_day_);
    if (volumes.is_error()) {
        WARN("Could not load today's volumes for " << current_day_ << ": "
                                                   << volumes.error()->what());
        return 0;
    }

    size_t loaded = 0;
    for (const auto& [code, volume] : volumes.value()) {
        VolumeState& state = cache_[code];
        if (!state.volume_hydrated) {
            state.previous_volume = volume;
            state.volume_hydrated = true;
            ++loaded;
        }
    }
    warmed_ = true;

    INFO("Loaded today's volumes for " << loaded << " options (" << current_day_ << ")");
    return loaded;
}

std::string DeltaTracker::trading_day() {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_day_locked();
    return current_day_;
}

size_t DeltaTracker::cached_instruments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

}  // namespace optwatch
