// include/optwatch/tracking/delta_tracker.hpp
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "optwatch/core/types.hpp"
#include "optwatch/storage/option_trade_store.hpp"

namespace optwatch {

/**
 * @brief Per-instrument counters observed earlier in the trading day
 */
struct VolumeState {
    Count previous_volume{0};
    Count previous_open_interest{0};
    Count previous_net_open_interest{0};
    bool volume_hydrated{false};
    bool open_interest_hydrated{false};
};

/**
 * @brief Deltas of one snapshot against the previous observation
 */
struct DeltaSet {
    Count previous_volume{0};
    Count volume_delta{0};
    Count open_interest_delta{0};
    Count net_open_interest_delta{0};
};

/**
 * @brief Remembers what each instrument looked like on its last observation today
 *
 * The first lookup of an instrument on a trading day hydrates its state from the
 * store exactly once; later lookups are served from memory until record_current
 * moves them forward. When the trading day key changes the whole cache is
 * dropped before the next access. An instrument with no history starts from
 * zero, so its first delta equals its full cumulative volume.
 */
class DeltaTracker {
public:
    using DayKeySupplier = std::function<std::string()>;

    /**
     * @param store History backing the cache; may be null for memory-only tracking
     * @param day_key Supplies the market-local trading day key
     */
    DeltaTracker(std::shared_ptr<OptionTradeStore> store, DayKeySupplier day_key);

    Count get_previous_volume(const std::string& option_code, Count current_volume);

    OpenInterestPair get_previous_open_interest(const std::string& option_code,
                                                Count current_open_interest);

    /**
     * @brief Move the cached state forward to the observation just processed
     *
     * previous_volume only grows within a day; a lower reading is ignored.
     */
    void record_current(const std::string& option_code, Count volume, Count open_interest,
                        Count net_open_interest);

    /**
     * @brief Previous values and deltas for a snapshot; does not record it
     */
    DeltaSet compute(const OptionSnapshot& snapshot);

    /**
     * @brief Bulk-hydrate today's volumes in one store query
     * @return Number of instruments loaded; zero if already warm or on failure
     */
    size_t warm_up();

    std::string trading_day();

    size_t cached_instruments() const;

private:
    void roll_day_locked();
    VolumeState& state_locked(const std::string& option_code);

    std::shared_ptr<OptionTradeStore> store_;
    DayKeySupplier day_key_;

    mutable std::mutex mutex_;
    std::string current_day_;
    bool warmed_{false};
    std::unordered_map<std::string, VolumeState> cache_;
};

}  // namespace optwatch
