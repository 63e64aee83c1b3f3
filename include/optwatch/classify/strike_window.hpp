// include/optwatch/classify/strike_window.hpp
#pragma once

#include <vector>
#include "optwatch/core/types.hpp"

namespace optwatch {

struct StrikeSelection {
    std::vector<ChainEntry> entries;
    Price lower{0.0};
    Price upper{0.0};
    bool widened{false};
};

/**
 * @brief Narrows an option chain to strikes near the underlying price
 *
 * Keeps entries with strike in [p*(1-f), p*(1+f)]. When none qualify the
 * fraction is widened by kWidenFactor and the kFallbackCount entries closest
 * to p inside the wider window are kept, nearest first (ties keep chain order).
 */
class StrikeWindow {
public:
    static constexpr double kWidenFactor = 1.5;
    static constexpr size_t kFallbackCount = 5;

    static StrikeSelection select(const std::vector<ChainEntry>& chain, Price underlying_price,
                                  double fraction);
};

}  // namespace optwatch
