// src/classify/strike_window.cpp

#include "optwatch/classify/strike_window.hpp"
#include <algorithm>
#include <cmath>

namespace optwatch {

constexpr double StrikeWindow::kWidenFactor;
constexpr size_t StrikeWindow::kFallbackCount;

StrikeSelection StrikeWindow::select(const std::vector<ChainEntry>& chain,
                                     Price underlying_price, double fraction) {
    StrikeSelection selection;
    if (underlying_price <= 0.0 || chain.empty()) {
        return selection;
    }

    selection.lower = underlying_price * (1.0 - fraction);
    selection.upper = underlying_price * (1.0 + fraction);
    for (const auto& entry : chain) {
        if (entry.strike_price >= selection.lower && entry.strike_price <= selection.upper) {
            selection.entries.push_back(entry);
        }
    }
    if (!selection.entries.empty()) {
        return selection;
    }

    const double wide = fraction * kWidenFactor;
    selection.widened = true;
    selection.lower = underlying_price * (1.0 - wide);
    selection.upper = underlying_price * (1.0 + wide);

    std::vector<ChainEntry> candidates;
    for (const auto& entry : chain) {
        if (entry.strike_price >= selection.lower && entry.strike_price <= selection.upper) {
            candidates.push_back(entry);
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [underlying_price](const ChainEntry& a, const ChainEntry& b) {
                         return std::fabs(a.strike_price - underlying_price) <
                                std::fabs(b.strike_price - underlying_price);
                     });
    if (candidates.size() > kFallbackCount) {
        candidates.resize(kFallbackCount);
    }
    selection.entries = std::move(candidates);
    return selection;
}

}  // namespace optwatch
