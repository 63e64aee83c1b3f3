// include/optwatch/scheduling/sliced_sleep.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace optwatch {

/**
 * @brief Sleep in short slices so a cleared running flag ends the wait early
 * @return false if the flag was cleared before the full duration elapsed
 */
inline bool sleep_while_running(std::chrono::milliseconds duration,
                                const std::atomic<bool>* running,
                                std::chrono::milliseconds slice = std::chrono::milliseconds(200)) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (true) {
        if (running && !running->load()) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
    }
}

}  // namespace optwatch
