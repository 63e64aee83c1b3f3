// include/optwatch/core/state_manager.hpp
#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "optwatch/core/error.hpp"
#include "optwatch/core/types.hpp"

namespace optwatch {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

inline std::string component_state_to_string(ComponentState state) {
    switch (state) {
        case ComponentState::INITIALIZED:
            return "INITIALIZED";
        case ComponentState::RUNNING:
            return "RUNNING";
        case ComponentState::PAUSED:
            return "PAUSED";
        case ComponentState::ERR_STATE:
            return "ERROR";
        case ComponentState::STOPPED:
            return "STOPPED";
        default:
            return "UNKNOWN";
    }
}

enum class ComponentType {
    MARKET_WORKER,
    MARKET_DATA,
    DATABASE,
    NOTIFIER,
    SUPERVISOR
};

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Process-wide registry of component health
 *
 * Workers publish their state and scan counters here. The supervisor builds
 * its periodic status report from these entries.
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    /**
     * @brief Add a component, or take over an entry an earlier run left STOPPED or in ERR_STATE
     * @return INVALID_ARGUMENT for an empty id or an id that is still active
     */
    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<ComponentInfo> get_state(const std::string& component_id) const;

    /**
     * @brief Move a component to a new state
     *
     * Allowed: INITIALIZED->RUNNING|ERR, RUNNING->PAUSED|STOPPED|ERR,
     * PAUSED->RUNNING|STOPPED|ERR, ERR->INITIALIZED|STOPPED, STOPPED->INITIALIZED.
     * The error message is kept only while the component is in ERR_STATE.
     */
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");

    /**
     * @brief Merge metrics into the component's set, overwriting existing names
     */
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);

    // True when at least one component exists and all are INITIALIZED or RUNNING
    bool is_healthy() const;

    /**
     * @brief Every registered component, ordered by id
     */
    std::vector<ComponentInfo> snapshot() const;

    static bool is_transition_allowed(ComponentState from, ComponentState to);

    static void reset_instance() {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        inst.components_.clear();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    std::map<std::string, ComponentInfo> components_;
    mutable std::mutex mutex_;
};

/**
 * @brief Best-effort state update; a rejected update is logged at DEBUG
 * @return true if the update was applied
 */
bool report_health(const std::string& component_id, ComponentState state,
                   const std::string& error_message = "");

}  // namespace optwatch
