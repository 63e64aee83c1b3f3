// src/core/state_manager.cpp

#include "optwatch/core/state_manager.hpp"
#include <algorithm>
#include <set>
#include "optwatch/core/logger.hpp"

namespace optwatch {

namespace {

const std::string kComponent = "StateManager";

// A component in one of these states belongs to a live run
bool is_live(ComponentState state) {
    return state == ComponentState::INITIALIZED || state == ComponentState::RUNNING ||
           state == ComponentState::PAUSED;
}

template <typename T>
Result<T> unknown_component(const std::string& component_id) {
    return make_error<T>(ErrorCode::DATA_NOT_FOUND, "Unknown component: " + component_id,
                         kComponent);
}

}  // namespace

bool StateManager::is_transition_allowed(ComponentState from, ComponentState to) {
    using S = ComponentState;
    static const std::map<S, std::set<S>> allowed = {
        {S::INITIALIZED, {S::RUNNING, S::ERR_STATE}},
        {S::RUNNING, {S::PAUSED, S::STOPPED, S::ERR_STATE}},
        {S::PAUSED, {S::RUNNING, S::STOPPED, S::ERR_STATE}},
        {S::ERR_STATE, {S::INITIALIZED, S::STOPPED}},
        {S::STOPPED, {S::INITIALIZED}}};

    auto it = allowed.find(from);
    return it != allowed.end() && it->second.count(to) > 0;
}

Result<void> StateManager::register_component(const ComponentInfo& info) {
    if (info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Component id is empty", kComponent);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = components_.find(info.id);
    if (existing != components_.end() && is_live(existing->second.state)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                info.id + " is already registered as " +
                                    component_state_to_string(existing->second.state),
                                kComponent);
    }

    ComponentInfo& entry = components_[info.id];
    entry = info;
    entry.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

Result<void> StateManager::unregister_component(const std::string& component_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (components_.erase(component_id) == 0) {
        return unknown_component<void>(component_id);
    }
    return Result<void>();
}

Result<ComponentInfo> StateManager::get_state(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return unknown_component<ComponentInfo>(component_id);
    }
    return Result<ComponentInfo>(it->second);
}

Result<void> StateManager::update_state(const std::string& component_id,
                                        ComponentState new_state,
                                        const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return unknown_component<void>(component_id);
    }

    ComponentInfo& entry = it->second;
    if (!is_transition_allowed(entry.state, new_state)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                component_id + " cannot move from " +
                                    component_state_to_string(entry.state) + " to " +
                                    component_state_to_string(new_state),
                                kComponent);
    }

    entry.state = new_state;
    entry.error_message = new_state == ComponentState::ERR_STATE ? error_message : std::string();
    entry.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

Result<void> StateManager::update_metrics(const std::string& component_id,
                                          const std::unordered_map<std::string, double>& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return unknown_component<void>(component_id);
    }

    for (const auto& [name, value] : metrics) {
        it->second.metrics[name] = value;
    }
    it->second.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

bool StateManager::is_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !components_.empty() &&
           std::all_of(components_.begin(), components_.end(), [](const auto& entry) {
               return entry.second.state == ComponentState::INITIALIZED ||
                      entry.second.state == ComponentState::RUNNING;
           });
}

std::vector<ComponentInfo> StateManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ComponentInfo> entries;
    entries.reserve(components_.size());
    for (const auto& entry : components_) {
        entries.push_back(entry.second);
    }
    return entries;
}

bool report_health(const std::string& component_id, ComponentState state,
                   const std::string& error_message) {
    auto result = StateManager::instance().update_state(component_id, state, error_message);
    if (result.is_error()) {
        DEBUG("Health update for " << component_id << " skipped: " << result.error()->what());
        return false;
    }
    return true;
}

}  // namespace optwatch
