// =============================================================================
// ScenarioState 実装
// =============================================================================

#include "scenario/scenario_state.hpp"
#include "autoscene_log.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace autoscene {

ScenarioState::ScenarioState(std::vector<Event> events)
    : events_(std::move(events)) {
    enabled_.reserve(events_.size());
    for (size_t i = 0; i < events_.size(); ++i) {
        if (!index_.emplace(events_[i].id, i).second) {
            throw std::invalid_argument("ScenarioState: duplicate event id " +
                                        std::to_string(events_[i].id));
        }
        enabled_.push_back(events_[i].enabled_on_start);
    }
}

std::vector<const Event*> ScenarioState::getEnabledEvents() const {
    std::vector<const Event*> out;
    out.reserve(events_.size());
    for (size_t i = 0; i < events_.size(); ++i) {
        if (enabled_[i]) out.push_back(&events_[i]);
    }
    return out;
}

bool ScenarioState::areAllEventsDisabled() const {
    return std::none_of(enabled_.begin(), enabled_.end(), [](bool e) { return e; });
}

bool ScenarioState::isEventEnabled(int event_id) const {
    auto it = index_.find(event_id);
    return it != index_.end() && enabled_[it->second];
}

bool ScenarioState::setEventEnabled(int event_id, bool enabled) {
    auto it = index_.find(event_id);
    if (it == index_.end()) {
        ALOG_WARN("state", "未知のイベントID: %d", event_id);
        return false;
    }
    if (enabled_[it->second] != enabled) {
        enabled_[it->second] = enabled;
        ALOG_DEBUG("state", "event=%d %s", event_id, enabled ? "有効化" : "無効化");
    }
    return true;
}

bool ScenarioState::toggleEvent(int event_id, ToggleType toggle) {
    switch (toggle) {
        case ToggleType::ENABLE:  return setEventEnabled(event_id, true);
        case ToggleType::DISABLE: return setEventEnabled(event_id, false);
        case ToggleType::TOGGLE:  return setEventEnabled(event_id, !isEventEnabled(event_id));
    }
    return false;
}

void ScenarioState::requestEventEnabled(int event_id, bool enabled) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.emplace_back(event_id, enabled);
}

size_t ScenarioState::applyPendingRequests() {
    std::vector<std::pair<int, bool>> requests;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        requests.swap(pending_);
    }
    for (const auto& [event_id, enabled] : requests) {
        setEventEnabled(event_id, enabled);
    }
    return requests.size();
}

void ScenarioState::reset() {
    for (size_t i = 0; i < events_.size(); ++i) {
        enabled_[i] = events_[i].enabled_on_start;
    }
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.clear();
}

const Event* ScenarioState::findEvent(int event_id) const {
    auto it = index_.find(event_id);
    return it != index_.end() ? &events_[it->second] : nullptr;
}

} // namespace autoscene
