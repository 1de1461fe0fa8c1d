// =============================================================================
// EndConditionVerifier 実装
// =============================================================================

#include "scenario/end_condition_verifier.hpp"
#include "autoscene_log.hpp"

#include <algorithm>
#include <utility>

namespace autoscene {

EndConditionVerifier::EndConditionVerifier(std::vector<EndCondition> end_conditions,
                                           ConditionOperator end_condition_operator,
                                           StopCallback on_stop_requested)
    : operator_(end_condition_operator),
      on_stop_requested_(std::move(on_stop_requested)) {
    trackers_.reserve(end_conditions.size());
    for (auto& ec : end_conditions) {
        trackers_.push_back(Tracker{std::move(ec), 0, false});
    }
}

bool EndConditionVerifier::onEventTriggered(const Event& event) {
    bool any_changed = false;
    for (auto& t : trackers_) {
        if (t.end_condition.event_id != event.id) continue;
        t.count++;
        if (!t.reached && t.count >= t.end_condition.executions) {
            t.reached = true;
            any_changed = true;
            ALOG_INFO("endcond", "終了条件満了: event=%d (%d/%d)",
                      event.id, t.count, t.end_condition.executions);
        }
    }

    if (satisfied_) return true;
    if (!any_changed || !combinationSatisfied()) return false;

    satisfied_ = true;
    ALOG_INFO("endcond", "終了条件成立 (%s) → 停止要求",
              conditionOperatorToString(operator_));
    if (on_stop_requested_) on_stop_requested_();
    return true;
}

bool EndConditionVerifier::combinationSatisfied() const {
    if (trackers_.empty()) return false;
    auto reached = [](const Tracker& t) { return t.reached; };
    if (operator_ == ConditionOperator::AND) {
        return std::all_of(trackers_.begin(), trackers_.end(), reached);
    }
    return std::any_of(trackers_.begin(), trackers_.end(), reached);
}

void EndConditionVerifier::reset() {
    for (auto& t : trackers_) {
        t.count = 0;
        t.reached = false;
    }
    satisfied_ = false;
}

int EndConditionVerifier::executionCount(int event_id) const {
    for (const auto& t : trackers_) {
        if (t.end_condition.event_id == event_id) return t.count;
    }
    return 0;
}

} // namespace autoscene
