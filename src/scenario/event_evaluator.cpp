// =============================================================================
// EventEvaluator 実装
// =============================================================================
// 条件 i ごと:
//   1. 評価 → nullopt なら即不一致（添付なし）
//   2. satisfied = detected == should_be_detected
//   3. AND かつ !satisfied → 不一致
//   4. OR かつ satisfied   → 一致
//   5. 最終条件まで短絡なし → AND:一致 / OR:不一致
//   6. 次の条件の前にキャンセル安全点
// =============================================================================

#include "scenario/event_evaluator.hpp"
#include "autoscene_log.hpp"

namespace autoscene {

static EventEvaluationOutcome decided(bool matched, const Event& event,
                                      const Condition& condition,
                                      const DetectionResult& detection) {
    EventEvaluationOutcome outcome;
    outcome.matched = matched;
    outcome.event = &event;
    outcome.condition = &condition;
    outcome.detection = detection;
    return outcome;
}

EventEvaluator::EventEvaluator(ConditionEvaluator& condition_evaluator,
                               ProgressListener& listener)
    : condition_evaluator_(condition_evaluator), listener_(listener) {}

EventEvaluationOutcome EventEvaluator::evaluate(const Event& event,
                                                const CancellationToken& token) {
    const auto& conditions = event.conditions;
    const bool is_and = event.condition_operator == ConditionOperator::AND;

    for (size_t i = 0; i < conditions.size(); ++i) {
        const Condition& condition = conditions[i];

        listener_.onConditionProcessingStarted(condition);
        auto result = condition_evaluator_.evaluate(condition);
        if (!result) {
            return EventEvaluationOutcome{};
        }
        listener_.onConditionProcessingCompleted(*result);

        const bool satisfied = result->is_detected == condition.should_be_detected;
        ALOG_TRACE("event", "event=%d cond=%zu detected=%d expected=%d conf=%.3f",
                   event.id, i, result->is_detected ? 1 : 0,
                   condition.should_be_detected ? 1 : 0, result->confidence);

        if (is_and && !satisfied) {
            return decided(false, event, condition, *result);
        }
        if (!is_and && satisfied) {
            return decided(true, event, condition, *result);
        }

        // AND: 全て満たされた / OR: どれも満たされなかった
        if (i == conditions.size() - 1) {
            return decided(is_and, event, condition, *result);
        }

        if (token.isCancelled()) {
            EventEvaluationOutcome cancelled;
            cancelled.cancelled = true;
            return cancelled;
        }
    }

    // 条件なしイベント（呼び出し側で除外済みのはず）
    return EventEvaluationOutcome{};
}

} // namespace autoscene
