// =============================================================================
// EventEvaluator — イベントの条件群を AND/OR で短絡評価
// =============================================================================
// AND: 最初に満たされない条件で不一致確定（以降の条件は検出しない）
// OR:  最初に満たされた条件で一致確定
// 評価不能な条件があればイベントは不一致（event/condition 添付なし）
// 条件チェックの合間にキャンセル安全点を置く。
// =============================================================================
#pragma once

#include "scenario/cancellation.hpp"
#include "scenario/condition_evaluator.hpp"
#include "scenario/progress_listener.hpp"
#include "scenario/scenario_model.hpp"

#include <optional>

namespace autoscene {

// 1イベント・1フレームにつき最大1つ
struct EventEvaluationOutcome {
    bool matched = false;
    const Event* event = nullptr;          // 判定に至った場合のみ
    const Condition* condition = nullptr;  // 判定を決めた条件
    std::optional<DetectionResult> detection;
    bool cancelled = false;                // 安全点でキャンセルされた
};

class EventEvaluator {
public:
    explicit EventEvaluator(ConditionEvaluator& condition_evaluator,
                            ProgressListener& listener = noOpProgressListener());

    EventEvaluationOutcome evaluate(const Event& event,
                                    const CancellationToken& token = CancellationToken());

private:
    ConditionEvaluator& condition_evaluator_;
    ProgressListener& listener_;
};

} // namespace autoscene
