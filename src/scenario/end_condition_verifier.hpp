// =============================================================================
// EndConditionVerifier — 終了条件（イベント実行回数の上限）の追跡
// =============================================================================
// ACTIVE → SATISFIED（終端）
// onEventTriggered(): 該当イベントの終了条件カウンタを加算し、
//   結合子 (AND=全て満了 / OR=どれか満了) が真になった時点で
//   停止コールバックを1回だけ呼び、true を返す（パス即中断の合図）。
// 終了条件が1つもなければ停止を要求しない。
// =============================================================================
#pragma once

#include "scenario/scenario_model.hpp"

#include <functional>
#include <vector>

namespace autoscene {

class EndConditionVerifier {
public:
    using StopCallback = std::function<void()>;

    EndConditionVerifier(std::vector<EndCondition> end_conditions,
                         ConditionOperator end_condition_operator,
                         StopCallback on_stop_requested);

    // @return true: 終了条件成立（現在のパスを中断すること）
    bool onEventTriggered(const Event& event);

    // シナリオ再開時のみ
    void reset();

    bool isSatisfied() const { return satisfied_; }
    int executionCount(int event_id) const;
    size_t size() const { return trackers_.size(); }

private:
    struct Tracker {
        EndCondition end_condition;
        int count = 0;
        bool reached = false;
    };

    bool combinationSatisfied() const;

    std::vector<Tracker> trackers_;
    ConditionOperator operator_;
    StopCallback on_stop_requested_;
    bool satisfied_ = false;
};

} // namespace autoscene
