// =============================================================================
// ActionDispatcher — 一致イベントのアクションを解決して実行系へ渡す
// =============================================================================
// CLICK(on_detected_position): 検出位置を使用（位置なしならスキップ）
// randomize:    座標 ±kRandomizePositionPx、時間 +0..kRandomizeDurationMs
// TOGGLE_EVENT: ScenarioState を直接更新（次のパスから有効）
// 入力注入は外部の ActionExecutor が担当（fire & forget）。
// =============================================================================
#pragma once

#include "detection/bitmap.hpp"
#include "scenario/scenario_model.hpp"
#include "scenario/scenario_state.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace autoscene {

// 入力注入の外部実装（タップ・スワイプ・待機）
class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;
    virtual void execute(const Action& resolved) = 0;
};

class ActionDispatcher {
public:
    static constexpr int kRandomizePositionPx = 5;
    static constexpr int kRandomizeDurationMs = 40;

    ActionDispatcher(ActionExecutor& executor, ScenarioState& state, bool randomize,
                     uint32_t seed = std::random_device{}());

    // @return 実行系へ渡したアクション数（TOGGLE_EVENT は含まない）
    size_t executeActions(const std::vector<Action>& actions,
                          const std::optional<Point>& position);

    bool randomize() const { return randomize_; }

private:
    std::optional<Action> resolve(const Action& action, const std::optional<Point>& position);
    int jitter(int value, int min_offset, int max_offset);

    ActionExecutor& executor_;
    ScenarioState& state_;
    bool randomize_;
    std::mt19937 rng_;
};

} // namespace autoscene
