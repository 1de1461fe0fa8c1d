// =============================================================================
// ScenarioProcessor — フレーム1枚分の処理パス
// =============================================================================
// process(capture):
//   0. パス境界: 外部からの有効/無効要求・メトリクス無効化を適用
//   1. 全イベント無効 → 停止要求して即return（検出処理なし）
//   2. キャプチャ → 作業ビットマップ（バッファ再利用）
//      メトリクス無効化済みなら1回だけ setScreenMetrics
//   3. 有効イベントを優先度順に評価、最初の一致イベントのみアクション実行
//   4. 終了条件成立 → 即return（完了通知はスキップ）
// 単一ワーカーで逐次実行。キャンセルは安全点でのみ反映。
// =============================================================================
#pragma once

#include "detection/bitmap.hpp"
#include "detection/image_detector.hpp"
#include "scenario/action_dispatcher.hpp"
#include "scenario/cancellation.hpp"
#include "scenario/condition_evaluator.hpp"
#include "scenario/end_condition_verifier.hpp"
#include "scenario/event_evaluator.hpp"
#include "scenario/progress_listener.hpp"
#include "scenario/scenario_model.hpp"
#include "scenario/scenario_state.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace autoscene {

enum class PassStatus {
    COMPLETED,            // 全イベント評価済み or 1イベント実行済み
    STOPPED,              // 終了条件成立
    ALL_EVENTS_DISABLED,  // 有効イベントなし（停止要求済み）
    CANCELLED             // 安全点でキャンセル
};

inline const char* passStatusToString(PassStatus s) {
    switch (s) {
        case PassStatus::COMPLETED:           return "COMPLETED";
        case PassStatus::STOPPED:             return "STOPPED";
        case PassStatus::ALL_EVENTS_DISABLED: return "ALL_EVENTS_DISABLED";
        case PassStatus::CANCELLED:           return "CANCELLED";
    }
    return "UNKNOWN";
}

struct ProcessorConfig {
    int detection_quality = 1200;
    bool randomize = false;
    ConditionOperator end_condition_operator = ConditionOperator::AND;
};

struct ProcessorStats {
    uint64_t frames_processed = 0;
    uint64_t events_matched = 0;
    uint64_t actions_dispatched = 0;
    uint64_t detection_calls = 0;
    uint64_t metrics_updates = 0;
    PassStatus last_status = PassStatus::COMPLETED;
};

class ScenarioProcessor {
public:
    using StopCallback = std::function<void()>;

    ScenarioProcessor(ImageDetector& detector,
                      const ProcessorConfig& config,
                      std::vector<Event> events,
                      BitmapSupplier bitmap_supplier,
                      ActionExecutor& action_executor,
                      std::vector<EndCondition> end_conditions,
                      StopCallback on_stop_requested,
                      ProgressListener* progress_listener = nullptr);

    ScenarioProcessor(const ScenarioProcessor&) = delete;
    ScenarioProcessor& operator=(const ScenarioProcessor&) = delete;

    PassStatus process(const RawCapture& capture,
                       const CancellationToken& token = CancellationToken());

    // 任意スレッドから呼べる。次のパス境界で反映。
    void invalidateScreenMetrics() { invalidate_metrics_.store(true, std::memory_order_release); }
    void requestEventEnabled(int event_id, bool enabled) {
        state_.requestEventEnabled(event_id, enabled);
    }

    const ScenarioState& state() const { return state_; }
    const EndConditionVerifier& endConditions() const { return end_condition_verifier_; }
    ProcessorStats getStats() const;

private:
    PassStatus finish(PassStatus status);

    ImageDetector& detector_;
    ProcessorConfig config_;
    StopCallback on_stop_requested_;
    ProgressListener& listener_;

    ScenarioState state_;
    ConditionEvaluator condition_evaluator_;
    EventEvaluator event_evaluator_;
    ActionDispatcher action_dispatcher_;
    EndConditionVerifier end_condition_verifier_;

    std::atomic<bool> invalidate_metrics_{true};
    Bitmap screen_bitmap_;   // 毎フレーム再利用
    ProcessorStats stats_;
};

} // namespace autoscene
