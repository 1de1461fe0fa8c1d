// =============================================================================
// ScenarioProcessor 実装
// =============================================================================

#include "scenario/scenario_processor.hpp"
#include "autoscene_log.hpp"

#include <stdexcept>
#include <utility>

static constexpr const char* TAG = "scenario";

namespace autoscene {

ScenarioProcessor::ScenarioProcessor(ImageDetector& detector,
                                     const ProcessorConfig& config,
                                     std::vector<Event> events,
                                     BitmapSupplier bitmap_supplier,
                                     ActionExecutor& action_executor,
                                     std::vector<EndCondition> end_conditions,
                                     StopCallback on_stop_requested,
                                     ProgressListener* progress_listener)
    : detector_(detector),
      config_(config),
      on_stop_requested_(std::move(on_stop_requested)),
      listener_(progress_listener ? *progress_listener : noOpProgressListener()),
      state_(std::move(events)),
      condition_evaluator_(detector, std::move(bitmap_supplier)),
      event_evaluator_(condition_evaluator_, listener_),
      action_dispatcher_(action_executor, state_, config.randomize),
      end_condition_verifier_(std::move(end_conditions), config.end_condition_operator,
                              [this]() { if (on_stop_requested_) on_stop_requested_(); }) {
    if (config_.detection_quality <= 0) {
        throw std::invalid_argument("ScenarioProcessor: detection_quality must be > 0");
    }
    ALOG_INFO(TAG, "初期化: events=%zu end_conditions=%zu (%s) quality=%d randomize=%d",
              state_.events().size(), end_condition_verifier_.size(),
              conditionOperatorToString(config_.end_condition_operator),
              config_.detection_quality, config_.randomize ? 1 : 0);
}

PassStatus ScenarioProcessor::process(const RawCapture& capture, const CancellationToken& token) {
    // === パス境界: 外部要求の適用 ===
    state_.applyPendingRequests();

    if (state_.areAllEventsDisabled()) {
        ALOG_INFO(TAG, "全イベント無効 → 停止要求");
        if (on_stop_requested_) on_stop_requested_();
        return finish(PassStatus::ALL_EVENTS_DISABLED);
    }

    listener_.onImageProcessingStarted();

    // === 現在フレームの設定 ===
    toBitmap(capture, screen_bitmap_);
    if (invalidate_metrics_.exchange(false, std::memory_order_acq_rel)) {
        try {
            detector_.setScreenMetrics(screen_bitmap_,
                                       static_cast<double>(config_.detection_quality));
        } catch (...) {
            invalidate_metrics_.store(true, std::memory_order_release);  // 次パスで再試行
            throw;
        }
        stats_.metrics_updates++;
    }
    detector_.setupDetection(screen_bitmap_);
    stats_.frames_processed++;

    // === イベント評価（優先度順） ===
    for (const Event* event : state_.getEnabledEvents()) {
        // 条件なしイベント: 本来ありえない、スキップ
        if (event->conditions.empty()) {
            ALOG_DEBUG(TAG, "条件なしイベントをスキップ: %d (%s)", event->id, event->name.c_str());
            continue;
        }

        listener_.onEventProcessingStarted(*event);
        EventEvaluationOutcome outcome = event_evaluator_.evaluate(*event, token);
        stats_.detection_calls = condition_evaluator_.detectionCount();
        if (outcome.cancelled) {
            ALOG_DEBUG(TAG, "キャンセル（条件評価中）: event=%d", event->id);
            return finish(PassStatus::CANCELLED);
        }
        listener_.onEventProcessingCompleted(outcome);

        if (outcome.matched) {
            stats_.events_matched++;
            std::optional<Point> position;
            if (outcome.detection) position = outcome.detection->position;

            ALOG_DEBUG(TAG, "イベント一致: %d (%s)", event->id, event->name.c_str());
            stats_.actions_dispatched += action_dispatcher_.executeActions(event->actions, position);

            // 実行回数上限に達したか
            if (end_condition_verifier_.onEventTriggered(*event)) {
                return finish(PassStatus::STOPPED);
            }
            break;
        }

        if (token.isCancelled()) {
            ALOG_DEBUG(TAG, "キャンセル（イベント間）: event=%d", event->id);
            return finish(PassStatus::CANCELLED);
        }
    }

    listener_.onImageProcessingCompleted();
    return finish(PassStatus::COMPLETED);
}

PassStatus ScenarioProcessor::finish(PassStatus status) {
    stats_.last_status = status;
    return status;
}

ProcessorStats ScenarioProcessor::getStats() const {
    ProcessorStats s = stats_;
    s.detection_calls = condition_evaluator_.detectionCount();
    return s;
}

} // namespace autoscene
