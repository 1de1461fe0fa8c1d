// =============================================================================
// BusProgressListener — 進捗フックを EventBus イベントとして再発行
// =============================================================================
#pragma once

#include "event_bus.hpp"
#include "scenario/event_evaluator.hpp"
#include "scenario/progress_listener.hpp"

#include <cstdint>

namespace autoscene {

class BusProgressListener : public ProgressListener {
public:
    explicit BusProgressListener(EventBus& event_bus = bus()) : bus_(event_bus) {}

    void onImageProcessingStarted() override {
        frame_index_++;
        FrameProcessingEvent evt;
        evt.phase = FrameProcessingEvent::Phase::STARTED;
        evt.frame_index = frame_index_;
        bus_.publish(evt);
    }

    void onImageProcessingCompleted() override {
        FrameProcessingEvent evt;
        evt.phase = FrameProcessingEvent::Phase::COMPLETED;
        evt.frame_index = frame_index_;
        bus_.publish(evt);
    }

    void onEventProcessingCompleted(const EventEvaluationOutcome& outcome) override {
        // 評価不能（event未添付）は通知しない
        if (!outcome.event) return;
        EventMatchEvent evt;
        evt.event_id = outcome.event->id;
        evt.event_name = outcome.event->name;
        evt.matched = outcome.matched;
        if (outcome.condition) evt.condition_name = outcome.condition->name;
        if (outcome.detection) {
            evt.x = outcome.detection->position.x;
            evt.y = outcome.detection->position.y;
            evt.confidence = outcome.detection->confidence;
        }
        evt.frame_index = frame_index_;
        bus_.publish(evt);
    }

    void onConditionProcessingStarted(const Condition& condition) override {
        current_condition_ = &condition;
    }

    void onConditionProcessingCompleted(const DetectionResult& result) override {
        if (!bus_.has_subscribers<ConditionCheckedEvent>()) return;
        ConditionCheckedEvent evt;
        if (current_condition_) evt.condition_name = current_condition_->name;
        evt.detected = result.is_detected;
        evt.confidence = result.confidence;
        bus_.publish(evt);
    }

    uint64_t frameIndex() const { return frame_index_; }

private:
    EventBus& bus_;
    uint64_t frame_index_ = 0;
    const Condition* current_condition_ = nullptr;
};

} // namespace autoscene
