// =============================================================================
// ProgressListener — 処理進捗の観測フック（制御フローには影響しない）
// =============================================================================
// 全メソッドは空のデフォルト実装。リスナー未指定時は noOpProgressListener()
// を使い、ループ内で nullptr チェックをしない。
// =============================================================================
#pragma once

#include "detection/image_detector.hpp"
#include "scenario/scenario_model.hpp"

namespace autoscene {

struct EventEvaluationOutcome;

class ProgressListener {
public:
    virtual ~ProgressListener() = default;

    virtual void onImageProcessingStarted() {}
    virtual void onImageProcessingCompleted() {}

    virtual void onEventProcessingStarted(const Event& /*event*/) {}
    virtual void onEventProcessingCompleted(const EventEvaluationOutcome& /*outcome*/) {}

    virtual void onConditionProcessingStarted(const Condition& /*condition*/) {}
    virtual void onConditionProcessingCompleted(const DetectionResult& /*result*/) {}
};

inline ProgressListener& noOpProgressListener() {
    static ProgressListener instance;
    return instance;
}

} // namespace autoscene
