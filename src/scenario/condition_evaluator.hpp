// =============================================================================
// ConditionEvaluator — 条件1つを現在フレームに対して評価
// =============================================================================
// テンプレート参照なし / 供給失敗 → nullopt（評価不能、致命的ではない）
// それ以外は検出方式で ImageDetector の呼び出し形を切り替える。
// 極性 (should_be_detected) はここでは適用しない（EventEvaluator 側）。
// =============================================================================
#pragma once

#include "detection/image_detector.hpp"
#include "scenario/scenario_model.hpp"

#include <cstdint>
#include <optional>

namespace autoscene {

class ConditionEvaluator {
public:
    ConditionEvaluator(ImageDetector& detector, BitmapSupplier bitmap_supplier);

    std::optional<DetectionResult> evaluate(const Condition& condition);

    uint64_t detectionCount() const { return detection_count_; }

private:
    ImageDetector& detector_;
    BitmapSupplier bitmap_supplier_;
    uint64_t detection_count_ = 0;
};

} // namespace autoscene
