// =============================================================================
// ConditionEvaluator 実装
// =============================================================================

#include "scenario/condition_evaluator.hpp"
#include "autoscene_log.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace autoscene {

ConditionEvaluator::ConditionEvaluator(ImageDetector& detector, BitmapSupplier bitmap_supplier)
    : detector_(detector), bitmap_supplier_(std::move(bitmap_supplier)) {
    if (!bitmap_supplier_) {
        throw std::invalid_argument("ConditionEvaluator: bitmap supplier is required");
    }
}

std::optional<DetectionResult> ConditionEvaluator::evaluate(const Condition& condition) {
    if (!condition.path || condition.path->empty()) {
        ALOG_DEBUG("condition", "テンプレート参照なし: %s", condition.name.c_str());
        return std::nullopt;
    }

    auto bitmap = bitmap_supplier_(*condition.path, condition.area.width, condition.area.height);
    if (!bitmap) {
        ALOG_DEBUG("condition", "テンプレート供給不可: %s (%s)",
                   condition.name.c_str(), condition.path->c_str());
        return std::nullopt;
    }

    detection_count_++;
    return std::visit([&](const auto& type) -> DetectionResult {
        using T = std::decay_t<decltype(type)>;
        if constexpr (std::is_same_v<T, ExactDetection>) {
            return detector_.detectCondition(*bitmap, condition.area, condition.threshold);
        } else {
            static_assert(std::is_same_v<T, WholeScreenDetection>,
                          "unhandled detection type");
            return detector_.detectCondition(*bitmap, condition.threshold);
        }
    }, condition.detection_type);
}

} // namespace autoscene
