// =============================================================================
// ImageDetector — テンプレート照合の抽象インターフェース
// =============================================================================
// 呼び出し順:
//   setScreenMetrics() … 解像度変更時のみ（キャリブレーション）
//   setupDetection()   … 毎フレーム（現在フレームを読み込む）
//   detectCondition()  … 条件ごと（読み込み済みフレームに対して照合）
// =============================================================================
#pragma once

#include "detection/bitmap.hpp"

#include <functional>
#include <memory>
#include <string>

namespace autoscene {

// 1条件・1フレームにつき1つ生成。生成後は不変。
struct DetectionResult {
    bool is_detected = false;
    Point position;            // フレーム座標系（マッチ中心）
    double confidence = 0.0;   // 0.0 - 1.0
};

// テンプレート供給: (パス, 幅, 高さ) → ビットマップ。nullptr = 供給不能
using BitmapSupplier =
    std::function<std::shared_ptr<const Bitmap>(const std::string& path, int width, int height)>;

class ImageDetector {
public:
    virtual ~ImageDetector() = default;

    // 画面サイズ・検出品質から内部スケールを再計算する
    virtual void setScreenMetrics(const Bitmap& screen, double detection_quality) = 0;

    // 現在フレームを検出用に読み込む
    virtual void setupDetection(const Bitmap& screen) = 0;

    // EXACT: area の位置だけを照合
    virtual DetectionResult detectCondition(const Bitmap& condition_bitmap,
                                            const Rect& area, int threshold) = 0;

    // WHOLE_SCREEN: フレーム全体を探索
    virtual DetectionResult detectCondition(const Bitmap& condition_bitmap,
                                            int threshold) = 0;
};

} // namespace autoscene
