// =============================================================================
// CpuImageDetector — OpenCV matchTemplate によるCPU版テンプレート照合
// =============================================================================
// ImageDetector のリファレンス実装（GPU/ネイティブ検出器が無い環境・テスト用）。
// - setScreenMetrics: 長辺が detection_quality px に収まる縮小率を決定
// - setupDetection:   フレームを Gray8 化（原寸 + 縮小の2枚を保持、バッファ再利用）
// - EXACT:            原寸フレームからエリアを切り出し、テンプレートと同じ経路で縮小して比較
// - WHOLE_SCREEN:     縮小フレーム全体に cv::matchTemplate (TM_CCOEFF_NORMED)
// 判定: confidence*100 >= 100 - threshold
// =============================================================================
#pragma once

#include "detection/image_detector.hpp"

#include <opencv2/core.hpp>

#include <cstdint>

namespace autoscene {

class CpuImageDetector : public ImageDetector {
public:
    struct Stats {
        uint64_t setup_calls = 0;
        uint64_t exact_calls = 0;
        uint64_t whole_screen_calls = 0;
        uint64_t metrics_updates = 0;
    };

    CpuImageDetector() = default;

    void setScreenMetrics(const Bitmap& screen, double detection_quality) override;
    void setupDetection(const Bitmap& screen) override;
    DetectionResult detectCondition(const Bitmap& condition_bitmap,
                                    const Rect& area, int threshold) override;
    DetectionResult detectCondition(const Bitmap& condition_bitmap,
                                    int threshold) override;

    double scale() const { return scale_; }
    int workingWidth() const { return screen_.cols; }
    int workingHeight() const { return screen_.rows; }
    Stats getStats() const { return stats_; }

private:
    static void toGray(const Bitmap& src, cv::Mat& dst);
    static void downscale(const cv::Mat& src, double scale, cv::Mat& dst);
    static double compareSameSize(const cv::Mat& region, const cv::Mat& tpl);
    static bool isFlat(const cv::Mat& img);
    static bool isDetected(double confidence, int threshold);

    bool metrics_ready_ = false;
    double scale_ = 1.0;
    int metrics_w_ = 0;
    int metrics_h_ = 0;

    cv::Mat screen_full_;  // 現在フレーム Gray8（原寸）
    cv::Mat screen_;       // 現在フレーム Gray8（縮小済み）
    cv::Mat tpl_gray_;     // 以下、照合ごとの作業バッファ（再利用）
    cv::Mat tpl_buf_;
    cv::Mat region_buf_;
    cv::Mat score_buf_;
    Stats stats_;
};

} // namespace autoscene
