// =============================================================================
// CpuImageDetector — OpenCV 実装
// =============================================================================

#include "detection/cpu_image_detector.hpp"
#include "autoscene_log.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

static constexpr const char* TAG = "CpuDetector";

namespace autoscene {

// 標準偏差がこれ未満の画像は平坦とみなす（NCC が定義できない）
static constexpr double kFlatStdDev = 1e-3;

// float 演算誤差の吸収（完全一致が threshold=0 で落ちないように）
static constexpr double kConfidenceEps = 1e-4;

static inline int scaled(int v, double scale) {
    return static_cast<int>(std::lround(v * scale));
}

// =============================================================================
// キャリブレーション
// =============================================================================

void CpuImageDetector::setScreenMetrics(const Bitmap& screen, double detection_quality) {
    if (screen.empty()) {
        throw std::invalid_argument("setScreenMetrics: empty screen");
    }
    if (detection_quality <= 0.0) {
        throw std::invalid_argument("setScreenMetrics: detection_quality must be > 0");
    }

    const int longest = std::max(screen.width, screen.height);
    scale_ = std::min(1.0, detection_quality / static_cast<double>(longest));
    metrics_w_ = screen.width;
    metrics_h_ = screen.height;
    metrics_ready_ = true;
    stats_.metrics_updates++;

    ALOG_INFO(TAG, "screen metrics: %dx%d quality=%.0f scale=%.3f",
              screen.width, screen.height, detection_quality, scale_);
}

void CpuImageDetector::setupDetection(const Bitmap& screen) {
    if (!metrics_ready_) {
        throw std::logic_error("setupDetection: setScreenMetrics was never called");
    }
    if (screen.empty()) {
        throw std::invalid_argument("setupDetection: empty screen");
    }
    if (screen.width != metrics_w_ || screen.height != metrics_h_) {
        ALOG_WARN(TAG, "frame %dx%d differs from calibrated %dx%d (metrics not invalidated?)",
                  screen.width, screen.height, metrics_w_, metrics_h_);
    }
    toGray(screen, screen_full_);
    downscale(screen_full_, scale_, screen_);
    stats_.setup_calls++;
}

// =============================================================================
// 照合
// =============================================================================

DetectionResult CpuImageDetector::detectCondition(const Bitmap& condition_bitmap,
                                                  const Rect& area, int threshold) {
    if (screen_.empty()) {
        throw std::logic_error("detectCondition: no frame loaded");
    }
    stats_.exact_calls++;

    DetectionResult result;
    result.position = area.center();

    // 比較領域はテンプレートの原寸。エリア原点から切り出す
    const cv::Rect roi(area.x, area.y, condition_bitmap.width, condition_bitmap.height);
    if (roi.x < 0 || roi.y < 0 ||
        roi.x + roi.width > screen_full_.cols || roi.y + roi.height > screen_full_.rows) {
        ALOG_DEBUG(TAG, "EXACT area out of frame: (%d,%d %dx%d)",
                   area.x, area.y, area.width, area.height);
        return result;
    }

    // 原寸の切り出しとテンプレートを同じ縮小経路に通す（サンプリング格子を揃える）
    toGray(condition_bitmap, tpl_gray_);
    downscale(tpl_gray_, scale_, tpl_buf_);
    downscale(screen_full_(roi), scale_, region_buf_);

    result.confidence = compareSameSize(region_buf_, tpl_buf_);
    result.is_detected = isDetected(result.confidence, threshold);
    return result;
}

DetectionResult CpuImageDetector::detectCondition(const Bitmap& condition_bitmap,
                                                  int threshold) {
    if (screen_.empty()) {
        throw std::logic_error("detectCondition: no frame loaded");
    }
    stats_.whole_screen_calls++;

    DetectionResult result;
    toGray(condition_bitmap, tpl_gray_);
    downscale(tpl_gray_, scale_, tpl_buf_);
    if (tpl_buf_.cols > screen_.cols || tpl_buf_.rows > screen_.rows) {
        ALOG_DEBUG(TAG, "template %dx%d larger than frame %dx%d",
                   tpl_buf_.cols, tpl_buf_.rows, screen_.cols, screen_.rows);
        return result;
    }

    // 平坦なテンプレートは相関が定義できないので二乗誤差最小の位置を探す
    cv::Point best;
    if (isFlat(tpl_buf_)) {
        cv::matchTemplate(screen_, tpl_buf_, score_buf_, cv::TM_SQDIFF);
        cv::minMaxLoc(score_buf_, nullptr, nullptr, &best, nullptr);
        const cv::Rect hit(best.x, best.y, tpl_buf_.cols, tpl_buf_.rows);
        result.confidence = compareSameSize(screen_(hit), tpl_buf_);
    } else {
        double max_score = 0.0;
        cv::matchTemplate(screen_, tpl_buf_, score_buf_, cv::TM_CCOEFF_NORMED);
        cv::minMaxLoc(score_buf_, nullptr, &max_score, nullptr, &best);
        result.confidence = std::clamp(max_score, 0.0, 1.0);
    }

    // 縮小座標 → フレーム座標（マッチ中心）
    result.position.x = static_cast<int>(std::lround((best.x + tpl_buf_.cols / 2.0) / scale_));
    result.position.y = static_cast<int>(std::lround((best.y + tpl_buf_.rows / 2.0) / scale_));
    result.is_detected = isDetected(result.confidence, threshold);
    return result;
}

// =============================================================================
// 内部ヘルパー
// =============================================================================

void CpuImageDetector::toGray(const Bitmap& src, cv::Mat& dst) {
    if (src.empty()) {
        throw std::invalid_argument("toGray: empty bitmap");
    }
    const cv::Mat view(src.height, src.width, CV_8UC4, const_cast<uint8_t*>(src.rgba.data()));
    cv::cvtColor(view, dst, cv::COLOR_RGBA2GRAY);
}

void CpuImageDetector::downscale(const cv::Mat& src, double scale, cv::Mat& dst) {
    const cv::Size size(std::max(1, scaled(src.cols, scale)),
                        std::max(1, scaled(src.rows, scale)));
    if (size == src.size()) {
        src.copyTo(dst);
        return;
    }
    cv::resize(src, dst, size, 0.0, 0.0, cv::INTER_AREA);
}

bool CpuImageDetector::isFlat(const cv::Mat& img) {
    cv::Scalar mean, stddev;
    cv::meanStdDev(img, mean, stddev);
    return stddev[0] < kFlatStdDev;
}

double CpuImageDetector::compareSameSize(const cv::Mat& region, const cv::Mat& tpl) {
    // 平坦な領域が絡む場合は RMS 輝度差で評価
    if (isFlat(region) || isFlat(tpl)) {
        const double rms = cv::norm(region, tpl, cv::NORM_L2) /
                           std::sqrt(static_cast<double>(tpl.total()));
        return std::clamp(1.0 - rms / 255.0, 0.0, 1.0);
    }

    cv::Mat score;
    cv::matchTemplate(region, tpl, score, cv::TM_CCOEFF_NORMED);
    return std::clamp(static_cast<double>(score.at<float>(0, 0)), 0.0, 1.0);
}

bool CpuImageDetector::isDetected(double confidence, int threshold) {
    const int tolerance = std::clamp(threshold, 0, 100);
    return confidence * 100.0 + kConfidenceEps * 100.0 >= static_cast<double>(100 - tolerance);
}

} // namespace autoscene
