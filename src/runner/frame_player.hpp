#pragma once
// =============================================================================
// FramePlayer — 画像列を ScenarioProcessor に流す再生ループ
// =============================================================================
// - 各フレームの前にキャンセルを確認（プロセッサ側の安全点に依存しない）
// - 読込失敗フレームはスキップ。1周で1枚も読めなければ打ち切る
// - フレームサイズが変わったら screen metrics を無効化
// =============================================================================

#include "detection/bitmap.hpp"
#include "result.hpp"
#include "scenario/cancellation.hpp"
#include "scenario/scenario_processor.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace autoscene::runner {

using FrameLoader = std::function<autoscene::Result<Bitmap, IoError>(const std::string&)>;

struct PlaybackOptions {
    int loops = 1;               // 0 = 無限
    int frame_interval_ms = 0;
};

struct PlaybackResult {
    PassStatus status = PassStatus::COMPLETED;
    uint64_t frames_played = 0;
    uint64_t frames_skipped = 0;
    bool no_loadable_frames = false;   // 1周すべて読込失敗で打ち切り
};

PlaybackResult playFrames(ScenarioProcessor& processor,
                          const std::vector<std::string>& paths,
                          const PlaybackOptions& options,
                          const CancellationToken& token,
                          const FrameLoader& loader);

} // namespace autoscene::runner
