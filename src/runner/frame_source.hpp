#pragma once
// =============================================================================
// FrameSource — ディレクトリ内の画像をキャプチャ列として読む
// =============================================================================
// 対象: .png / .jpg / .jpeg / .bmp（ファイル名順）
// デコードは stbi_load (RGBA)。読込失敗フレームはエラーを返し、呼び出し側が
// スキップする。
// =============================================================================

#include "detection/bitmap.hpp"
#include "result.hpp"

#include <string>
#include <vector>

namespace autoscene::runner {

struct FrameSourceConfig {
    bool allow_png = true;
    bool allow_jpg = true;
    bool allow_bmp = true;
};

autoscene::Result<std::vector<std::string>, IoError>
listFrameFiles(const std::string& dir, const FrameSourceConfig& cfg = {});

autoscene::Result<Bitmap, IoError> loadFrame(const std::string& path);

} // namespace autoscene::runner
