// =============================================================================
// FrameSource 実装 - ディレクトリ走査 + stbi_load
// =============================================================================
#include "runner/frame_source.hpp"
#include "autoscene_log.hpp"

#include <stb_image.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

static constexpr const char* TAG = "frames";

namespace autoscene::runner {

static bool isAllowed(const fs::path& p, const FrameSourceConfig& cfg) {
    auto ext = p.extension().string();
    // 小文字化
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    if (ext == ".png") return cfg.allow_png;
    if (ext == ".jpg" || ext == ".jpeg") return cfg.allow_jpg;
    if (ext == ".bmp") return cfg.allow_bmp;
    return false;
}

autoscene::Result<std::vector<std::string>, IoError>
listFrameFiles(const std::string& dir, const FrameSourceConfig& cfg) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return IoError("frames directory not found: " + dir, IoError::Kind::NotFound);
    }

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        if (!isAllowed(entry.path(), cfg)) continue;
        files.push_back(entry.path().u8string());
    }
    if (ec) {
        return IoError("cannot list " + dir + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    ALOG_INFO(TAG, "%zu frames in %s", files.size(), dir.c_str());
    return files;
}

autoscene::Result<Bitmap, IoError> loadFrame(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    unsigned char* img = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!img) {
        return IoError("stbi_load失敗: " + path + " (" + stbi_failure_reason() + ")",
                       IoError::Kind::DecodeFailed);
    }
    Bitmap bmp(w, h);
    std::copy(img, img + static_cast<size_t>(w) * h * 4, bmp.rgba.begin());
    stbi_image_free(img);
    return bmp;
}

} // namespace autoscene::runner
