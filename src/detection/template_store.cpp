// =============================================================================
// テンプレートストア - stbi_loadによるファイル読込 + サイズ別キャッシュ
// =============================================================================

#include "detection/template_store.hpp"

#include "autoscene_log.hpp"

#include <stb_image.h>

#include <algorithm>
#include <filesystem>
#include <utility>

static constexpr const char* TAG = "TplStore";

namespace autoscene {

std::string TemplateStore::resolvePath(const std::string& path) const {
    namespace fs = std::filesystem;
    fs::path p = fs::u8path(path);
    if (p.is_absolute() || cfg_.base_dir.empty()) return p.u8string();
    return (fs::u8path(cfg_.base_dir) / p).u8string();
}

autoscene::Result<void> TemplateStore::loadFromFile(const std::string& path) {
    if (path.empty()) {
        return IoError("empty template path", IoError::Kind::NotFound);
    }

    const std::string file = resolvePath(path);
    int w = 0, h = 0, channels = 0;
    unsigned char* img = stbi_load(file.c_str(), &w, &h, &channels, 4);
    if (!img) {
        std::string err = "stbi_load失敗: " + file + " (" + stbi_failure_reason() + ")";
        ALOG_ERROR(TAG, "%s", err.c_str());
        return IoError(err, IoError::Kind::DecodeFailed);
    }

    auto bmp = std::make_shared<Bitmap>(w, h);
    std::copy(img, img + static_cast<size_t>(w) * h * 4, bmp->rgba.begin());
    stbi_image_free(img);

    TemplateHandle th;
    th.path = path;
    th.source_path_utf8 = file;
    th.original = std::move(bmp);
    th.debug = "loaded(rgba)";

    remove(path);  // 古いサイズ別キャッシュを破棄
    failed_.erase(path);
    map_[path] = std::move(th);

    ALOG_DEBUG(TAG, "テンプレート読込: %s %dx%d (ch=%d)", file.c_str(), w, h, channels);
    return autoscene::Ok();
}

autoscene::Result<void> TemplateStore::registerBitmap(const std::string& path, Bitmap bitmap) {
    if (path.empty()) {
        return autoscene::Err<void>("empty template path");
    }
    if (bitmap.empty() ||
        bitmap.rgba.size() != static_cast<size_t>(bitmap.width) * bitmap.height * 4) {
        return autoscene::Err<void>("invalid bitmap for " + path);
    }

    remove(path);
    failed_.erase(path);

    TemplateHandle th;
    th.path = path;
    th.original = std::make_shared<const Bitmap>(std::move(bitmap));
    th.debug = "registered";
    map_[path] = std::move(th);
    return autoscene::Ok();
}

std::shared_ptr<const Bitmap> TemplateStore::supply(const std::string& path,
                                                    int width, int height) {
    if (path.empty() || width <= 0 || height <= 0) return nullptr;

    auto key = std::make_tuple(path, width, height);
    auto cached = resized_.find(key);
    if (cached != resized_.end()) return cached->second;

    auto it = map_.find(path);
    if (it == map_.end()) {
        if (!cfg_.lazy_load || failed_.count(path)) return nullptr;
        auto r = loadFromFile(path);
        if (r.is_err()) {
            ALOG_WARN(TAG, "テンプレート供給不可: %s", r.error().message.c_str());
            failed_.insert(path);
            return nullptr;
        }
        it = map_.find(path);
    }

    const auto& original = it->second.original;
    std::shared_ptr<const Bitmap> out;
    if (original->width == width && original->height == height) {
        out = original;
    } else {
        out = std::make_shared<const Bitmap>(resizeNearest(*original, width, height));
        ALOG_TRACE(TAG, "リサイズ: %s %dx%d → %dx%d", path.c_str(),
                   original->width, original->height, width, height);
    }
    resized_.emplace(std::move(key), out);
    return out;
}

BitmapSupplier TemplateStore::asSupplier() {
    return [this](const std::string& path, int width, int height) {
        return supply(path, width, height);
    };
}

const TemplateHandle* TemplateStore::get(const std::string& path) const {
    auto it = map_.find(path);
    return it != map_.end() ? &it->second : nullptr;
}

std::vector<std::string> TemplateStore::listPaths() const {
    std::vector<std::string> paths;
    paths.reserve(map_.size());
    for (const auto& kv : map_) paths.push_back(kv.first);
    std::sort(paths.begin(), paths.end());
    return paths;
}

void TemplateStore::remove(const std::string& path) {
    map_.erase(path);
    for (auto it = resized_.begin(); it != resized_.end();) {
        if (std::get<0>(it->first) == path) it = resized_.erase(it);
        else ++it;
    }
}

void TemplateStore::clear() {
    map_.clear();
    resized_.clear();
    failed_.clear();
}

} // namespace autoscene
