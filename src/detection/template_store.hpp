#pragma once
// =============================================================================
// テンプレートストア — 条件テンプレートのRGBA保持 + サイズ別キャッシュ
// =============================================================================
// キー: 条件のテンプレートパス（シナリオJSONに書かれた文字列そのまま）
// supply(path, w, h): 条件エリアサイズに合わせたビットマップを返す。
//   未登録なら base_dir/path を stbi_load で遅延読込。失敗時は nullptr
//   （= 評価不能、条件を含むイベントは不一致扱い）。
// =============================================================================

#include "detection/bitmap.hpp"
#include "result.hpp"
#include "detection/image_detector.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace autoscene {

struct TemplateHandle {
    std::string path;                          // キー
    std::string source_path_utf8;              // 実ファイル（registerBitmap時は空）
    std::shared_ptr<const Bitmap> original;    // 読込時サイズ
    std::string debug;
};

struct TemplateStoreConfig {
    std::string base_dir;       // 相対パスの基準ディレクトリ（空=カレント）
    bool lazy_load = true;      // supply() 時に未登録パスをファイルから読む
};

class TemplateStore {
public:
    TemplateStore() = default;
    explicit TemplateStore(const TemplateStoreConfig& cfg) : cfg_(cfg) {}
    void setConfig(const TemplateStoreConfig& cfg) { cfg_ = cfg; }

    // stbi_loadでファイルからRGBA読込、内部保持
    autoscene::Result<void> loadFromFile(const std::string& path);

    // 直接RGBAビットマップを登録
    autoscene::Result<void> registerBitmap(const std::string& path, Bitmap bitmap);

    // 条件エリアサイズのビットマップを返す（キャッシュ付き）
    std::shared_ptr<const Bitmap> supply(const std::string& path, int width, int height);

    // ConditionEvaluator 用アダプタ（ストアは呼び出し側が生存保証）
    BitmapSupplier asSupplier();

    const TemplateHandle* get(const std::string& path) const;
    std::vector<std::string> listPaths() const;
    void remove(const std::string& path);
    void clear();
    size_t size() const { return map_.size(); }
    size_t cachedVariants() const { return resized_.size(); }

private:
    std::string resolvePath(const std::string& path) const;

    TemplateStoreConfig cfg_;
    std::unordered_map<std::string, TemplateHandle> map_;
    std::map<std::tuple<std::string, int, int>, std::shared_ptr<const Bitmap>> resized_;
    std::set<std::string> failed_;   // 読込失敗パス（毎フレームのディスクアクセス防止）
};

} // namespace autoscene
