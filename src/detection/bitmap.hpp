// =============================================================================
// Bitmap / RawCapture — 検出用のRGBA8画像表現
// =============================================================================
// RawCapture: キャプチャ元が所有するRGBA8バッファへの非所有ビュー。
// Bitmap:     RGBA8 ピクセルを所有する作業用ビットマップ。
//             toBitmap() は既存バッファを再利用して毎フレームの確保を避ける。
// =============================================================================
#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace autoscene {

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    int right() const { return x + width; }
    int bottom() const { return y + height; }
    Point center() const { return {x + width / 2, y + height / 2}; }
    bool empty() const { return width <= 0 || height <= 0; }

    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
};

// キャプチャ元のフレーム（非所有）。stride_bytes=0 は width*4 とみなす。
struct RawCapture {
    const uint8_t* rgba = nullptr;
    int width = 0;
    int height = 0;
    int stride_bytes = 0;
};

struct Bitmap {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgba;  // width * height * 4

    Bitmap() = default;
    Bitmap(int w, int h) : width(w), height(h), rgba(static_cast<size_t>(w) * h * 4, 0) {}

    bool empty() const { return width <= 0 || height <= 0 || rgba.empty(); }

    const uint8_t* pixel(int px, int py) const {
        return rgba.data() + (static_cast<size_t>(py) * width + px) * 4;
    }
    uint8_t* pixel(int px, int py) {
        return rgba.data() + (static_cast<size_t>(py) * width + px) * 4;
    }
};

// RawCapture → Bitmap。target の既存確保を再利用する。
inline void toBitmap(const RawCapture& capture, Bitmap& target) {
    if (!capture.rgba || capture.width <= 0 || capture.height <= 0) {
        throw std::invalid_argument("toBitmap: empty capture");
    }
    const size_t row_bytes = static_cast<size_t>(capture.width) * 4;
    const size_t stride = capture.stride_bytes > 0
        ? static_cast<size_t>(capture.stride_bytes) : row_bytes;
    if (stride < row_bytes) {
        throw std::invalid_argument("toBitmap: stride smaller than row");
    }

    target.width = capture.width;
    target.height = capture.height;
    const size_t bytes = row_bytes * capture.height;
    if (target.rgba.size() != bytes) target.rgba.resize(bytes);

    if (stride == row_bytes) {
        std::memcpy(target.rgba.data(), capture.rgba, bytes);
        return;
    }
    for (int row = 0; row < capture.height; ++row) {
        std::memcpy(target.rgba.data() + row * row_bytes,
                    capture.rgba + row * stride, row_bytes);
    }
}

// 最近傍リサイズ（テンプレートを条件エリアのサイズに合わせる用途）
inline Bitmap resizeNearest(const Bitmap& src, int width, int height) {
    if (src.empty() || width <= 0 || height <= 0) {
        throw std::invalid_argument("resizeNearest: invalid size");
    }
    if (src.width == width && src.height == height) return src;

    Bitmap dst(width, height);
    for (int y = 0; y < height; ++y) {
        const int sy = static_cast<int>(static_cast<int64_t>(y) * src.height / height);
        for (int x = 0; x < width; ++x) {
            const int sx = static_cast<int>(static_cast<int64_t>(x) * src.width / width);
            std::memcpy(dst.pixel(x, y), src.pixel(sx, sy), 4);
        }
    }
    return dst;
}

} // namespace autoscene
