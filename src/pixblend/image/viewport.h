#ifndef PIXBLEND_VIEWPORT_H
#define PIXBLEND_VIEWPORT_H

#include <cstddef>
#include <cstdint>
#include "../core/common.h"
#include "../core/types.h"
#include "../color/color.h"
#include "pixel_format.h"

namespace PIXBLEND_NAMESPACE {

// ========================================================================
// ViewPort - 純粋ビュー（軽量POD）
// ========================================================================
//
// 画像データへの軽量なビューです。
// - メモリを所有しない（参照のみ）
// - バウンディング矩形の原点 (x, y) を持つ（(0,0) である必要はない）
// - pixelAt() はローカル座標（左上 = 0,0）
// - colorAt() / setColorAt() はバウンディング矩形の座標系
//

struct ViewPort {
    void* data = nullptr;
    PixelFormatID formatID = PixelFormatIDs::RGBA16;
    int32_t stride = 0;     // 負値でY軸反転対応
    int32_t x = 0;          // バウンディング矩形の原点
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    // デフォルトコンストラクタ
    ViewPort() = default;

    // 直接初期化
    ViewPort(void* d, PixelFormatID fmt, int32_t str, int32_t w, int32_t h)
        : data(d), formatID(fmt), stride(str), width(w), height(h) {}

    // バウンディング矩形指定
    ViewPort(void* d, PixelFormatID fmt, int32_t str, const Rect& bounds)
        : data(d), formatID(fmt), stride(str)
        , x(bounds.minX), y(bounds.minY)
        , width(bounds.width()), height(bounds.height()) {}

    // 簡易初期化（strideを自動計算）
    ViewPort(void* d, int32_t w, int32_t h, PixelFormatID fmt = PixelFormatIDs::RGBA16)
        : data(d), formatID(fmt)
        , stride(w * getBytesPerPixel(fmt))
        , width(w), height(h) {}

    // 有効判定
    // 右端・下端 (x + width, y + height) が int32 に収まらない配置も無効
    bool isValid() const {
        return data != nullptr && formatID != nullptr && width > 0 && height > 0
            && static_cast<int64_t>(x) + width <= INT32_MAX
            && static_cast<int64_t>(y) + height <= INT32_MAX;
    }

    Rect bounds() const { return Rect::fromSize(x, y, width, height); }

    // ピクセルアドレス取得（ローカル座標、strideが負の場合もサポート）
    void* pixelAt(int lx, int ly) {
        return static_cast<uint8_t*>(data) + static_cast<int_fast32_t>(ly) * stride
               + lx * getBytesPerPixel(formatID);
    }

    const void* pixelAt(int lx, int ly) const {
        return static_cast<const uint8_t*>(data) + static_cast<int_fast32_t>(ly) * stride
               + lx * getBytesPerPixel(formatID);
    }

    // 色の取得・設定（バウンディング矩形の座標系、範囲外は呼び出し側で排除すること）
    Color16 colorAt(int px, int py) const;
    void setColorAt(int px, int py, const Color16& c);

    // バイト情報
    int_fast8_t bytesPerPixel() const { return getBytesPerPixel(formatID); }
    uint32_t rowBytes() const {
        return static_cast<uint32_t>(width) * static_cast<uint32_t>(bytesPerPixel());
    }
};

// ========================================================================
// view_ops - ViewPort操作（フリー関数）
// ========================================================================

namespace view_ops {

// サブビュー作成（ローカル座標で指定、原点もずらす）
inline ViewPort subView(const ViewPort& v, int32_t lx, int32_t ly, int32_t w, int32_t h) {
    auto bpp = v.bytesPerPixel();
    void* subData = static_cast<uint8_t*>(v.data) + ly * v.stride + lx * bpp;
    ViewPort sub(subData, v.formatID, v.stride, w, h);
    sub.x = v.x + lx;
    sub.y = v.y + ly;
    return sub;
}

// 矩形コピー（ローカル座標、同一フォーマット専用）
void copy(ViewPort& dst, int dstX, int dstY,
          const ViewPort& src, int srcX, int srcY,
          int width, int height);

// 行読み出し: ローカル座標 (lx, ly) から count ピクセルを Color16 に変換
void readRow(const ViewPort& v, int lx, int ly, int count, Color16* out);

// 行書き込み: Color16 を count ピクセル分フォーマット変換して書き込む
void writeRow(ViewPort& v, int lx, int ly, int count, const Color16* in);

} // namespace view_ops

} // namespace PIXBLEND_NAMESPACE

#endif // PIXBLEND_VIEWPORT_H
