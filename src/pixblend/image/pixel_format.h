#ifndef PIXBLEND_PIXEL_FORMAT_H
#define PIXBLEND_PIXEL_FORMAT_H

#include <cstdint>
#include <cstddef>
#include "../core/common.h"
#include "../color/color.h"

namespace PIXBLEND_NAMESPACE {

// ========================================================================
// ピクセルフォーマット記述子（カラーモデル）
// ========================================================================
//
// 画像のカラーモデルを表す。2つの画像の互換性は記述子ポインタの一致で判定する。
// 合成処理はすべて Color16 行バッファを経由するため、
// 各フォーマットは Color16 との相互変換関数のみ提供すればよい。
//

struct PixelFormatDescriptor {
    const char* name;

    uint8_t bytesPerPixel;          // ピクセルあたりのバイト数
    uint8_t channelCount;           // チャンネル総数
    bool hasAlpha;

    // 統一シグネチャ: void(*)(void* dst, const void* src, int pixelCount)
    using ConvertFunc = void(*)(void* dst, const void* src, int pixelCount);

    // 各フォーマット → Color16 配列
    ConvertFunc toColor16;
    // Color16 配列 → 各フォーマット
    ConvertFunc fromColor16;
};

// ========================================================================
// ピクセルフォーマットID（Descriptor ポインタ）
// ========================================================================

using PixelFormatID = const PixelFormatDescriptor*;

// ========================================================================
// 組み込みフォーマット
// ========================================================================

namespace BuiltinFormats {
    // 16bit RGBA ストレート（チャンネルネイティブ形式）
    extern const PixelFormatDescriptor RGBA16;
    // 8bit RGBA ストレート（読み出し時に v*257 で16bitへ拡張）
    extern const PixelFormatDescriptor RGBA8_Straight;
}

namespace PixelFormatIDs {
    inline const PixelFormatID RGBA16 = &BuiltinFormats::RGBA16;
    inline const PixelFormatID RGBA8_Straight = &BuiltinFormats::RGBA8_Straight;
}

// ========================================================================
// ヘルパー関数
// ========================================================================

inline int_fast8_t getBytesPerPixel(PixelFormatID formatID) {
    return formatID ? static_cast<int_fast8_t>(formatID->bytesPerPixel) : 0;
}

// 行単位の変換（pixelCount ピクセル）
inline void convertToColor16(Color16* dst, const void* src, PixelFormatID srcFormat,
                             int pixelCount) {
    srcFormat->toColor16(dst, src, pixelCount);
}

inline void convertFromColor16(void* dst, PixelFormatID dstFormat, const Color16* src,
                               int pixelCount) {
    dstFormat->fromColor16(dst, src, pixelCount);
}

} // namespace PIXBLEND_NAMESPACE

#endif // PIXBLEND_PIXEL_FORMAT_H
