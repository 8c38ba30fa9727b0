#include "pixel_format.h"
#include <cstring>

namespace PIXBLEND_NAMESPACE {

static_assert(sizeof(Color16) == 8, "Color16 must match RGBA16 pixel layout");

// ========================================================================
// RGBA16: Color16 と同一レイアウトなのでコピー
// ========================================================================

static void rgba16_toColor16(void* dst, const void* src, int pixelCount) {
    std::memcpy(dst, src, static_cast<size_t>(pixelCount) * sizeof(Color16));
}

static void rgba16_fromColor16(void* dst, const void* src, int pixelCount) {
    std::memcpy(dst, src, static_cast<size_t>(pixelCount) * sizeof(Color16));
}

// ========================================================================
// RGBA8_Straight: 8bit ↔ 16bit
// ========================================================================
// 拡張: v16 = v8 * 257（0→0, 255→65535 の完全対応）
// 縮小: v8 = v16 >> 8

static void rgba8Straight_toColor16(void* dst, const void* src, int pixelCount) {
    const uint8_t* s = static_cast<const uint8_t*>(src);
    Color16* d = static_cast<Color16*>(dst);
    for (int i = 0; i < pixelCount; ++i) {
        d[i].r = expand8to16(s[0]);
        d[i].g = expand8to16(s[1]);
        d[i].b = expand8to16(s[2]);
        d[i].a = expand8to16(s[3]);
        s += 4;
    }
}

static void rgba8Straight_fromColor16(void* dst, const void* src, int pixelCount) {
    const Color16* s = static_cast<const Color16*>(src);
    uint8_t* d = static_cast<uint8_t*>(dst);
    for (int i = 0; i < pixelCount; ++i) {
        d[0] = reduce16to8(s[i].r);
        d[1] = reduce16to8(s[i].g);
        d[2] = reduce16to8(s[i].b);
        d[3] = reduce16to8(s[i].a);
        d += 4;
    }
}

// ========================================================================
// 組み込みフォーマット定義
// ========================================================================

namespace BuiltinFormats {

const PixelFormatDescriptor RGBA16 = {
    "RGBA16",
    8,  // bytesPerPixel
    4,  // channelCount
    true,  // hasAlpha
    rgba16_toColor16,
    rgba16_fromColor16
};

const PixelFormatDescriptor RGBA8_Straight = {
    "RGBA8_Straight",
    4,  // bytesPerPixel
    4,  // channelCount
    true,  // hasAlpha
    rgba8Straight_toColor16,
    rgba8Straight_fromColor16
};

} // namespace BuiltinFormats

} // namespace PIXBLEND_NAMESPACE
