#ifndef PIXBLEND_COLOR_COLOR_H
#define PIXBLEND_COLOR_COLOR_H

#include <cstdint>
#include "../core/common.h"

namespace PIXBLEND_NAMESPACE {

// ========================================================================
// チャンネル値の範囲定数
// ========================================================================
//
// 全ブレンド式は 16bit 範囲 [0, 65535] の浮動小数点で計算する。
// CHANNEL_MID は整数ではない（32767.5）。
//

constexpr double CHANNEL_MAX = 65535.0;
constexpr double CHANNEL_MID = CHANNEL_MAX / 2.0;

// ========================================================================
// Color16 - チャンネルネイティブ表現（画像境界で使用）
// ========================================================================

struct Color16 {
    uint16_t r = 0;
    uint16_t g = 0;
    uint16_t b = 0;
    uint16_t a = 0;

    constexpr Color16() = default;
    constexpr Color16(uint16_t r_, uint16_t g_, uint16_t b_, uint16_t a_)
        : r(r_), g(g_), b(b_), a(a_) {}

    constexpr bool operator==(const Color16& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    constexpr bool operator!=(const Color16& o) const { return !(*this == o); }
};

// ========================================================================
// ColorF - 浮動小数点表現（ブレンド計算用）
// ========================================================================
//
// 各成分は概念上 [0, CHANNEL_MAX] だが、計算途中では範囲外になってよい。
// Color16 へ戻す際に fromFloat() でクランプされる。
//

struct ColorF {
    double r = 0;
    double g = 0;
    double b = 0;
    double a = 0;

    constexpr ColorF() = default;
    constexpr ColorF(double r_, double g_, double b_, double a_)
        : r(r_), g(g_), b(b_), a(a_) {}

    // RGB成分の合計（Darker/Lighter Color の比較用）
    constexpr double sumRGB() const { return r + g + b; }
};

// ========================================================================
// HSL - 色相・彩度・輝度（HSL系モードの中間表現）
// ========================================================================
//
// h: 度数 [0, 360)
// s: [0, 1]
// l: [0, CHANNEL_MAX]
//

struct HSL {
    double h = 0;
    double s = 0;
    double l = 0;
};

// ========================================================================
// 変換関数
// ========================================================================

// Color16 → ColorF（無損失）
constexpr ColorF toFloat(const Color16& c) {
    return ColorF(c.r, c.g, c.b, c.a);
}

// double → 16bitチャンネル値
// [0, 65535] にクランプ後、+0.5 して切り捨て（ビット再現性のある丸め）
// NaN は 0 として扱う
constexpr uint16_t channelFromFloat(double v) {
    if (!(v > 0.0)) return 0;
    if (v > CHANNEL_MAX) return 0xFFFF;
    return static_cast<uint16_t>(static_cast<int32_t>(v + 0.5));
}

// double → 8bitチャンネル値（丸め規則は16bit版と同じ）
constexpr uint8_t channelFromFloat8(double v) {
    if (!(v > 0.0)) return 0;
    if (v > 255.0) return 0xFF;
    return static_cast<uint8_t>(static_cast<int32_t>(v + 0.5));
}

// 8bit ↔ 16bit チャンネル変換
// expand: v * 257（0→0, 255→65535）
// reduce: 上位バイトを取る
constexpr uint16_t expand8to16(uint8_t v) {
    return static_cast<uint16_t>(v * 257u);
}
constexpr uint8_t reduce16to8(uint16_t v) {
    return static_cast<uint8_t>(v >> 8);
}

// ColorF → Color16（各チャンネルをクランプ・丸め）
constexpr Color16 fromFloat(const ColorF& c) {
    return Color16(channelFromFloat(c.r), channelFromFloat(c.g),
                   channelFromFloat(c.b), channelFromFloat(c.a));
}

// RGB → HSL（アルファは無視）
// 無彩色（r == g == b）では s = 0, h = 0
HSL rgbToHsl(const ColorF& c);

inline HSL rgbToHsl(const Color16& c) {
    return rgbToHsl(toFloat(c));
}

// HSL → RGB
// 戻り値のアルファは CHANNEL_MAX（呼び出し側で差し替える）
ColorF hslToRgb(double h, double s, double l);

inline ColorF hslToRgb(const HSL& hsl) {
    return hslToRgb(hsl.h, hsl.s, hsl.l);
}

} // namespace PIXBLEND_NAMESPACE

#endif // PIXBLEND_COLOR_COLOR_H
