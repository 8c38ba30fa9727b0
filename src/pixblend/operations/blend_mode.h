#ifndef PIXBLEND_OPERATIONS_BLEND_MODE_H
#define PIXBLEND_OPERATIONS_BLEND_MODE_H

#include <cstdint>
#include "../core/common.h"
#include "../color/color.h"
#include "channel_blend.h"

namespace PIXBLEND_NAMESPACE {

// ========================================================================
// BlendModeID - ブレンドモード識別子（閉じた列挙）
// ========================================================================
//
// Photoshop のメニュー順 + 追加モード。
//

enum class BlendModeID : uint8_t {
    // 暗
    Darken,
    Multiply,
    ColorBurn,
    LinearBurn,
    DarkerColor,
    // 明
    Lighten,
    Screen,
    ColorDodge,
    LinearDodge,
    LighterColor,
    // コントラスト
    Overlay,
    SoftLight,
    HardLight,
    VividLight,
    LinearLight,
    PinLight,
    HardMix,
    // 差分
    Difference,
    Exclusion,
    Subtract,
    Divide,
    // HSL
    Hue,
    Saturation,
    Color,
    Luminosity,
    // 追加モード
    Add,
    Reflex,
    Phoenix,
};

constexpr int BlendModeCount = static_cast<int>(BlendModeID::Phoenix) + 1;

// 列挙範囲内の ID か（整数からキャストした ID の検証用）
constexpr bool isValidBlendModeID(BlendModeID id) {
    return static_cast<int>(id) < BlendModeCount;
}

// ========================================================================
// BlendMode - ブレンドモードの共通インターフェース
// ========================================================================
//
// チャンネル単位のモード（ChannelBlendMode）と色全体を扱うモード
// （ColorBlendMode）の両方がこのインターフェースを実装する。
// 合成ループ側はどちらかを区別しない。
//

class BlendMode {
public:
    virtual ~BlendMode() = default;

    BlendModeID id() const { return id_; }
    const char* name() const { return name_; }

    // dst（下層）と src（上層）を合成する。アルファは dst の値を使う。
    // 戻り値はクランプ前
    virtual ColorF apply(const ColorF& dst, const ColorF& src) const = 0;

    // Color16 版（toFloat → apply → fromFloat）
    Color16 blend(const Color16& dst, const Color16& src) const {
        return fromFloat(apply(toFloat(dst), toFloat(src)));
    }

protected:
    BlendMode(BlendModeID id, const char* name) : id_(id), name_(name) {}

private:
    BlendModeID id_;
    const char* name_;
};

// ------------------------------------------------------------------------
// ChannelBlendMode - RGB各チャンネルに同じ関数を適用するモード
// ------------------------------------------------------------------------

class ChannelBlendMode : public BlendMode {
public:
    ChannelBlendMode(BlendModeID id, const char* name, ChannelBlendFunc func)
        : BlendMode(id, name), func_(func) {}

    ColorF apply(const ColorF& dst, const ColorF& src) const override {
        return blendPerChannel(dst, src, func_);
    }

    ChannelBlendFunc function() const { return func_; }

private:
    ChannelBlendFunc func_;
};

// ------------------------------------------------------------------------
// ColorBlendMode - 色全体を入力とするモード
// ------------------------------------------------------------------------

using ColorBlendFunc = ColorF (*)(const ColorF& dst, const ColorF& src);

class ColorBlendMode : public BlendMode {
public:
    ColorBlendMode(BlendModeID id, const char* name, ColorBlendFunc func)
        : BlendMode(id, name), func_(func) {}

    ColorF apply(const ColorF& dst, const ColorF& src) const override {
        return func_(dst, src);
    }

private:
    ColorBlendFunc func_;
};

namespace color_blend {

// ========================================================================
// 色全体ブレンド関数
// ========================================================================
//
// いずれも戻り値のアルファは dst.a。
//

// RGB合計が小さい方（同値なら src）
ColorF darkerColor(const ColorF& dst, const ColorF& src);
// RGB合計が大きい方（同値なら dst）
ColorF lighterColor(const ColorF& dst, const ColorF& src);

// src の色相 + dst の彩度・輝度（src が無彩色なら dst をそのまま返す）
ColorF hue(const ColorF& dst, const ColorF& src);
// dst の色相・輝度 + src の彩度
ColorF saturation(const ColorF& dst, const ColorF& src);
// src の色相・彩度 + dst の輝度
ColorF color(const ColorF& dst, const ColorF& src);
// dst の色相・彩度 + src の輝度
ColorF luminosity(const ColorF& dst, const ColorF& src);

} // namespace color_blend

// ========================================================================
// モード取得
// ========================================================================

// ID からモードを取得（静的な定数オブジェクトへの参照）
// id は isValidBlendModeID(id) を満たすこと。範囲外の ID はデバッグビルドでは
// アサート、リリースビルドでは darken を返す。
const BlendMode& getBlendMode(BlendModeID id);

// モード名（"color_burn" 等）。範囲外の ID は nullptr
const char* blendModeName(BlendModeID id);

// 名前からモードを検索。見つからなければ nullptr
// 別名: "substract" → subtract, "glow" → reflex
const BlendMode* findBlendMode(const char* name);

} // namespace PIXBLEND_NAMESPACE

#endif // PIXBLEND_OPERATIONS_BLEND_MODE_H
