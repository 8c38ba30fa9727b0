#include "blend_mode.h"
#include <cstring>

namespace PIXBLEND_NAMESPACE {

// ========================================================================
// 色全体ブレンド関数
// ========================================================================

namespace color_blend {

ColorF darkerColor(const ColorF& dst, const ColorF& src) {
    ColorF result = (src.sumRGB() > dst.sumRGB()) ? dst : src;
    result.a = dst.a;
    return result;
}

ColorF lighterColor(const ColorF& dst, const ColorF& src) {
    ColorF result = (src.sumRGB() > dst.sumRGB()) ? src : dst;
    result.a = dst.a;
    return result;
}

ColorF hue(const ColorF& dst, const ColorF& src) {
    HSL s = rgbToHsl(src);
    if (s.s == 0.0) {
        return dst;
    }
    HSL d = rgbToHsl(dst);
    ColorF result = hslToRgb(s.h, d.s, d.l);
    result.a = dst.a;
    return result;
}

ColorF saturation(const ColorF& dst, const ColorF& src) {
    HSL s = rgbToHsl(src);
    HSL d = rgbToHsl(dst);
    ColorF result = hslToRgb(d.h, s.s, d.l);
    result.a = dst.a;
    return result;
}

ColorF color(const ColorF& dst, const ColorF& src) {
    HSL s = rgbToHsl(src);
    HSL d = rgbToHsl(dst);
    ColorF result = hslToRgb(s.h, s.s, d.l);
    result.a = dst.a;
    return result;
}

ColorF luminosity(const ColorF& dst, const ColorF& src) {
    HSL s = rgbToHsl(src);
    HSL d = rgbToHsl(dst);
    ColorF result = hslToRgb(d.h, d.s, s.l);
    result.a = dst.a;
    return result;
}

} // namespace color_blend

// ========================================================================
// モード取得
// ========================================================================
//
// 各モードは関数ローカルの定数オブジェクト。書き換え可能なグローバル状態は持たない。
//

const BlendMode& getBlendMode(BlendModeID id) {
    using ID = BlendModeID;

    static const ChannelBlendMode darken(ID::Darken, "darken", channel::darken);
    static const ChannelBlendMode multiply(ID::Multiply, "multiply", channel::multiply);
    static const ChannelBlendMode colorBurn(ID::ColorBurn, "color_burn", channel::colorBurn);
    static const ChannelBlendMode linearBurn(ID::LinearBurn, "linear_burn", channel::linearBurn);
    static const ColorBlendMode darkerColor(ID::DarkerColor, "darker_color", color_blend::darkerColor);

    static const ChannelBlendMode lighten(ID::Lighten, "lighten", channel::lighten);
    static const ChannelBlendMode screen(ID::Screen, "screen", channel::screen);
    static const ChannelBlendMode colorDodge(ID::ColorDodge, "color_dodge", channel::colorDodge);
    static const ChannelBlendMode linearDodge(ID::LinearDodge, "linear_dodge", channel::linearDodge);
    static const ColorBlendMode lighterColor(ID::LighterColor, "lighter_color", color_blend::lighterColor);

    static const ChannelBlendMode overlay(ID::Overlay, "overlay", channel::overlay);
    static const ChannelBlendMode softLight(ID::SoftLight, "soft_light", channel::softLight);
    static const ChannelBlendMode hardLight(ID::HardLight, "hard_light", channel::hardLight);
    static const ChannelBlendMode vividLight(ID::VividLight, "vivid_light", channel::vividLight);
    static const ChannelBlendMode linearLight(ID::LinearLight, "linear_light", channel::linearLight);
    static const ChannelBlendMode pinLight(ID::PinLight, "pin_light", channel::pinLight);
    static const ChannelBlendMode hardMix(ID::HardMix, "hard_mix", channel::hardMix);

    static const ChannelBlendMode difference(ID::Difference, "difference", channel::difference);
    static const ChannelBlendMode exclusion(ID::Exclusion, "exclusion", channel::exclusion);
    static const ChannelBlendMode subtract(ID::Subtract, "subtract", channel::subtract);
    static const ChannelBlendMode divide(ID::Divide, "divide", channel::divide);

    static const ColorBlendMode hue(ID::Hue, "hue", color_blend::hue);
    static const ColorBlendMode saturation(ID::Saturation, "saturation", color_blend::saturation);
    static const ColorBlendMode color(ID::Color, "color", color_blend::color);
    static const ColorBlendMode luminosity(ID::Luminosity, "luminosity", color_blend::luminosity);

    static const ChannelBlendMode add(ID::Add, "add", channel::add);
    static const ChannelBlendMode reflex(ID::Reflex, "reflex", channel::reflex);
    static const ChannelBlendMode phoenix(ID::Phoenix, "phoenix", channel::phoenix);

    switch (id) {
        case ID::Darken:       return darken;
        case ID::Multiply:     return multiply;
        case ID::ColorBurn:    return colorBurn;
        case ID::LinearBurn:   return linearBurn;
        case ID::DarkerColor:  return darkerColor;
        case ID::Lighten:      return lighten;
        case ID::Screen:       return screen;
        case ID::ColorDodge:   return colorDodge;
        case ID::LinearDodge:  return linearDodge;
        case ID::LighterColor: return lighterColor;
        case ID::Overlay:      return overlay;
        case ID::SoftLight:    return softLight;
        case ID::HardLight:    return hardLight;
        case ID::VividLight:   return vividLight;
        case ID::LinearLight:  return linearLight;
        case ID::PinLight:     return pinLight;
        case ID::HardMix:      return hardMix;
        case ID::Difference:   return difference;
        case ID::Exclusion:    return exclusion;
        case ID::Subtract:     return subtract;
        case ID::Divide:       return divide;
        case ID::Hue:          return hue;
        case ID::Saturation:   return saturation;
        case ID::Color:        return color;
        case ID::Luminosity:   return luminosity;
        case ID::Add:          return add;
        case ID::Reflex:       return reflex;
        case ID::Phoenix:      return phoenix;
    }

    // 列挙外の値（キャストで作られた不正ID）
    PIXBLEND_ASSERT(false, "invalid BlendModeID");
    return darken;
}

const char* blendModeName(BlendModeID id) {
    if (!isValidBlendModeID(id)) return nullptr;
    return getBlendMode(id).name();
}

namespace {

// 旧名・別名
struct ModeAlias {
    const char* name;
    BlendModeID id;
};

constexpr ModeAlias kModeAliases[] = {
    {"substract", BlendModeID::Subtract},
    {"glow",      BlendModeID::Reflex},
};

} // namespace

const BlendMode* findBlendMode(const char* name) {
    if (!name) return nullptr;

    for (int i = 0; i < BlendModeCount; ++i) {
        const BlendMode& mode = getBlendMode(static_cast<BlendModeID>(i));
        if (std::strcmp(mode.name(), name) == 0) {
            return &mode;
        }
    }
    for (const auto& alias : kModeAliases) {
        if (std::strcmp(alias.name, name) == 0) {
            return &getBlendMode(alias.id);
        }
    }
    return nullptr;
}

} // namespace PIXBLEND_NAMESPACE
