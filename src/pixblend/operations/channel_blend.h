#ifndef PIXBLEND_OPERATIONS_CHANNEL_BLEND_H
#define PIXBLEND_OPERATIONS_CHANNEL_BLEND_H

#include "../core/common.h"
#include "../color/color.h"

namespace PIXBLEND_NAMESPACE {

// ========================================================================
// チャンネル値の型（引数順の取り違え防止）
// ========================================================================
//
// 全チャンネル関数は「dst（下層）が第1引数、src（上層）が第2引数」。
// DstChannel / SrcChannel は explicit 構築のみ可能なので、
// 引数を入れ替えるとコンパイルエラーになる。
//

struct DstChannel {
    double value;
    constexpr explicit DstChannel(double v) : value(v) {}
};

struct SrcChannel {
    double value;
    constexpr explicit SrcChannel(double v) : value(v) {}
};

// チャンネルブレンド関数の型
// 入力は [0, CHANNEL_MAX]、戻り値はクランプ前の値
using ChannelBlendFunc = double (*)(DstChannel d, SrcChannel s);

namespace channel {

// ========================================================================
// チャンネルブレンド関数（純関数）
// ========================================================================
//
// 以下 d = dst, s = src, max = CHANNEL_MAX, mid = CHANNEL_MID
//

// ------------------------------------------------------------------------
// 比較（暗）系
// ------------------------------------------------------------------------

double darken(DstChannel d, SrcChannel s);      // min(d, s)
double multiply(DstChannel d, SrcChannel s);    // s*d/max
double colorBurn(DstChannel d, SrcChannel s);   // s==0 ? 0 : max(0, max-(max-d)*max/s)
double linearBurn(DstChannel d, SrcChannel s);  // s+d<max ? 0 : s+d-max

// ------------------------------------------------------------------------
// 比較（明）系
// ------------------------------------------------------------------------

double lighten(DstChannel d, SrcChannel s);     // max(d, s)
double screen(DstChannel d, SrcChannel s);      // s+d-s*d/max
double colorDodge(DstChannel d, SrcChannel s);  // s==max ? max : min(max, d*max/(max-s))
double linearDodge(DstChannel d, SrcChannel s); // min(s+d, max)

// ------------------------------------------------------------------------
// コントラスト系
// ------------------------------------------------------------------------
//
// vividLight / linearLight / pinLight は src を 2倍して基本関数に委譲する。
// 委譲先にも dst を第1引数として渡す。
//

double overlay(DstChannel d, SrcChannel s);
double softLight(DstChannel d, SrcChannel s);
double hardLight(DstChannel d, SrcChannel s);
double vividLight(DstChannel d, SrcChannel s);
double linearLight(DstChannel d, SrcChannel s);
double pinLight(DstChannel d, SrcChannel s);
double hardMix(DstChannel d, SrcChannel s);     // vividLight < mid ? 0 : max

// ------------------------------------------------------------------------
// 差分系
// ------------------------------------------------------------------------

double difference(DstChannel d, SrcChannel s);  // |s-d|
double exclusion(DstChannel d, SrcChannel s);   // s+d-s*d/mid
double subtract(DstChannel d, SrcChannel s);    // max(0, d-s)

// 除算: d*max/s
// s == 0 のときは max を返す（飽和）
double divide(DstChannel d, SrcChannel s);

// ------------------------------------------------------------------------
// 追加モード（Photoshop非搭載）
// ------------------------------------------------------------------------

double add(DstChannel d, SrcChannel s);         // min(s+d, max)
double reflex(DstChannel d, SrcChannel s);      // s==max ? max : min(max, d*d/(max-s))
double phoenix(DstChannel d, SrcChannel s);     // min(d,s) - max(d,s) + max

} // namespace channel

// ========================================================================
// blendPerChannel - ピクセル単位のディスパッチ
// ========================================================================
//
// RGB の各チャンネルに独立に func を適用する。
// アルファは常に dst の値をそのまま使う。
//

ColorF blendPerChannel(const ColorF& dst, const ColorF& src, ChannelBlendFunc func);

inline ColorF blendPerChannel(const Color16& dst, const Color16& src, ChannelBlendFunc func) {
    return blendPerChannel(toFloat(dst), toFloat(src), func);
}

} // namespace PIXBLEND_NAMESPACE

#endif // PIXBLEND_OPERATIONS_CHANNEL_BLEND_H
