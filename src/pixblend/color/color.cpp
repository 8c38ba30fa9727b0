#include "color.h"
#include <algorithm>
#include <cmath>

namespace PIXBLEND_NAMESPACE {

namespace {

// 色相の区間ごとの成分値（p, q は正規化済み、t は 1周 = 1.0）
double hueToChannel(double p, double q, double t) {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 1.0 / 2.0) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}

} // namespace

// ========================================================================
// RGB → HSL
// ========================================================================
//
// 計算は [0, 1] に正規化して行い、輝度のみ CHANNEL_MAX スケールに戻す。
//

HSL rgbToHsl(const ColorF& c) {
    const double r = c.r / CHANNEL_MAX;
    const double g = c.g / CHANNEL_MAX;
    const double b = c.b / CHANNEL_MAX;

    const double maxV = std::max(r, std::max(g, b));
    const double minV = std::min(r, std::min(g, b));
    const double l = (maxV + minV) / 2.0;

    HSL result;
    result.l = l * CHANNEL_MAX;

    // 無彩色: 色相は未定義なので 0 とする
    if (maxV == minV) {
        return result;
    }

    const double d = maxV - minV;
    result.s = (l > 0.5) ? d / (2.0 - maxV - minV) : d / (maxV + minV);

    double h;
    if (maxV == r) {
        h = (g - b) / d + (g < b ? 6.0 : 0.0);
    } else if (maxV == g) {
        h = (b - r) / d + 2.0;
    } else {
        h = (r - g) / d + 4.0;
    }
    result.h = h * 60.0;
    if (result.h >= 360.0) result.h -= 360.0;
    return result;
}

// ========================================================================
// HSL → RGB
// ========================================================================

ColorF hslToRgb(double h, double s, double l) {
    const double ln = l / CHANNEL_MAX;

    if (s <= 0.0) {
        return ColorF(l, l, l, CHANNEL_MAX);
    }

    const double q = (ln < 0.5) ? ln * (1.0 + s) : ln + s - ln * s;
    const double p = 2.0 * ln - q;

    // 色相を [0, 1) に正規化（負値や 360 以上も受け付ける）
    double t = std::fmod(h, 360.0) / 360.0;
    if (t < 0.0) t += 1.0;

    return ColorF(hueToChannel(p, q, t + 1.0 / 3.0) * CHANNEL_MAX,
                  hueToChannel(p, q, t) * CHANNEL_MAX,
                  hueToChannel(p, q, t - 1.0 / 3.0) * CHANNEL_MAX,
                  CHANNEL_MAX);
}

} // namespace PIXBLEND_NAMESPACE
