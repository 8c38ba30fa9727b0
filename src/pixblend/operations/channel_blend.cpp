#include "channel_blend.h"
#include <algorithm>
#include <cmath>

namespace PIXBLEND_NAMESPACE {
namespace channel {

namespace {
constexpr double max = CHANNEL_MAX;
constexpr double mid = CHANNEL_MID;
} // namespace

// ========================================================================
// 比較（暗）系
// ========================================================================

double darken(DstChannel d, SrcChannel s) {
    return std::min(d.value, s.value);
}

double multiply(DstChannel d, SrcChannel s) {
    return s.value * d.value / max;
}

double colorBurn(DstChannel d, SrcChannel s) {
    if (s.value == 0.0) {
        return s.value;
    }
    return std::max(0.0, max - (max - d.value) * max / s.value);
}

double linearBurn(DstChannel d, SrcChannel s) {
    double sum = s.value + d.value;
    if (sum < max) {
        return 0.0;
    }
    return sum - max;
}

// ========================================================================
// 比較（明）系
// ========================================================================

double lighten(DstChannel d, SrcChannel s) {
    return std::max(d.value, s.value);
}

double screen(DstChannel d, SrcChannel s) {
    return s.value + d.value - s.value * d.value / max;
}

double colorDodge(DstChannel d, SrcChannel s) {
    if (s.value == max) {
        return s.value;
    }
    return std::min(max, d.value * max / (max - s.value));
}

double linearDodge(DstChannel d, SrcChannel s) {
    return std::min(s.value + d.value, max);
}

// ========================================================================
// コントラスト系
// ========================================================================

double overlay(DstChannel d, SrcChannel s) {
    if (d.value < mid) {
        return 2.0 * s.value * d.value / max;
    }
    return max - 2.0 * (max - s.value) * (max - d.value) / max;
}

double softLight(DstChannel d, SrcChannel s) {
    return (d.value / max) * (d.value + (2.0 * s.value / max) * (max - d.value));
}

double hardLight(DstChannel d, SrcChannel s) {
    if (s.value > mid) {
        return d.value + (max - d.value) * ((s.value - mid) / mid);
    }
    return d.value * s.value / mid;
}

double vividLight(DstChannel d, SrcChannel s) {
    if (s.value < mid) {
        return colorBurn(d, SrcChannel(2.0 * s.value));
    }
    return colorDodge(d, SrcChannel(2.0 * (s.value - mid)));
}

double linearLight(DstChannel d, SrcChannel s) {
    if (s.value < mid) {
        return linearBurn(d, SrcChannel(2.0 * s.value));
    }
    return linearDodge(d, SrcChannel(2.0 * (s.value - mid)));
}

double pinLight(DstChannel d, SrcChannel s) {
    if (s.value < mid) {
        return darken(d, SrcChannel(2.0 * s.value));
    }
    return lighten(d, SrcChannel(2.0 * (s.value - mid)));
}

double hardMix(DstChannel d, SrcChannel s) {
    if (vividLight(d, s) < mid) {
        return 0.0;
    }
    return max;
}

// ========================================================================
// 差分系
// ========================================================================

double difference(DstChannel d, SrcChannel s) {
    return std::abs(s.value - d.value);
}

double exclusion(DstChannel d, SrcChannel s) {
    return s.value + d.value - s.value * d.value / mid;
}

double subtract(DstChannel d, SrcChannel s) {
    return std::max(0.0, d.value - s.value);
}

double divide(DstChannel d, SrcChannel s) {
    if (s.value == 0.0) {
        return max;
    }
    return d.value * max / s.value;
}

// ========================================================================
// 追加モード
// ========================================================================

double add(DstChannel d, SrcChannel s) {
    return std::min(s.value + d.value, max);
}

double reflex(DstChannel d, SrcChannel s) {
    if (s.value == max) {
        return s.value;
    }
    return std::min(max, d.value * d.value / (max - s.value));
}

double phoenix(DstChannel d, SrcChannel s) {
    return std::min(d.value, s.value) - std::max(d.value, s.value) + max;
}

} // namespace channel

// ========================================================================
// blendPerChannel
// ========================================================================

ColorF blendPerChannel(const ColorF& dst, const ColorF& src, ChannelBlendFunc func) {
    return ColorF(func(DstChannel(dst.r), SrcChannel(src.r)),
                  func(DstChannel(dst.g), SrcChannel(src.g)),
                  func(DstChannel(dst.b), SrcChannel(src.b)),
                  dst.a);
}

} // namespace PIXBLEND_NAMESPACE
