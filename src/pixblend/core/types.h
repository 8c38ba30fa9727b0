#ifndef PIXBLEND_TYPES_H
#define PIXBLEND_TYPES_H

#include <cstdint>
#include <algorithm>

#ifndef PIXBLEND_NAMESPACE
#define PIXBLEND_NAMESPACE pixblend
#endif

namespace PIXBLEND_NAMESPACE {
namespace core {

// ========================================================================
// Point - 2D座標構造体（整数ピクセル座標）
// ========================================================================

struct Point {
    int32_t x = 0;
    int32_t y = 0;

    Point() = default;
    Point(int32_t x_, int32_t y_) : x(x_), y(y_) {}

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};


// int64 の座標計算結果を int32 範囲に丸める
inline int32_t saturateToInt32(int64_t v) {
    if (v > INT32_MAX) return INT32_MAX;
    if (v < INT32_MIN) return INT32_MIN;
    return static_cast<int32_t>(v);
}

// ========================================================================
// Rect - 矩形（半開区間 [min, max)）
// ========================================================================
//
// 画像のバウンディング矩形を表す。原点は(0,0)である必要はない。
// 空の矩形は min == max に正規化される（intersect の結果など）。
//

struct Rect {
    int32_t minX = 0;
    int32_t minY = 0;
    int32_t maxX = 0;
    int32_t maxY = 0;

    Rect() = default;
    Rect(int32_t x0, int32_t y0, int32_t x1, int32_t y1)
        : minX(x0), minY(y0), maxX(x1), maxY(y1) {}

    // 原点とサイズから作成
    // 右端・下端が int32 を超える場合は INT32_MAX で打ち切る
    static Rect fromSize(int32_t x, int32_t y, int32_t w, int32_t h) {
        return {x, y,
                saturateToInt32(static_cast<int64_t>(x) + w),
                saturateToInt32(static_cast<int64_t>(y) + h)};
    }

    int32_t width() const {
        return saturateToInt32(static_cast<int64_t>(maxX) - minX);
    }
    int32_t height() const {
        return saturateToInt32(static_cast<int64_t>(maxY) - minY);
    }
    bool isEmpty() const { return minX >= maxX || minY >= maxY; }

    Point min() const { return {minX, minY}; }
    Point max() const { return {maxX, maxY}; }

    bool contains(int32_t x, int32_t y) const {
        return x >= minX && x < maxX && y >= minY && y < maxY;
    }
    bool contains(const Point& p) const { return contains(p.x, p.y); }

    // 共通部分（重なりが無い場合は空矩形）
    Rect intersect(const Rect& o) const {
        Rect r(std::max(minX, o.minX), std::max(minY, o.minY),
               std::min(maxX, o.maxX), std::min(maxY, o.maxY));
        if (r.isEmpty()) {
            return Rect(r.minX, r.minY, r.minX, r.minY);
        }
        return r;
    }

    Rect translate(int32_t dx, int32_t dy) const {
        return {saturateToInt32(static_cast<int64_t>(minX) + dx),
                saturateToInt32(static_cast<int64_t>(minY) + dy),
                saturateToInt32(static_cast<int64_t>(maxX) + dx),
                saturateToInt32(static_cast<int64_t>(maxY) + dy)};
    }

    bool operator==(const Rect& o) const {
        return minX == o.minX && minY == o.minY && maxX == o.maxX && maxY == o.maxY;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

} // namespace core

using core::Point;
using core::Rect;

} // namespace PIXBLEND_NAMESPACE

#endif // PIXBLEND_TYPES_H
