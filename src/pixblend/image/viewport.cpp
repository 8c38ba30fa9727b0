#include "viewport.h"
#include <cstring>
#include <algorithm>

namespace PIXBLEND_NAMESPACE {

// ========================================================================
// ViewPort - 1ピクセル単位のアクセス
// ========================================================================

Color16 ViewPort::colorAt(int px, int py) const {
    Color16 c;
    convertToColor16(&c, pixelAt(px - x, py - y), formatID, 1);
    return c;
}

void ViewPort::setColorAt(int px, int py, const Color16& c) {
    convertFromColor16(pixelAt(px - x, py - y), formatID, &c, 1);
}

namespace view_ops {

void copy(ViewPort& dst, int dstX, int dstY,
          const ViewPort& src, int srcX, int srcY,
          int width, int height) {
    if (!dst.isValid() || !src.isValid()) return;

    // クリッピング
    if (srcX < 0) { dstX -= srcX; width += srcX; srcX = 0; }
    if (srcY < 0) { dstY -= srcY; height += srcY; srcY = 0; }
    if (dstX < 0) { srcX -= dstX; width += dstX; dstX = 0; }
    if (dstY < 0) { srcY -= dstY; height += dstY; dstY = 0; }
    width = std::min(width, std::min(src.width - srcX, dst.width - dstX));
    height = std::min(height, std::min(src.height - srcY, dst.height - dstY));
    if (width <= 0 || height <= 0) return;

    // view_ops::copy は同一フォーマット間の矩形コピー専用。
    PIXBLEND_ASSERT(src.formatID == dst.formatID,
                    "view_ops::copy requires matching formats");

    size_t bpp = static_cast<size_t>(dst.bytesPerPixel());
    for (int y = 0; y < height; ++y) {
        const uint8_t* srcRow = static_cast<const uint8_t*>(src.pixelAt(srcX, srcY + y));
        uint8_t* dstRow = static_cast<uint8_t*>(dst.pixelAt(dstX, dstY + y));
        std::memcpy(dstRow, srcRow, static_cast<size_t>(width) * bpp);
    }
}

void readRow(const ViewPort& v, int lx, int ly, int count, Color16* out) {
    if (count <= 0) return;
    convertToColor16(out, v.pixelAt(lx, ly), v.formatID, count);
}

void writeRow(ViewPort& v, int lx, int ly, int count, const Color16* in) {
    if (count <= 0) return;
    convertFromColor16(v.pixelAt(lx, ly), v.formatID, in, count);
}

} // namespace view_ops

} // namespace PIXBLEND_NAMESPACE
