#include "composite.h"
#include "../core/perf_metrics.h"
#include <vector>
#include <utility>

namespace PIXBLEND_NAMESPACE {

const char* toString(CompositeStatus status) {
    switch (status) {
        case CompositeStatus::Ok:
            return "ok";
        case CompositeStatus::IncompatibleColorModel:
            return "source and destination images have different color models";
        case CompositeStatus::InvalidImage:
            return "source or destination image is empty";
        case CompositeStatus::AllocationFailed:
            return "failed to allocate the result image";
        case CompositeStatus::InvalidBlendMode:
            return "blend mode id is out of range";
    }
    return "unknown composite status";
}

namespace composite {

namespace {

// 事前条件チェック（画素に触れる前に全て確認する）
CompositeStatus checkPreconditions(const ViewPort& dst, const ViewPort& src) {
    if (!dst.isValid() || !src.isValid()) {
        return CompositeStatus::InvalidImage;
    }
    if (dst.formatID != src.formatID) {
        return CompositeStatus::IncompatibleColorModel;
    }
    return CompositeStatus::Ok;
}

// 共通部分の合成本体（事前条件は確認済み）
// 行単位で Color16 に展開してブレンドし、元のフォーマットに戻して書き込む
uint64_t blendIntersection(ViewPort& dst, const ViewPort& src, const BlendMode& mode) {
    const Rect inter = dst.bounds().intersect(src.bounds());
    if (inter.isEmpty()) return 0;

    const int count = inter.width();
    std::vector<Color16> dstRow(static_cast<size_t>(count));
    std::vector<Color16> srcRow(static_cast<size_t>(count));

    // ローカル座標への変換オフセット
    const int dstX = inter.minX - dst.x;
    const int srcX = inter.minX - src.x;

    for (int y = inter.minY; y < inter.maxY; ++y) {
        view_ops::readRow(dst, dstX, y - dst.y, count, dstRow.data());
        view_ops::readRow(src, srcX, y - src.y, count, srcRow.data());

        for (int i = 0; i < count; ++i) {
            dstRow[i] = mode.blend(dstRow[i], srcRow[i]);
        }

        view_ops::writeRow(dst, dstX, y - dst.y, count, dstRow.data());
    }
    return static_cast<uint64_t>(count) * static_cast<uint64_t>(inter.height());
}

} // namespace

// ========================================================================
// onto - dst への直接合成
// ========================================================================

CompositeStatus onto(ViewPort& dst, const ViewPort& src, const BlendMode& mode) {
    CompositeStatus status = checkPreconditions(dst, src);
#ifdef PIXBLEND_DEBUG_PERF_METRICS
    auto& metrics = PerfMetrics::instance().ops[CompositeOp::Onto];
    metrics.count++;
    if (!isOk(status)) metrics.rejected++;
#endif
    if (!isOk(status)) return status;

    uint64_t blended = blendIntersection(dst, src, mode);
#ifdef PIXBLEND_DEBUG_PERF_METRICS
    metrics.blendedPixels += blended;
#else
    (void)blended;
#endif
    return CompositeStatus::Ok;
}

CompositeStatus onto(ViewPort& dst, const ViewPort& src, BlendModeID mode) {
    if (!isValidBlendModeID(mode)) return CompositeStatus::InvalidBlendMode;
    return onto(dst, src, getBlendMode(mode));
}

// ========================================================================
// toNewImage - 新規画像への合成
// ========================================================================
//
// dst 全体をコピーしてから共通部分だけをブレンドする。
// 共通部分外のピクセルは dst と同一になる。
//

CompositeStatus toNewImage(ImageBuffer& out, const ViewPort& dst, const ViewPort& src,
                           const BlendMode& mode) {
    CompositeStatus status = checkPreconditions(dst, src);
#ifdef PIXBLEND_DEBUG_PERF_METRICS
    auto& metrics = PerfMetrics::instance().ops[CompositeOp::NewImage];
    metrics.count++;
    if (!isOk(status)) metrics.rejected++;
#endif
    if (!isOk(status)) return status;

    ImageBuffer result(dst.bounds(), dst.formatID, InitPolicy::Uninitialized);
    if (!result.isValid()) {
        return CompositeStatus::AllocationFailed;
    }
    view_ops::copy(result.viewRef(), 0, 0, dst, 0, 0, dst.width, dst.height);

    uint64_t blended = blendIntersection(result.viewRef(), src, mode);
#ifdef PIXBLEND_DEBUG_PERF_METRICS
    metrics.blendedPixels += blended;
    metrics.copiedPixels += static_cast<uint64_t>(dst.width) * static_cast<uint64_t>(dst.height)
                            - blended;
#else
    (void)blended;
#endif

    out = std::move(result);
    return CompositeStatus::Ok;
}

CompositeStatus toNewImage(ImageBuffer& out, const ViewPort& dst, const ViewPort& src,
                           BlendModeID mode) {
    if (!isValidBlendModeID(mode)) return CompositeStatus::InvalidBlendMode;
    return toNewImage(out, dst, src, getBlendMode(mode));
}

} // namespace composite
} // namespace PIXBLEND_NAMESPACE
