#ifndef PIXBLEND_PERF_METRICS_H
#define PIXBLEND_PERF_METRICS_H

#include "common.h"
#include <cstddef>
#include <cstdint>

// ========================================================================
// デバッグ機能制御マクロ
// PIXBLEND_DEBUG が定義されている場合のみ計測機能が有効になる
// ビルド: cmake -DPIXBLEND_DEBUG=ON
// ========================================================================
#ifdef PIXBLEND_DEBUG
#define PIXBLEND_DEBUG_PERF_METRICS 1
#endif

namespace PIXBLEND_NAMESPACE {

// ========================================================================
// 合成操作の種別（デバッグ/リリース共通）
// ========================================================================

namespace CompositeOp {
    constexpr int Onto = 0;       // 破壊的合成（dst を直接書き換え）
    constexpr int NewImage = 1;   // 非破壊合成（新規画像を生成）
    constexpr int Count = 2;
}

// ========================================================================
// パフォーマンス計測構造体
// ========================================================================

#ifdef PIXBLEND_DEBUG_PERF_METRICS

// 合成操作別メトリクス
struct CompositeMetrics {
    int count = 0;                // 呼び出し回数
    int rejected = 0;             // 事前条件エラーで中断した回数
    uint64_t blendedPixels = 0;   // ブレンドしたピクセル数（共通部分）
    uint64_t copiedPixels = 0;    // 無変更でコピーしたピクセル数

    void reset() {
        *this = CompositeMetrics{};
    }

    // 共通部分の割合（0.0〜1.0）
    float blendRatio() const {
        uint64_t total = blendedPixels + copiedPixels;
        if (total == 0) return 0;
        return static_cast<float>(blendedPixels) / static_cast<float>(total);
    }
};

struct PerfMetrics {
    CompositeMetrics ops[CompositeOp::Count];

    // メモリ統計
    uint64_t totalAllocatedBytes = 0;  // 累計確保バイト数
    uint64_t peakMemoryBytes = 0;      // ピークメモリ使用量
    uint64_t currentMemoryBytes = 0;   // 現在のメモリ使用量
    uint64_t maxAllocBytes = 0;        // 一回の最大確保バイト数
    int maxAllocWidth = 0;             // その時の幅
    int maxAllocHeight = 0;            // その時の高さ

    // シングルトンインスタンス
    static PerfMetrics& instance() {
        static PerfMetrics s_instance;
        return s_instance;
    }

    void reset() {
        for (auto& op : ops) op.reset();
        totalAllocatedBytes = 0;
        peakMemoryBytes = 0;
        currentMemoryBytes = 0;
        maxAllocBytes = 0;
        maxAllocWidth = 0;
        maxAllocHeight = 0;
    }

    // 全操作合計のブレンドピクセル数
    uint64_t totalBlendedPixels() const {
        uint64_t sum = 0;
        for (const auto& op : ops) sum += op.blendedPixels;
        return sum;
    }

    // メモリ確保を記録（ImageBuffer作成時に呼ぶ）
    void recordAlloc(size_t bytes, int width = 0, int height = 0) {
        totalAllocatedBytes += bytes;
        currentMemoryBytes += bytes;
        if (currentMemoryBytes > peakMemoryBytes) {
            peakMemoryBytes = currentMemoryBytes;
        }
        if (bytes > maxAllocBytes) {
            maxAllocBytes = bytes;
            maxAllocWidth = width;
            maxAllocHeight = height;
        }
    }

    // メモリ解放を記録（ImageBuffer破棄時に呼ぶ）
    void recordFree(size_t bytes) {
        if (currentMemoryBytes >= bytes) {
            currentMemoryBytes -= bytes;
        } else {
            currentMemoryBytes = 0;
        }
    }
};

#else

// リリースビルド用のダミー構造体（最小サイズ）
struct CompositeMetrics {
    void reset() {}
    float blendRatio() const { return 0; }
};

struct PerfMetrics {
    CompositeMetrics ops[CompositeOp::Count];
    static PerfMetrics& instance() {
        static PerfMetrics s_instance;
        return s_instance;
    }
    void reset() {}
    uint64_t totalBlendedPixels() const { return 0; }
    void recordAlloc(size_t, int = 0, int = 0) {}
    void recordFree(size_t) {}
};

#endif // PIXBLEND_DEBUG_PERF_METRICS

} // namespace PIXBLEND_NAMESPACE

#endif // PIXBLEND_PERF_METRICS_H
