#ifndef PIXBLEND_IMAGE_BUFFER_H
#define PIXBLEND_IMAGE_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <algorithm>
#include "../core/common.h"
#include "../core/perf_metrics.h"
#include "../core/memory/allocator.h"
#include "pixel_format.h"
#include "viewport.h"

namespace PIXBLEND_NAMESPACE {

// ========================================================================
// InitPolicy - ImageBuffer初期化ポリシー
// ========================================================================
enum class InitPolicy : uint8_t {
    Zero,          // ゼロクリア（デフォルト）
    Uninitialized  // 初期化スキップ（全ピクセル上書き時に使用）
};

// ========================================================================
// ImageBuffer - メモリ所有画像（コンポジション、RAII）
// ========================================================================
//
// 画像データを所有するクラスです。
// - ViewPortを継承しない（コンポジション）
// - view()でViewPortを取得
// - RAIIによる安全なメモリ管理
// - 確保失敗時は isValid() == false（例外は投げない）
//

class ImageBuffer {
public:
    // ========================================
    // コンストラクタ / デストラクタ
    // ========================================

    // デフォルトコンストラクタ（空の画像）
    ImageBuffer()
        : view_(), capacity_(0),
          allocator_(&core::memory::DefaultAllocator::instance()),
          initPolicy_(InitPolicy::Zero) {}

    // サイズ指定コンストラクタ（原点は (0,0)）
    ImageBuffer(int w, int h, PixelFormatID fmt = PixelFormatIDs::RGBA16,
                InitPolicy init = InitPolicy::Zero,
                core::memory::IAllocator* alloc = &core::memory::DefaultAllocator::instance())
        : ImageBuffer(Rect::fromSize(0, 0, w, h), fmt, init, alloc) {}

    // バウンディング矩形指定コンストラクタ
    ImageBuffer(const Rect& bounds, PixelFormatID fmt = PixelFormatIDs::RGBA16,
                InitPolicy init = InitPolicy::Zero,
                core::memory::IAllocator* alloc = &core::memory::DefaultAllocator::instance())
        : view_(nullptr, fmt, 0, bounds)
        , capacity_(0), allocator_(alloc), initPolicy_(init) {
        allocate();
    }

    // 外部ViewPortを参照（メモリ所有しない）
    explicit ImageBuffer(ViewPort view)
        : view_(view)
        , capacity_(0)
        , allocator_(nullptr)  // nullなのでデストラクタで解放しない
        , initPolicy_(InitPolicy::Zero)
    {}

    // デストラクタ
    ~ImageBuffer() {
        deallocate();
    }

    // ========================================
    // コピー / ムーブセマンティクス
    // ========================================

    // コピーコンストラクタ（ディープコピー）
    // 参照モードからのコピーでも新しいメモリを確保（所有モードになる）
    ImageBuffer(const ImageBuffer& other)
        : view_(nullptr, other.view_.formatID, 0, other.view_.bounds())
        , capacity_(0)
        , allocator_(other.allocator_ ? other.allocator_ : &core::memory::DefaultAllocator::instance())
        , initPolicy_(InitPolicy::Uninitialized) {
        if (other.isValid()) {
            allocate();
            copyFrom(other);
        }
    }

    // コピー代入
    ImageBuffer& operator=(const ImageBuffer& other) {
        if (this != &other) {
            deallocate();
            view_ = ViewPort(nullptr, other.view_.formatID, 0, other.view_.bounds());
            allocator_ = other.allocator_ ? other.allocator_ : &core::memory::DefaultAllocator::instance();
            initPolicy_ = InitPolicy::Uninitialized;
            if (other.isValid()) {
                allocate();
                copyFrom(other);
            }
        }
        return *this;
    }

    // ムーブコンストラクタ
    ImageBuffer(ImageBuffer&& other) noexcept
        : view_(other.view_), capacity_(other.capacity_),
          allocator_(other.allocator_), initPolicy_(other.initPolicy_) {
        other.view_.data = nullptr;
        other.view_.width = other.view_.height = 0;
        other.view_.stride = 0;
        other.capacity_ = 0;
    }

    // ムーブ代入
    ImageBuffer& operator=(ImageBuffer&& other) noexcept {
        if (this != &other) {
            deallocate();
            view_ = other.view_;
            capacity_ = other.capacity_;
            allocator_ = other.allocator_;
            initPolicy_ = other.initPolicy_;

            other.view_.data = nullptr;
            other.view_.width = other.view_.height = 0;
            other.view_.stride = 0;
            other.capacity_ = 0;
        }
        return *this;
    }

    // ========================================
    // ビュー取得
    // ========================================

    // 値で返す（安全性重視、呼び出し側での変更がImageBufferに影響しない）
    ViewPort view() { return view_; }
    ViewPort view() const { return view_; }

    // 参照で返す（効率重視、直接操作可能）
    ViewPort& viewRef() { return view_; }
    const ViewPort& viewRef() const { return view_; }

    // ========================================
    // アクセサ（ViewPortに委譲）
    // ========================================

    bool isValid() const { return view_.isValid(); }

    // メモリを所有しているか（false=参照モード）
    bool ownsMemory() const { return allocator_ != nullptr; }

    int32_t width() const { return view_.width; }
    int32_t height() const { return view_.height; }
    int32_t stride() const { return view_.stride; }
    Rect bounds() const { return view_.bounds(); }
    PixelFormatID formatID() const { return view_.formatID; }

    // 原点の移動（ピクセルデータはそのまま）
    void setOrigin(int32_t x, int32_t y) { view_.x = x; view_.y = y; }

    void* data() { return view_.data; }
    const void* data() const { return view_.data; }

    void* pixelAt(int x, int y) { return view_.pixelAt(x, y); }
    const void* pixelAt(int x, int y) const { return view_.pixelAt(x, y); }

    Color16 colorAt(int x, int y) const { return view_.colorAt(x, y); }
    void setColorAt(int x, int y, const Color16& c) { view_.setColorAt(x, y, c); }

    int_fast8_t bytesPerPixel() const { return view_.bytesPerPixel(); }
    uint32_t totalBytes() const {
        // strideが負の場合は絶対値を使用
        int32_t absStride = stride() >= 0 ? stride() : -stride();
        return static_cast<uint32_t>(view_.height) * static_cast<uint32_t>(absStride);
    }

private:
    ViewPort view_;           // コンポジション: 画像データへのビュー
    size_t capacity_;
    core::memory::IAllocator* allocator_;
    InitPolicy initPolicy_;

    void allocate() {
        auto bpp = getBytesPerPixel(view_.formatID);
        view_.stride = static_cast<int32_t>(view_.width * bpp);
        capacity_ = (view_.width > 0 && view_.height > 0)
                        ? static_cast<size_t>(view_.stride) * static_cast<size_t>(view_.height)
                        : 0;
        if (capacity_ > 0 && allocator_) {
            view_.data = allocator_->allocate(capacity_);
            if (!view_.data) {
                // 確保失敗: 空の画像として扱う
                capacity_ = 0;
                return;
            }
            if (initPolicy_ == InitPolicy::Zero) {
                std::memset(view_.data, 0, capacity_);
            }
#ifdef PIXBLEND_DEBUG_PERF_METRICS
            PerfMetrics::instance().recordAlloc(capacity_, view_.width, view_.height);
#endif
        }
    }

    void deallocate() {
        if (view_.data && allocator_) {
#ifdef PIXBLEND_DEBUG_PERF_METRICS
            PerfMetrics::instance().recordFree(capacity_);
#endif
            allocator_->deallocate(view_.data);
        }
        view_.data = nullptr;
        capacity_ = 0;
    }

    void copyFrom(const ImageBuffer& other) {
        if (!isValid() || !other.isValid()) return;
        view_ops::copy(view_, 0, 0, other.view_, 0, 0, view_.width, view_.height);
    }
};

} // namespace PIXBLEND_NAMESPACE

#endif // PIXBLEND_IMAGE_BUFFER_H
