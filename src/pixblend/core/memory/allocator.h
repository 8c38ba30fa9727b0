/**
 * @file allocator.h
 * @brief メモリアロケータインターフェース
 *
 * ImageBuffer のピクセルメモリ確保を差し替え可能にするための抽象層。
 */

#ifndef PIXBLEND_CORE_MEMORY_ALLOCATOR_H
#define PIXBLEND_CORE_MEMORY_ALLOCATOR_H

#include <cstddef>
#include <cstdint>

#include "../common.h"

namespace PIXBLEND_NAMESPACE {
namespace core {
namespace memory {

// ========================================================================
// IAllocator - アロケータインターフェース
// ========================================================================

class IAllocator {
public:
    virtual ~IAllocator() = default;

    /// @brief メモリ確保
    /// @param bytes 確保サイズ
    /// @param alignment アライメント（2の累乗）
    /// @return 確保したメモリへのポインタ（失敗時はnullptr）
    virtual void* allocate(size_t bytes, size_t alignment = 16) = 0;

    /// @brief メモリ解放（nullptrは無視）
    virtual void deallocate(void* ptr) = 0;

    virtual const char* name() const = 0;
};

// ========================================================================
// DefaultAllocator - Cヒープを使う標準アロケータ
// ========================================================================

class DefaultAllocator : public IAllocator {
public:
    static DefaultAllocator& instance() {
        static DefaultAllocator s_instance;
        return s_instance;
    }

    void* allocate(size_t bytes, size_t alignment = 16) override;
    void deallocate(void* ptr) override;
    const char* name() const override { return "DefaultAllocator"; }

private:
    DefaultAllocator() = default;
};

} // namespace memory
} // namespace core
} // namespace PIXBLEND_NAMESPACE

#endif // PIXBLEND_CORE_MEMORY_ALLOCATOR_H
