#include "allocator.h"
#include <cstdlib>

namespace PIXBLEND_NAMESPACE {
namespace core {
namespace memory {

// ========================================================================
// DefaultAllocator
// ========================================================================
//
// std::aligned_alloc はサイズがアライメントの倍数である必要があるため切り上げる。
//

void* DefaultAllocator::allocate(size_t bytes, size_t alignment) {
    if (bytes == 0) return nullptr;
    if (alignment < sizeof(void*)) alignment = sizeof(void*);
    size_t rounded = (bytes + alignment - 1) & ~(alignment - 1);
    return std::aligned_alloc(alignment, rounded);
}

void DefaultAllocator::deallocate(void* ptr) {
    std::free(ptr);
}

} // namespace memory
} // namespace core
} // namespace PIXBLEND_NAMESPACE
