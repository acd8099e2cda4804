#include "arcrw/Alloc/Allocator.hpp"

#include <new>

namespace arcrw {

void* GlobalAllocator::Allocate(std::size_t size, std::size_t align) noexcept {
    if (size == 0) return nullptr;

    // 超过默认对齐时走对齐版本，释放端按同样的判断配对
    if (align > __STDCPP_DEFAULT_NEW_ALIGNMENT__) {
        return ::operator new(size, std::align_val_t(align), std::nothrow);
    }
    return ::operator new(size, std::nothrow);
}

void GlobalAllocator::Deallocate(void* p, std::size_t size, std::size_t align) noexcept {
    if (!p) return;

    if (align > __STDCPP_DEFAULT_NEW_ALIGNMENT__) {
        ::operator delete(p, size, std::align_val_t(align));
    } else {
        ::operator delete(p, size);
    }
}

} // namespace arcrw
