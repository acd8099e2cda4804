#pragma once

#include <cstddef>
#include <cstdint>

#include "arcrw/Arc/RefCounter.hpp"
#include "arcrw/Lock/PoisonLock.hpp"

namespace arcrw {
namespace detail {

/**
 * ArcHeader
 * ------------------------------------------------------------
 * 分配块布局：[ArcHeader][填充][负载]
 *
 * 负载的尺寸/对齐/元素个数/析构方式在分配时记录在头部，
 * 因此任何句柄只凭 PoisonLock* 就能找回整个分配块并正确释放，
 * 无论它看到的是整个负载、某个元素还是多态负载的基类视图。
 */
struct ArcHeader {
    using DropFn = void (*)(ArcHeader*) noexcept;

    RefCounter  counter;
    std::size_t alloc_size;    // 整块字节数（交还分配器时使用）
    std::size_t alloc_align;   // 整块对齐
    std::size_t len;           // 负载元素个数：单值为 1
    void*       payload;       // 负载视图首地址（多态负载为基类子对象地址）
    DropFn      drop;          // 析构负载；平凡析构类型为 nullptr
    PoisonLock  lock;

    ArcHeader(RefCategory first, std::size_t size, std::size_t align, std::size_t n) noexcept
        : counter(first), alloc_size(size), alloc_align(align), len(n),
          payload(nullptr), drop(nullptr), lock() {}

    ArcHeader(const ArcHeader&)            = delete;
    ArcHeader& operator=(const ArcHeader&) = delete;

    // 负载相对块首的偏移：紧随头部并按元素对齐
    static constexpr std::size_t PayloadOffset(std::size_t elem_align) noexcept {
        return (sizeof(ArcHeader) + elem_align - 1) & ~(elem_align - 1);
    }

    std::byte* base() noexcept { return reinterpret_cast<std::byte*>(this); }

    // 由嵌在头部中的锁地址反推头部地址（常量偏移）
    static ArcHeader* FromLock(PoisonLock* lock) noexcept;
    static const ArcHeader* FromLock(const PoisonLock* lock) noexcept;

    void DestroyPayload() noexcept {
        if (drop) drop(this);
    }
};

} // namespace detail
} // namespace arcrw
