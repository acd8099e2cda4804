#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "arcrw/Alloc/Allocator.hpp"
#include "arcrw/Arc/ArcHeader.hpp"
#include "arcrw/Lock/SliceRef.hpp"
#include "arcrw/Util/Log.hpp"

namespace arcrw {
namespace detail {

// 构造拥有者时表示“接管一个已经计入计数头的名额”
struct AdoptRefTag {
    explicit AdoptRefTag() = default;
};
inline constexpr AdoptRefTag kAdoptRef{};

template<typename E>
constexpr std::size_t PayloadOffset() noexcept {
    return ArcHeader::PayloadOffset(alignof(E));
}

template<typename E>
constexpr std::size_t BlockAlign() noexcept {
    return std::max({alignof(ArcHeader), alignof(E), LockConfig::kDefaultAlignment});
}

template<typename E>
E* PayloadOf(ArcHeader* header) noexcept {
    return std::launder(reinterpret_cast<E*>(header->base() + PayloadOffset<E>()));
}

// 析构负载中的 len 个 E；E 即实际构造的类型（多态负载为派生类）
template<typename E>
void DropPayload(ArcHeader* header) noexcept {
    std::destroy_n(PayloadOf<E>(header), header->len);
}

template<typename E>
constexpr ArcHeader::DropFn DropFnFor() noexcept {
    if constexpr (std::is_trivially_destructible<E>::value) {
        return nullptr;
    } else {
        return &DropPayload<E>;
    }
}

void LogAllocationFailure(std::size_t size, std::size_t align);
void LogAllocationOverflow(std::size_t count, std::size_t elem_size);
void LogBlockFreed(const ArcHeader* header);

// 申请一个能容纳 n 个 E 的分配块并构造头部；负载尚未构造
template<typename E, typename A>
ArcHeader* AllocateBlock(A& alloc, RefCategory first, std::size_t n) {
    constexpr std::size_t offset = PayloadOffset<E>();
    constexpr std::size_t align  = BlockAlign<E>();

    if (n > (std::numeric_limits<std::size_t>::max() - offset) / sizeof(E)) {
        LogAllocationOverflow(n, sizeof(E));
        throw std::bad_alloc();
    }

    const std::size_t size = offset + n * sizeof(E);
    void* raw = alloc.Allocate(size, align);
    if (!raw) {
        LogAllocationFailure(size, align);
        throw std::bad_alloc();
    }
    return ::new (raw) ArcHeader(first, size, align, n);
}

// 只归还内存；负载必须已析构或从未构造
template<typename A>
void FreeBlock(ArcHeader* header, A& alloc) noexcept {
    const std::size_t size  = header->alloc_size;
    const std::size_t align = header->alloc_align;
    header->~ArcHeader();
    alloc.Deallocate(static_cast<void*>(header), size, align);
}

// 单值负载：在块内用 args 构造一个 U
template<typename U, typename A, typename... Args>
ArcHeader* AllocateValue(A& alloc, RefCategory first, Args&&... args) {
    ArcHeader* header = AllocateBlock<U>(alloc, first, 1);
    try {
        void* slot = header->base() + PayloadOffset<U>();
        U* obj = ::new (slot) U(std::forward<Args>(args)...);
        header->payload = obj;
    } catch (...) {
        FreeBlock(header, alloc);
        throw;
    }
    header->drop = DropFnFor<U>();
    return header;
}

// 多态负载：构造派生类 D，对外以基类 Base 的地址呈现
template<typename D, typename Base, typename A, typename... Args>
ArcHeader* AllocateDerived(A& alloc, RefCategory first, Args&&... args) {
    static_assert(std::is_base_of<Base, D>::value, "D must derive from Base");

    ArcHeader* header = AllocateBlock<D>(alloc, first, 1);
    try {
        void* slot = header->base() + PayloadOffset<D>();
        D* obj = ::new (slot) D(std::forward<Args>(args)...);
        header->payload = static_cast<Base*>(obj);
    } catch (...) {
        FreeBlock(header, alloc);
        throw;
    }
    header->drop = DropFnFor<D>();
    return header;
}

// 数组负载：逐个从 [first, last) 构造；构造中途抛异常时已构造的元素被析构
template<typename E, typename A, typename ForwardIt>
ArcHeader* AllocateSlice(A& alloc, RefCategory first, ForwardIt begin, ForwardIt end) {
    const auto n = static_cast<std::size_t>(std::distance(begin, end));
    ArcHeader* header = AllocateBlock<E>(alloc, first, n);
    try {
        E* data = reinterpret_cast<E*>(header->base() + PayloadOffset<E>());
        std::uninitialized_copy(begin, end, data);
        header->payload = data;
    } catch (...) {
        FreeBlock(header, alloc);
        throw;
    }
    header->drop = DropFnFor<E>();
    return header;
}

template<typename E, typename A>
ArcHeader* AllocateSliceFilled(A& alloc, RefCategory first, std::size_t n, const E& value) {
    ArcHeader* header = AllocateBlock<E>(alloc, first, n);
    try {
        E* data = reinterpret_cast<E*>(header->base() + PayloadOffset<E>());
        std::uninitialized_fill_n(data, n, value);
        header->payload = data;
    } catch (...) {
        FreeBlock(header, alloc);
        throw;
    }
    header->drop = DropFnFor<E>();
    return header;
}

// 整个负载的视图
template<typename U>
typename SubfieldTraits<U>::pointer WholeOf(ArcHeader* header) noexcept {
    return SubfieldTraits<U>::FromErased(header->payload, header->len);
}

/**
 * ReleaseArc
 * ------------------------------------------------------------
 * 释放拥有者持有的一个 c 类名额；若这次递减清空了计数头，
 * 析构负载并通过 alloc 归还整块内存。lock 为空时什么也不做。
 */
template<typename A>
void ReleaseArc(PoisonLock* lock, RefCategory c, A& alloc) noexcept {
    if (!lock) return;

    ArcHeader* header = ArcHeader::FromLock(lock);
    if (!header->counter.decrement(c)) return;

    header->DestroyPayload();
    LogBlockFreed(header);
    FreeBlock(header, alloc);
}

} // namespace detail
} // namespace arcrw
