#pragma once

#include <cassert>
#include <cstddef>
#include <type_traits>
#include <utility>

#include "arcrw/Alloc/Allocator.hpp"
#include "arcrw/Arc/ArcAllocation.hpp"
#include "arcrw/Lock/MappedRwLock.hpp"

namespace arcrw {

/**
 * ArcMappedRwLock<T, U, A>
 * ------------------------------------------------------------
 * 可克隆的拥有者：持有计数头 shared 半字中的一个名额。
 * 析构时归还名额；最后一个名额归还时析构负载并通过 A 释放整块内存。
 * 不提供 Write()：子字段写只能经由 UniqueArcMappedRwLock。
 *
 * T == U 时可用工厂函数创建；T 为元素、U 为数组的实例由 SliceIter 产生。
 */
template<typename T, typename U = T, typename A = GlobalAllocator>
class ArcMappedRwLock {
    static_assert(kIsArcAllocator<A>, "A must provide Allocate/Deallocate and be copyable");

public:
    using lock_type      = MappedRwLock<T, U>;
    using pointer        = typename lock_type::pointer;
    using allocator_type = A;

    static constexpr RefCategory kCategory = RefCategory::Shared;

    ArcMappedRwLock() = default;

    ArcMappedRwLock(detail::AdoptRefTag, PoisonLock* lock, pointer sub, A alloc) noexcept
        : lock_(lock, sub), alloc_(std::move(alloc)) {}

    ArcMappedRwLock(ArcMappedRwLock&& other) noexcept
        : lock_(std::move(other.lock_)), alloc_(other.alloc_) {}

    ArcMappedRwLock& operator=(ArcMappedRwLock&& other) noexcept {
        if (this != &other) {
            Reset();
            lock_  = std::move(other.lock_);
            alloc_ = other.alloc_;
        }
        return *this;
    }

    // 复制必须显式调用 Clone()
    ArcMappedRwLock(const ArcMappedRwLock&)            = delete;
    ArcMappedRwLock& operator=(const ArcMappedRwLock&) = delete;

    ~ArcMappedRwLock() { Reset(); }

    ArcMappedRwLock Clone() const noexcept {
        assert(lock_.valid() && "Clone of empty ArcMappedRwLock");
        detail::ArcHeader::FromLock(lock_.lock())->counter.increment_shared();
        return ArcMappedRwLock(detail::kAdoptRef, lock_.lock(), lock_.subfield(), alloc_);
    }

    void Reset() noexcept {
        MappedRwLock<T, U> old = std::move(lock_);
        detail::ReleaseArc(old.lock(), kCategory, alloc_);
    }

    // 多个克隆共享同一子字段，因此只给出只读视图：Read / ReadWhole / TryReadWhole
    const lock_type& Lock() const noexcept { return lock_; }

    const lock_type* operator->() const noexcept {
        assert(lock_.valid() && "access to empty ArcMappedRwLock");
        return &lock_;
    }

    explicit operator bool() const noexcept { return lock_.valid(); }

    const allocator_type& get_allocator() const noexcept { return alloc_; }

    // ---- 工厂 ----

    template<typename... Args>
    static ArcMappedRwLock Make(A alloc, Args&&... args) {
        static_assert(std::is_same<T, U>::value && !std::is_array<U>::value,
                      "Make builds a single value payload");
        detail::ArcHeader* header =
            detail::AllocateValue<U>(alloc, kCategory, std::forward<Args>(args)...);
        return ArcMappedRwLock(detail::kAdoptRef, &header->lock, detail::WholeOf<U>(header), std::move(alloc));
    }

    // 以基类 U 的视角持有派生类 D；析构时按 D 析构
    template<typename D, typename... Args>
    static ArcMappedRwLock MakeDerived(A alloc, Args&&... args) {
        static_assert(std::is_same<T, U>::value && !std::is_array<U>::value,
                      "MakeDerived builds a single polymorphic payload");
        detail::ArcHeader* header =
            detail::AllocateDerived<D, U>(alloc, kCategory, std::forward<Args>(args)...);
        return ArcMappedRwLock(detail::kAdoptRef, &header->lock, detail::WholeOf<U>(header), std::move(alloc));
    }

    template<typename ForwardIt>
    static ArcMappedRwLock FromRange(A alloc, ForwardIt first, ForwardIt last) {
        static_assert(std::is_same<T, U>::value && std::is_array<U>::value && std::extent<U>::value == 0,
                      "FromRange builds an array payload");
        using E = std::remove_extent_t<U>;
        detail::ArcHeader* header = detail::AllocateSlice<E>(alloc, kCategory, first, last);
        return ArcMappedRwLock(detail::kAdoptRef, &header->lock, detail::WholeOf<U>(header), std::move(alloc));
    }

    static ArcMappedRwLock Filled(A alloc, std::size_t n, const std::remove_extent_t<U>& value) {
        static_assert(std::is_same<T, U>::value && std::is_array<U>::value && std::extent<U>::value == 0,
                      "Filled builds an array payload");
        using E = std::remove_extent_t<U>;
        detail::ArcHeader* header = detail::AllocateSliceFilled<E>(alloc, kCategory, n, value);
        return ArcMappedRwLock(detail::kAdoptRef, &header->lock, detail::WholeOf<U>(header), std::move(alloc));
    }

private:
    lock_type lock_;
    A         alloc_;
};

template<typename E, typename A = GlobalAllocator>
using ArcElementRwLock = ArcMappedRwLock<E, E[], A>;

template<typename E, typename A = GlobalAllocator>
using ArcSliceRwLock = ArcMappedRwLock<E[], E[], A>;

} // namespace arcrw
