#pragma once

#include <cassert>
#include <cstddef>
#include <type_traits>
#include <utility>

#include "arcrw/Alloc/Allocator.hpp"
#include "arcrw/Arc/ArcAllocation.hpp"
#include "arcrw/Arc/ArcMappedRwLock.hpp"
#include "arcrw/Lock/MappedRwLock.hpp"

namespace arcrw {

template<typename E, typename A>
class SliceIter;

template<typename E, typename A>
class SliceIterMut;

/**
 * UniqueArcMappedRwLock<T, U, A>
 * ------------------------------------------------------------
 * 不可克隆的拥有者：持有计数头 unique 半字中的一个名额。
 * 数组负载的唯一拥有者可以被 Iter()/IterMut() 消耗，切分成逐元素的拥有者。
 */
template<typename T, typename U = T, typename A = GlobalAllocator>
class UniqueArcMappedRwLock {
    static_assert(kIsArcAllocator<A>, "A must provide Allocate/Deallocate and be copyable");

public:
    using lock_type      = MappedRwLock<T, U>;
    using pointer        = typename lock_type::pointer;
    using allocator_type = A;
    using element_type   = std::remove_extent_t<T>;

    static constexpr RefCategory kCategory = RefCategory::Unique;

    UniqueArcMappedRwLock() = default;

    UniqueArcMappedRwLock(detail::AdoptRefTag, PoisonLock* lock, pointer sub, A alloc) noexcept
        : lock_(lock, sub), alloc_(std::move(alloc)) {}

    UniqueArcMappedRwLock(UniqueArcMappedRwLock&& other) noexcept
        : lock_(std::move(other.lock_)), alloc_(other.alloc_) {}

    UniqueArcMappedRwLock& operator=(UniqueArcMappedRwLock&& other) noexcept {
        if (this != &other) {
            Reset();
            lock_  = std::move(other.lock_);
            alloc_ = other.alloc_;
        }
        return *this;
    }

    UniqueArcMappedRwLock(const UniqueArcMappedRwLock&)            = delete;
    UniqueArcMappedRwLock& operator=(const UniqueArcMappedRwLock&) = delete;

    ~UniqueArcMappedRwLock() { Reset(); }

    void Reset() noexcept {
        lock_type old = std::move(lock_);
        detail::ReleaseArc(old.lock(), kCategory, alloc_);
    }

    // 换成同一子字段上的 shared 拥有者：先加 shared，再减 unique，计数头不会途经 0
    ArcMappedRwLock<T, U, A> IntoShared() && noexcept {
        assert(lock_.valid() && "IntoShared on empty UniqueArcMappedRwLock");
        detail::ArcHeader::FromLock(lock_.lock())->counter.increment_shared();
        ArcMappedRwLock<T, U, A> shared(detail::kAdoptRef, lock_.lock(), lock_.subfield(), alloc_);
        Reset();
        return shared;
    }

    // 逐元素产出 shared 拥有者；迭代器接管本对象的 unique 名额
    SliceIter<element_type, A> Iter() && noexcept {
        static_assert(IsSlice_(), "Iter() requires an array payload owner");
        assert(lock_.valid() && "Iter on empty UniqueArcMappedRwLock");
        lock_type parts = std::move(lock_);
        return SliceIter<element_type, A>(detail::kAdoptRef, parts.lock(), parts.subfield(), alloc_);
    }

    // 逐元素产出 unique 拥有者
    SliceIterMut<element_type, A> IterMut() && noexcept {
        static_assert(IsSlice_(), "IterMut() requires an array payload owner");
        assert(lock_.valid() && "IterMut on empty UniqueArcMappedRwLock");
        lock_type parts = std::move(lock_);
        return SliceIterMut<element_type, A>(detail::kAdoptRef, parts.lock(), parts.subfield(), alloc_);
    }

    lock_type&       Lock() noexcept { return lock_; }
    const lock_type& Lock() const noexcept { return lock_; }

    lock_type* operator->() noexcept {
        assert(lock_.valid() && "access to empty UniqueArcMappedRwLock");
        return &lock_;
    }
    const lock_type* operator->() const noexcept {
        assert(lock_.valid() && "access to empty UniqueArcMappedRwLock");
        return &lock_;
    }

    explicit operator bool() const noexcept { return lock_.valid(); }

    const allocator_type& get_allocator() const noexcept { return alloc_; }

    // ---- 工厂 ----

    template<typename... Args>
    static UniqueArcMappedRwLock Make(A alloc, Args&&... args) {
        static_assert(std::is_same<T, U>::value && !std::is_array<U>::value,
                      "Make builds a single value payload");
        detail::ArcHeader* header =
            detail::AllocateValue<U>(alloc, kCategory, std::forward<Args>(args)...);
        return UniqueArcMappedRwLock(detail::kAdoptRef, &header->lock, detail::WholeOf<U>(header),
                                     std::move(alloc));
    }

    template<typename D, typename... Args>
    static UniqueArcMappedRwLock MakeDerived(A alloc, Args&&... args) {
        static_assert(std::is_same<T, U>::value && !std::is_array<U>::value,
                      "MakeDerived builds a single polymorphic payload");
        detail::ArcHeader* header =
            detail::AllocateDerived<D, U>(alloc, kCategory, std::forward<Args>(args)...);
        return UniqueArcMappedRwLock(detail::kAdoptRef, &header->lock, detail::WholeOf<U>(header),
                                     std::move(alloc));
    }

    template<typename ForwardIt>
    static UniqueArcMappedRwLock FromRange(A alloc, ForwardIt first, ForwardIt last) {
        static_assert(IsSlice_(), "FromRange builds an array payload");
        detail::ArcHeader* header = detail::AllocateSlice<element_type>(alloc, kCategory, first, last);
        return UniqueArcMappedRwLock(detail::kAdoptRef, &header->lock, detail::WholeOf<U>(header),
                                     std::move(alloc));
    }

    static UniqueArcMappedRwLock Filled(A alloc, std::size_t n, const element_type& value) {
        static_assert(IsSlice_(), "Filled builds an array payload");
        detail::ArcHeader* header = detail::AllocateSliceFilled<element_type>(alloc, kCategory, n, value);
        return UniqueArcMappedRwLock(detail::kAdoptRef, &header->lock, detail::WholeOf<U>(header),
                                     std::move(alloc));
    }

private:
    static constexpr bool IsSlice_() noexcept {
        return std::is_same<T, U>::value && std::is_array<T>::value && std::extent<T>::value == 0;
    }

    lock_type lock_;
    A         alloc_;
};

template<typename E, typename A = GlobalAllocator>
using UniqueArcElementRwLock = UniqueArcMappedRwLock<E, E[], A>;

template<typename E, typename A = GlobalAllocator>
using UniqueArcSliceRwLock = UniqueArcMappedRwLock<E[], E[], A>;

} // namespace arcrw

#include "arcrw/Slice/SliceIter.hpp"
#include "arcrw/Slice/SliceIterMut.hpp"
