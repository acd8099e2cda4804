#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include "arcrw/Alloc/Allocator.hpp"
#include "arcrw/Arc/ArcAllocation.hpp"
#include "arcrw/Arc/UniqueArcMappedRwLock.hpp"
#include "arcrw/Lock/SliceRef.hpp"

namespace arcrw {

/**
 * SliceIterMut<E, A>
 * ------------------------------------------------------------
 * 与 SliceIter 相同的切分方式，但每个元素包装成 UniqueArcElementRwLock
 * （计数头 unique 半字 +1），各线程可对各自的元素并发 Write()。
 *
 * 迭代器析构时归还它接管的那个 unique 名额。
 */
template<typename E, typename A = GlobalAllocator>
class SliceIterMut {
public:
    using item_type = UniqueArcElementRwLock<E, A>;

    SliceIterMut(detail::AdoptRefTag, PoisonLock* lock, SliceRef<E> rest, A alloc) noexcept
        : lock_(lock), rest_(rest), alloc_(std::move(alloc)) {}

    SliceIterMut(SliceIterMut&& other) noexcept
        : lock_(std::exchange(other.lock_, nullptr)),
          rest_(std::exchange(other.rest_, SliceRef<E>())),
          alloc_(other.alloc_) {}

    SliceIterMut& operator=(SliceIterMut&& other) noexcept {
        if (this != &other) {
            detail::ReleaseArc(std::exchange(lock_, nullptr), RefCategory::Unique, alloc_);
            lock_  = std::exchange(other.lock_, nullptr);
            rest_  = std::exchange(other.rest_, SliceRef<E>());
            alloc_ = other.alloc_;
        }
        return *this;
    }

    SliceIterMut(const SliceIterMut&)            = delete;
    SliceIterMut& operator=(const SliceIterMut&) = delete;

    ~SliceIterMut() { detail::ReleaseArc(std::exchange(lock_, nullptr), RefCategory::Unique, alloc_); }

    std::optional<item_type> Next() noexcept {
        if (!lock_ || rest_.empty()) return std::nullopt;
        E* elem = rest_.data();
        rest_   = rest_.subslice(1, rest_.size() - 1);
        return Yield_(elem);
    }

    std::optional<item_type> NextBack() noexcept {
        if (!lock_ || rest_.empty()) return std::nullopt;
        E* elem = rest_.data() + (rest_.size() - 1);
        rest_   = rest_.subslice(0, rest_.size() - 1);
        return Yield_(elem);
    }

    std::size_t Remaining() const noexcept { return rest_.size(); }

private:
    item_type Yield_(E* elem) noexcept {
        detail::ArcHeader::FromLock(lock_)->counter.increment_unique();
        return item_type(detail::kAdoptRef, lock_, elem, alloc_);
    }

    PoisonLock* lock_;
    SliceRef<E> rest_;
    A           alloc_;
};

} // namespace arcrw
