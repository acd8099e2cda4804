#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include "arcrw/Alloc/Allocator.hpp"
#include "arcrw/Arc/ArcAllocation.hpp"
#include "arcrw/Arc/ArcMappedRwLock.hpp"
#include "arcrw/Arc/UniqueArcMappedRwLock.hpp"
#include "arcrw/Lock/SliceRef.hpp"

namespace arcrw {

/**
 * SliceIter<E, A>
 * ------------------------------------------------------------
 * 消耗一个数组负载的唯一拥有者，从两端逐个剥下元素，
 * 每个元素包装成一个 shared 类的 ArcElementRwLock（计数头 shared 半字 +1）。
 *
 * 迭代器自身持有原拥有者的 unique 名额，析构时归还。
 * 产出的元素与剩余部分、与其他已产出元素两两不相交。
 */
template<typename E, typename A = GlobalAllocator>
class SliceIter {
public:
    using item_type = ArcElementRwLock<E, A>;

    SliceIter(detail::AdoptRefTag, PoisonLock* lock, SliceRef<E> rest, A alloc) noexcept
        : lock_(lock), rest_(rest), alloc_(std::move(alloc)) {}

    SliceIter(SliceIter&& other) noexcept
        : lock_(std::exchange(other.lock_, nullptr)),
          rest_(std::exchange(other.rest_, SliceRef<E>())),
          alloc_(other.alloc_) {}

    SliceIter& operator=(SliceIter&& other) noexcept {
        if (this != &other) {
            detail::ReleaseArc(std::exchange(lock_, nullptr), RefCategory::Unique, alloc_);
            lock_  = std::exchange(other.lock_, nullptr);
            rest_  = std::exchange(other.rest_, SliceRef<E>());
            alloc_ = other.alloc_;
        }
        return *this;
    }

    SliceIter(const SliceIter&)            = delete;
    SliceIter& operator=(const SliceIter&) = delete;

    ~SliceIter() { detail::ReleaseArc(std::exchange(lock_, nullptr), RefCategory::Unique, alloc_); }

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
        detail::ArcHeader::FromLock(lock_)->counter.increment_shared();
        return item_type(detail::kAdoptRef, lock_, elem, alloc_);
    }

    PoisonLock* lock_;
    SliceRef<E> rest_;
    A           alloc_;
};

} // namespace arcrw
