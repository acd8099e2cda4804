#pragma once

#include <cassert>
#include <exception>
#include <optional>
#include <utility>

#include "arcrw/Arc/ArcHeader.hpp"
#include "arcrw/Lock/LockResult.hpp"
#include "arcrw/Lock/PoisonLock.hpp"
#include "arcrw/Lock/SliceRef.hpp"

namespace arcrw {

template<typename T, typename U>
class MappedRwLock;

/**
 * MappedRwLockWriteGuard
 * ------------------------------------------------------------
 * 持有一个子字段写者名额。析构时释放名额；
 * 若析构发生在 guard 创建之后才抛出的异常的栈展开中，随后把锁标记为毒化。
 *
 * guard 不得活得比产生它的 MappedRwLock 所在的分配块更久。
 * guard 只能在创建它的线程上移动和析构：毒化判定比较的是本线程的
 * std::uncaught_exceptions()，移动时沿用创建时记下的基准值。
 */
template<typename T>
class MappedRwLockWriteGuard {
public:
    using traits  = detail::SubfieldTraits<T>;
    using pointer = typename traits::pointer;

    MappedRwLockWriteGuard(MappedRwLockWriteGuard&& other) noexcept
        : lock_(std::exchange(other.lock_, nullptr)),
          ptr_(other.ptr_),
          uncaught_(other.uncaught_) {}  // 同线程移动，基准值不变

    MappedRwLockWriteGuard& operator=(MappedRwLockWriteGuard&& other) noexcept {
        if (this != &other) {
            Release_();
            lock_     = std::exchange(other.lock_, nullptr);
            ptr_      = other.ptr_;
            uncaught_ = other.uncaught_;
        }
        return *this;
    }

    MappedRwLockWriteGuard(const MappedRwLockWriteGuard&)            = delete;
    MappedRwLockWriteGuard& operator=(const MappedRwLockWriteGuard&) = delete;

    ~MappedRwLockWriteGuard() { Release_(); }

    // 定长类型返回 T&，数组类型返回 SliceRef<E>
    decltype(auto) operator*() const noexcept {
        if constexpr (traits::kIsSlice) {
            return ptr_;
        } else {
            return *ptr_;
        }
    }

    auto operator->() const noexcept {
        if constexpr (traits::kIsSlice) {
            return &ptr_;
        } else {
            return ptr_;
        }
    }

    pointer Get() const noexcept { return ptr_; }

private:
    template<typename, typename>
    friend class MappedRwLock;

    MappedRwLockWriteGuard(PoisonLock* lock, pointer ptr) noexcept
        : lock_(lock), ptr_(ptr), uncaught_(std::uncaught_exceptions()) {}

    void Release_() noexcept {
        PoisonLock* lock = std::exchange(lock_, nullptr);
        if (!lock) return;

        const bool unwinding = std::uncaught_exceptions() > uncaught_;
        lock->word().release_writer();
        if (unwinding) lock->poison();
    }

    PoisonLock* lock_;
    pointer     ptr_;
    int         uncaught_;
};

/**
 * MappedRwLockReadWholeGuard
 * ------------------------------------------------------------
 * 持有一个整体读者名额，只读访问整个负载。
 */
template<typename U>
class MappedRwLockReadWholeGuard {
public:
    using traits        = detail::SubfieldTraits<U>;
    using const_pointer = typename traits::const_pointer;

    MappedRwLockReadWholeGuard(MappedRwLockReadWholeGuard&& other) noexcept
        : lock_(std::exchange(other.lock_, nullptr)), ptr_(other.ptr_) {}

    MappedRwLockReadWholeGuard& operator=(MappedRwLockReadWholeGuard&& other) noexcept {
        if (this != &other) {
            Release_();
            lock_ = std::exchange(other.lock_, nullptr);
            ptr_  = other.ptr_;
        }
        return *this;
    }

    MappedRwLockReadWholeGuard(const MappedRwLockReadWholeGuard&)            = delete;
    MappedRwLockReadWholeGuard& operator=(const MappedRwLockReadWholeGuard&) = delete;

    ~MappedRwLockReadWholeGuard() { Release_(); }

    // 定长类型返回 const U&，数组类型返回 SliceRef<const E>
    decltype(auto) operator*() const noexcept {
        if constexpr (traits::kIsSlice) {
            return ptr_;
        } else {
            return *ptr_;
        }
    }

    auto operator->() const noexcept {
        if constexpr (traits::kIsSlice) {
            return &ptr_;
        } else {
            return ptr_;
        }
    }

    const_pointer Get() const noexcept { return ptr_; }

private:
    template<typename, typename>
    friend class MappedRwLock;

    MappedRwLockReadWholeGuard(PoisonLock* lock, const_pointer ptr) noexcept
        : lock_(lock), ptr_(ptr) {}

    void Release_() noexcept {
        PoisonLock* lock = std::exchange(lock_, nullptr);
        if (lock) lock->word().release_reader();
    }

    PoisonLock*   lock_;
    const_pointer ptr_;
};

/**
 * MappedRwLock<T, U>
 * ------------------------------------------------------------
 * {分配块中的锁, 负载内的子字段}。U 是整个负载的类型，T 是本句柄可写的部分。
 *
 * - Read()/Write()/TryWrite() 只触及子字段；
 * - ReadWhole()/TryReadWhole() 等待所有子字段写者离开后只读访问整个负载；
 * - 子字段之间互不相交由切分迭代器保证，锁本身不检查。
 *
 * 本类不拥有分配块，由 ArcMappedRwLock / UniqueArcMappedRwLock 持有。
 */
template<typename T, typename U = T>
class MappedRwLock {
public:
    using subfield_traits = detail::SubfieldTraits<T>;
    using whole_traits    = detail::SubfieldTraits<U>;
    using pointer         = typename subfield_traits::pointer;
    using const_reference = typename subfield_traits::const_reference;

    using WriteGuard     = MappedRwLockWriteGuard<T>;
    using ReadWholeGuard = MappedRwLockReadWholeGuard<U>;

    MappedRwLock() noexcept : lock_(nullptr), sub_() {}
    MappedRwLock(PoisonLock* lock, pointer sub) noexcept : lock_(lock), sub_(sub) {}

    MappedRwLock(MappedRwLock&& other) noexcept
        : lock_(std::exchange(other.lock_, nullptr)), sub_(std::exchange(other.sub_, pointer())) {}

    MappedRwLock& operator=(MappedRwLock&& other) noexcept {
        lock_ = std::exchange(other.lock_, nullptr);
        sub_  = std::exchange(other.sub_, pointer());
        return *this;
    }

    MappedRwLock(const MappedRwLock&)            = delete;
    MappedRwLock& operator=(const MappedRwLock&) = delete;

    // 不加锁直接读取本句柄的子字段
    const_reference Read() const noexcept {
        assert(lock_ && "MappedRwLock::Read on empty handle");
        return subfield_traits::DerefConst(sub_);
    }

    WriteGuard Write() noexcept {
        assert(lock_ && "MappedRwLock::Write on empty handle");
        lock_->word().acquire_write();
        return WriteGuard(lock_, sub_);
    }

    // 空 optional 表示 WouldBlock
    std::optional<WriteGuard> TryWrite() noexcept {
        assert(lock_ && "MappedRwLock::TryWrite on empty handle");
        if (!lock_->word().try_acquire_write()) return std::nullopt;
        return WriteGuard(lock_, sub_);
    }

    LockResult<ReadWholeGuard> ReadWhole() const noexcept {
        assert(lock_ && "MappedRwLock::ReadWhole on empty handle");
        lock_->word().acquire_read_whole();
        // 先取得读者名额再检查毒化
        const bool poisoned = lock_->is_poisoned();
        return LockResult<ReadWholeGuard>(ReadWholeGuard(lock_, Whole_()), poisoned);
    }

    TryLockResult<ReadWholeGuard> TryReadWhole() const noexcept {
        assert(lock_ && "MappedRwLock::TryReadWhole on empty handle");
        if (!lock_->word().try_acquire_read_whole()) {
            return TryLockResult<ReadWholeGuard>::WouldBlock();
        }
        const bool poisoned = lock_->is_poisoned();
        return TryLockResult<ReadWholeGuard>(ReadWholeGuard(lock_, Whole_()), poisoned);
    }

    bool IsPoisoned() const noexcept { return lock_->is_poisoned(); }
    void ClearPoison() const noexcept { lock_->clear_poison(); }

    // ---- 供拥有者与迭代器使用 ----
    PoisonLock* lock() const noexcept { return lock_; }
    pointer     subfield() const noexcept { return sub_; }
    bool        valid() const noexcept { return lock_ != nullptr; }

private:
    typename whole_traits::const_pointer Whole_() const noexcept {
        const detail::ArcHeader* header = detail::ArcHeader::FromLock(lock_);
        return whole_traits::FromErased(header->payload, header->len);
    }

    PoisonLock* lock_;
    pointer     sub_;
};

// 切分后单个元素的句柄：子字段为一个元素，整体为整个数组
template<typename E>
using ElementRwLock = MappedRwLock<E, E[]>;

// 覆盖整个数组的句柄
template<typename E>
using SliceRwLock = MappedRwLock<E[], E[]>;

} // namespace arcrw
