#pragma once

#include <atomic>
#include <cstddef>

#include "arcrw/Lock/LockConfig.hpp"

namespace arcrw {

enum class RefCategory : unsigned {
    Shared = 0,   // 可克隆的句柄
    Unique = 1    // 由切分产生、不可克隆的句柄
};

// 引用计数头：[高半字 unique 计数][低半字 shared 计数]
// 字值恒等于两类存活句柄数之和；任一半递减前的字值恰为该半的单位值，
// 即说明这次递减把总数减到了 0。
class RefCounter {
public:
    explicit RefCounter(RefCategory first) noexcept;
    ~RefCounter() = default;

    RefCounter(const RefCounter&)            = delete;
    RefCounter& operator=(const RefCounter&) = delete;

    // 溢出时记录 SEVERE 并终止进程
    void increment(RefCategory c) noexcept;

    // 返回 true 表示本次递减清空了计数头（调用者负责析构与释放）
    bool decrement(RefCategory c) noexcept;

    void increment_shared() noexcept { increment(RefCategory::Shared); }
    void increment_unique() noexcept { increment(RefCategory::Unique); }
    bool decrement_shared() noexcept { return decrement(RefCategory::Shared); }
    bool decrement_unique() noexcept { return decrement(RefCategory::Unique); }

    // ---- 观测（测试用）----
    std::size_t load_raw() const noexcept { return word_.load(std::memory_order_acquire); }
    std::size_t shared_count() const noexcept { return load_raw() & LockConfig::kSharedMax; }
    std::size_t unique_count() const noexcept { return load_raw() >> LockConfig::kRefHalfBits; }

    static constexpr std::size_t UnitOf(RefCategory c) noexcept {
        return c == RefCategory::Shared ? LockConfig::kSharedOne : LockConfig::kUniqueOne;
    }
    static constexpr std::size_t MaxOf(RefCategory c) noexcept {
        return c == RefCategory::Shared ? LockConfig::kSharedMax : LockConfig::kUniqueMax;
    }

private:
    // 测试中用于直接构造接近溢出的计数
    friend class RefCounterTestPeer;

    std::atomic<std::size_t> word_;
};

} // namespace arcrw
