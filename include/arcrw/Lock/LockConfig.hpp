#pragma once

#include <climits>
#include <cstddef>
#include <cstdint>

namespace arcrw {

/**
 * LockConfig
 * ------------------------------------------------------------
 * 锁字与引用计数头的编译期策略常量。
 *
 * 锁字：32 位，bit0 = 写标志，其余位 = 持有者计数。
 * 引用计数：一个 size_t，低半字 = shared 计数，高半字 = unique 计数。
 */
class LockConfig {
public:
    // ---- 锁字 ----
    static constexpr std::uint32_t kWriteFlag      = 1u;
    static constexpr std::uint32_t kCounterOne     = kWriteFlag << 1;           // 计数单位
    static constexpr std::uint32_t kCounterShift   = 1;
    static constexpr unsigned      kCounterBits    = 32 - kCounterShift;
    static constexpr std::uint32_t kLockCounterMax = ~kWriteFlag >> kCounterShift; // 0x7FFFFFFF

    // 自旋上限：超过后在锁字地址上挂起（futex）
    static constexpr unsigned kSpinLimit = 64;

    // ---- 引用计数头 ----
    static constexpr unsigned    kRefHalfBits   = sizeof(std::size_t) * CHAR_BIT / 2;
    static constexpr std::size_t kSharedOne     = 1;
    static constexpr std::size_t kUniqueOne     = std::size_t{1} << kRefHalfBits;
    static constexpr std::size_t kSharedMax     = kUniqueOne - 1;
    static constexpr std::size_t kUniqueMax     = kSharedMax << kRefHalfBits;

    // 分配块的最小对齐（ArcHeader 自身的对齐会与之取较大者）
    static constexpr std::size_t kDefaultAlignment = alignof(std::max_align_t);
};

static_assert(LockConfig::kLockCounterMax == (std::uint32_t{1} << LockConfig::kCounterBits) - 1,
              "lock counter must use 31 bits");
static_assert(LockConfig::kSharedMax + LockConfig::kUniqueMax == ~std::size_t{0},
              "refcount halves must cover the whole word");

} // namespace arcrw
