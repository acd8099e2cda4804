#pragma once

#include <cassert>
#include <optional>
#include <utility>

namespace arcrw {

enum class LockStatus {
    kOk,
    kWouldBlock,   // 对立模式正被持有
    kPoisoned      // 已取得 guard，但锁曾被毒化
};

/**
 * LockResult
 * ------------------------------------------------------------
 * 阻塞式整体读的结果：guard 一定存在，毒化只是附带的提示信息。
 */
template<typename Guard>
class LockResult {
public:
    LockResult(Guard guard, bool poisoned) noexcept
        : guard_(std::move(guard)), poisoned_(poisoned) {}

    bool IsPoisoned() const noexcept { return poisoned_; }

    Guard&       Get() noexcept { return guard_; }
    const Guard& Get() const noexcept { return guard_; }

    Guard*       operator->() noexcept { return &guard_; }
    const Guard* operator->() const noexcept { return &guard_; }

    // 忽略毒化，取出 guard
    Guard IntoInner() && noexcept { return std::move(guard_); }

private:
    Guard guard_;
    bool  poisoned_;
};

/**
 * TryLockResult
 * ------------------------------------------------------------
 * 非阻塞整体读的结果：kWouldBlock 时没有 guard；
 * kOk / kPoisoned 时 guard 可用。
 */
template<typename Guard>
class TryLockResult {
public:
    static TryLockResult WouldBlock() noexcept { return TryLockResult(); }

    TryLockResult(Guard guard, bool poisoned) noexcept
        : guard_(std::move(guard)),
          status_(poisoned ? LockStatus::kPoisoned : LockStatus::kOk) {}

    LockStatus Status() const noexcept { return status_; }
    bool IsOk() const noexcept { return status_ == LockStatus::kOk; }
    bool IsWouldBlock() const noexcept { return status_ == LockStatus::kWouldBlock; }
    bool IsPoisoned() const noexcept { return status_ == LockStatus::kPoisoned; }
    bool HasGuard() const noexcept { return guard_.has_value(); }

    Guard& Get() noexcept {
        assert(guard_ && "TryLockResult::Get on WouldBlock");
        return *guard_;
    }
    const Guard& Get() const noexcept {
        assert(guard_ && "TryLockResult::Get on WouldBlock");
        return *guard_;
    }

    std::optional<Guard> IntoInner() && noexcept { return std::move(guard_); }

private:
    TryLockResult() noexcept : guard_(), status_(LockStatus::kWouldBlock) {}

    std::optional<Guard> guard_;
    LockStatus           status_;
};

} // namespace arcrw
