#pragma once

#include <atomic>

#include "arcrw/Lock/LockWord.hpp"

namespace arcrw {

// 锁字 + 毒化标志。嵌在每个分配块的头部，地址在块的生命期内不变。
class PoisonLock {
public:
    constexpr PoisonLock() noexcept : lock_(), poison_(false) {}
    ~PoisonLock() = default;

    PoisonLock(const PoisonLock&)            = delete;
    PoisonLock& operator=(const PoisonLock&) = delete;

    LockWord&       word() noexcept       { return lock_; }
    const LockWord& word() const noexcept { return lock_; }

    bool is_poisoned() const noexcept;
    void poison() noexcept;
    void clear_poison() noexcept;

private:
    LockWord          lock_;
    std::atomic<bool> poison_;
};

} // namespace arcrw
