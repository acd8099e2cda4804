#pragma once

#include <atomic>
#include <cstdint>

#include "arcrw/Lock/LockConfig.hpp"

namespace arcrw {

enum class LockMode : std::uint32_t {
    Idle    = 0,
    Writing = 1,   // 子字段写者（互不相交，可任意多个）
    Reading = 2    // 整体读者（可任意多个）
};

// 锁字：[31..1 持有者计数][0 写标志]
// Idle 时整个字为 0；写/读两种模式不会同时具有非零计数。
class LockWord {
public:
    constexpr LockWord() noexcept : word_(0) {}
    ~LockWord() = default;

    LockWord(const LockWord&)            = delete;
    LockWord& operator=(const LockWord&) = delete;

    // 阻塞直到没有整体读者，然后登记一个子字段写者
    void acquire_write() noexcept;
    // 不阻塞；处于 Reading 时返回 false
    bool try_acquire_write() noexcept;

    // 阻塞直到没有子字段写者，然后登记一个整体读者
    void acquire_read_whole() noexcept;
    // 不阻塞；处于 Writing 时返回 false
    bool try_acquire_read_whole() noexcept;

    // 调用者必须持有对应模式的一个名额
    void release_writer() noexcept;
    void release_reader() noexcept;

    // ---- 观测（仅用于断言与测试，结果可能立即过期）----
    std::uint32_t load_raw() const noexcept { return word_.load(std::memory_order_relaxed); }
    LockMode      load_mode() const noexcept;
    std::uint32_t load_count() const noexcept;

    static constexpr std::uint32_t kEmpty = 0;

private:
    // 测试中用于直接构造接近溢出的字值
    friend class LockWordTestPeer;

    static std::uint32_t CountOf_(std::uint32_t w) noexcept { return w >> LockConfig::kCounterShift; }
    static bool          IsWriting_(std::uint32_t w) noexcept { return (w & LockConfig::kWriteFlag) != 0; }

    // 计数已达上限时记录 SEVERE 并终止进程
    [[noreturn]] static void AbortOnOverflow_(const char* mode) noexcept;

    // 在锁字上挂起，直到字值不再等于 observed（或被虚假唤醒）
    void Park_(std::uint32_t observed) noexcept;
    void WakeAll_() noexcept;

    std::atomic<std::uint32_t> word_;
};

} // namespace arcrw
