#include "arcrw/Lock/LockWord.hpp"
#include "arcrw/Util/Log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <linux/futex.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace arcrw {

static_assert(sizeof(std::atomic<std::uint32_t>) == sizeof(std::uint32_t),
              "futex requires a plain 32-bit word");
static_assert(std::atomic<std::uint32_t>::is_always_lock_free,
              "lock word must be lock-free");

namespace {

inline void CpuRelax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
    __builtin_ia32_pause();
#else
    std::this_thread::yield();
#endif
}

} // namespace

// ---------------- 子字段写 ----------------

void LockWord::acquire_write() noexcept {
    std::uint32_t loaded = word_.load(std::memory_order_relaxed);
    unsigned spins = 0;

    for (;;) {
        if (loaded == kEmpty) {
            // Idle -> Writing(1)
            if (word_.compare_exchange_weak(loaded, LockConfig::kWriteFlag | LockConfig::kCounterOne,
                                            std::memory_order_acquire, std::memory_order_relaxed)) {
                return;
            }
            CpuRelax();
        } else if (IsWriting_(loaded)) {
            // Writing(n) -> Writing(n+1)
            if (CountOf_(loaded) == LockConfig::kLockCounterMax) AbortOnOverflow_("writer");
            if (word_.compare_exchange_weak(loaded, loaded + LockConfig::kCounterOne,
                                            std::memory_order_acquire, std::memory_order_relaxed)) {
                return;
            }
            CpuRelax();
        } else if (spins < LockConfig::kSpinLimit) {
            // Reading(*)：先短暂自旋
            ++spins;
            CpuRelax();
            loaded = word_.load(std::memory_order_relaxed);
        } else {
            Park_(loaded);
            loaded = word_.load(std::memory_order_relaxed);
        }
    }
}

bool LockWord::try_acquire_write() noexcept {
    std::uint32_t loaded = word_.load(std::memory_order_relaxed);

    for (;;) {
        if (loaded == kEmpty) {
            if (word_.compare_exchange_weak(loaded, LockConfig::kWriteFlag | LockConfig::kCounterOne,
                                            std::memory_order_acquire, std::memory_order_relaxed)) {
                return true;
            }
        } else if (IsWriting_(loaded)) {
            if (CountOf_(loaded) == LockConfig::kLockCounterMax) AbortOnOverflow_("writer");
            if (word_.compare_exchange_weak(loaded, loaded + LockConfig::kCounterOne,
                                            std::memory_order_acquire, std::memory_order_relaxed)) {
                return true;
            }
        } else {
            return false; // Reading(*)
        }
        CpuRelax();
    }
}

// ---------------- 整体读 ----------------

void LockWord::acquire_read_whole() noexcept {
    std::uint32_t loaded = word_.load(std::memory_order_relaxed);
    unsigned spins = 0;

    for (;;) {
        if (loaded == kEmpty) {
            // Idle -> Reading(1)
            if (word_.compare_exchange_weak(loaded, LockConfig::kCounterOne,
                                            std::memory_order_acquire, std::memory_order_relaxed)) {
                return;
            }
            CpuRelax();
        } else if (!IsWriting_(loaded)) {
            // Reading(n) -> Reading(n+1)
            if (CountOf_(loaded) == LockConfig::kLockCounterMax) AbortOnOverflow_("reader");
            if (word_.compare_exchange_weak(loaded, loaded + LockConfig::kCounterOne,
                                            std::memory_order_acquire, std::memory_order_relaxed)) {
                return;
            }
            CpuRelax();
        } else if (spins < LockConfig::kSpinLimit) {
            ++spins;
            CpuRelax();
            loaded = word_.load(std::memory_order_relaxed);
        } else {
            Park_(loaded);
            loaded = word_.load(std::memory_order_relaxed);
        }
    }
}

bool LockWord::try_acquire_read_whole() noexcept {
    std::uint32_t loaded = word_.load(std::memory_order_relaxed);

    for (;;) {
        if (loaded == kEmpty) {
            if (word_.compare_exchange_weak(loaded, LockConfig::kCounterOne,
                                            std::memory_order_acquire, std::memory_order_relaxed)) {
                return true;
            }
        } else if (!IsWriting_(loaded)) {
            if (CountOf_(loaded) == LockConfig::kLockCounterMax) AbortOnOverflow_("reader");
            if (word_.compare_exchange_weak(loaded, loaded + LockConfig::kCounterOne,
                                            std::memory_order_acquire, std::memory_order_relaxed)) {
                return true;
            }
        } else {
            return false; // Writing(*)
        }
        CpuRelax();
    }
}

// ---------------- 释放 ----------------

void LockWord::release_writer() noexcept {
    std::uint32_t loaded = word_.load(std::memory_order_relaxed);

    for (;;) {
        const std::uint32_t count = CountOf_(loaded);
        if (count == 0 || !IsWriting_(loaded)) {
            severe() << "release_writer on a lock word without writers (raw=" << loaded << ")";
            std::abort();
        }

        if (count == 1) {
            // Writing(1) -> Idle，唤醒全部等待者
            if (word_.compare_exchange_weak(loaded, kEmpty,
                                            std::memory_order_release, std::memory_order_relaxed)) {
                WakeAll_();
                return;
            }
        } else {
            // 中间的递减也用 release：最后一个写者之前的写入同样要对后续读者可见
            if (word_.compare_exchange_weak(loaded, loaded - LockConfig::kCounterOne,
                                            std::memory_order_release, std::memory_order_relaxed)) {
                return;
            }
        }
        CpuRelax();
    }
}

void LockWord::release_reader() noexcept {
    // 读者模式下写标志为 0，直接减一个计数单位即可
    if (word_.fetch_sub(LockConfig::kCounterOne, std::memory_order_release) == LockConfig::kCounterOne) {
        std::atomic_thread_fence(std::memory_order_acquire);
        WakeAll_();
    }
}

// ---------------- 观测 ----------------

LockMode LockWord::load_mode() const noexcept {
    const std::uint32_t w = word_.load(std::memory_order_acquire);
    if (CountOf_(w) == 0) return LockMode::Idle;
    return IsWriting_(w) ? LockMode::Writing : LockMode::Reading;
}

std::uint32_t LockWord::load_count() const noexcept {
    return CountOf_(word_.load(std::memory_order_acquire));
}

// ---------------- 内部 ----------------

void LockWord::AbortOnOverflow_(const char* mode) noexcept {
    {
        severe() << "lock word " << mode << " counter overflow (max "
                 << LockConfig::kLockCounterMax << "), aborting";
    }
    std::abort();
}

void LockWord::Park_(std::uint32_t observed) noexcept {
    if (IsLogEnabled(LOG_TRACE)) {
        trace() << "parking on lock word " << static_cast<const void*>(&word_)
                << " (raw=" << observed << ")";
    }

    auto* addr = reinterpret_cast<std::uint32_t*>(&word_);
    const long rc = ::syscall(SYS_futex, addr, FUTEX_WAIT_PRIVATE, observed, nullptr, nullptr, 0);
    if (rc == -1) {
        const int err = errno;
        // EAGAIN：字值已变化；EINTR：被信号打断。两者都由调用方重试
        if (err != EAGAIN && err != EINTR) {
            warn() << "futex wait failed: " << std::strerror(err) << ", falling back to yield";
            std::this_thread::yield();
        }
    }
}

void LockWord::WakeAll_() noexcept {
    auto* addr = reinterpret_cast<std::uint32_t*>(&word_);
    const long rc = ::syscall(SYS_futex, addr, FUTEX_WAKE_PRIVATE, INT32_MAX, nullptr, nullptr, 0);
    if (rc == -1) {
        const int err = errno;
        warn() << "futex wake failed: " << std::strerror(err);
    }
}

} // namespace arcrw
