#include "arcrw/Arc/RefCounter.hpp"
#include "arcrw/Util/Log.hpp"

#include <cstdlib>

namespace arcrw {

RefCounter::RefCounter(RefCategory first) noexcept
    : word_(UnitOf(first))
{}

void RefCounter::increment(RefCategory c) noexcept {
    const std::size_t unit = UnitOf(c);
    const std::size_t max  = MaxOf(c);

    // 克隆只需要原子性，不需要同步：持有句柄本身已保证分配块存活
    const std::size_t old = word_.fetch_add(unit, std::memory_order_relaxed);
    if ((old & max) == max) {
        {
            severe() << "refcount " << (c == RefCategory::Shared ? "shared" : "unique")
                     << " half overflow (raw=" << old << "), aborting";
        }
        std::abort();
    }
}

bool RefCounter::decrement(RefCategory c) noexcept {
    const std::size_t unit = UnitOf(c);

    const std::size_t old = word_.fetch_sub(unit, std::memory_order_release);
    if (old == unit) {
        // 与其他线程的 release 递减配对，保证析构看到所有写入
        std::atomic_thread_fence(std::memory_order_acquire);
        return true;
    }
    return false;
}

} // namespace arcrw
