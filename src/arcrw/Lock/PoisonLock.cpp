#include "arcrw/Lock/PoisonLock.hpp"
#include "arcrw/Util/Log.hpp"

namespace arcrw {

bool PoisonLock::is_poisoned() const noexcept {
    return poison_.load(std::memory_order_acquire);
}

void PoisonLock::poison() noexcept {
    // 只在状态翻转时记一条日志，避免多个写者同时展开时刷屏
    if (!poison_.exchange(true, std::memory_order_release)) {
        warn() << "lock " << static_cast<const void*>(this)
               << " poisoned: a subfield writer exited by exception";
    }
}

void PoisonLock::clear_poison() noexcept {
    poison_.store(false, std::memory_order_release);
}

} // namespace arcrw
