#include "arcrw/Arc/ArcHeader.hpp"

#include <type_traits>

namespace arcrw {
namespace detail {

static_assert(std::is_standard_layout<ArcHeader>::value,
              "ArcHeader must be standard-layout for offsetof");

namespace {
constexpr std::size_t kLockOffset = offsetof(ArcHeader, lock);
} // namespace

ArcHeader* ArcHeader::FromLock(PoisonLock* lock) noexcept {
    if (!lock) return nullptr;
    auto addr = reinterpret_cast<std::uintptr_t>(lock);
    return reinterpret_cast<ArcHeader*>(addr - kLockOffset);
}

const ArcHeader* ArcHeader::FromLock(const PoisonLock* lock) noexcept {
    if (!lock) return nullptr;
    auto addr = reinterpret_cast<std::uintptr_t>(lock);
    return reinterpret_cast<const ArcHeader*>(addr - kLockOffset);
}

} // namespace detail
} // namespace arcrw
