#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

namespace arcrw {

/**
 * 分配器约定
 * ------------------------------------------------------------
 * 分配块（计数头 + 锁 + 负载）一次性向分配器申请，释放时原样归还。
 * 分配器必须可拷贝（切分出的每个元素句柄各持有一份），并提供：
 *
 *   void* Allocate(std::size_t size, std::size_t align) noexcept;   // 失败返回 nullptr
 *   void  Deallocate(void* p, std::size_t size, std::size_t align) noexcept;
 *
 * 同一块内存的 Deallocate 可能由任意一份拷贝、在任意线程上调用。
 */
class GlobalAllocator {
public:
    GlobalAllocator() noexcept = default;

    void* Allocate(std::size_t size, std::size_t align) noexcept;
    void  Deallocate(void* p, std::size_t size, std::size_t align) noexcept;

    friend bool operator==(const GlobalAllocator&, const GlobalAllocator&) noexcept { return true; }
    friend bool operator!=(const GlobalAllocator&, const GlobalAllocator&) noexcept { return false; }
};

namespace detail {

template<typename A, typename = void>
struct IsArcAllocator : std::false_type {};

template<typename A>
struct IsArcAllocator<A, std::void_t<
    decltype(std::declval<A&>().Allocate(std::size_t{}, std::size_t{})),
    decltype(std::declval<A&>().Deallocate(static_cast<void*>(nullptr), std::size_t{}, std::size_t{}))>>
    : std::integral_constant<bool,
          std::is_copy_constructible<A>::value &&
          std::is_same<decltype(std::declval<A&>().Allocate(std::size_t{}, std::size_t{})), void*>::value> {};

} // namespace detail

template<typename A>
inline constexpr bool kIsArcAllocator = detail::IsArcAllocator<A>::value;

} // namespace arcrw
