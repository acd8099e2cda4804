#pragma once

#include <cassert>
#include <cstddef>
#include <type_traits>

namespace arcrw {

// 连续元素的胖指针：{首地址, 元素个数}。不拥有内存。
template<typename E>
class SliceRef {
public:
    using element_type = E;
    using iterator     = E*;

    constexpr SliceRef() noexcept = default;
    constexpr SliceRef(E* data, std::size_t len) noexcept : data_(data), len_(len) {}

    // 允许 SliceRef<E> -> SliceRef<const E>
    template<typename F,
             typename = std::enable_if_t<std::is_convertible<F (*)[], E (*)[]>::value>>
    constexpr SliceRef(const SliceRef<F>& other) noexcept : data_(other.data()), len_(other.size()) {}

    constexpr E*          data() const noexcept { return data_; }
    constexpr std::size_t size() const noexcept { return len_; }
    constexpr bool        empty() const noexcept { return len_ == 0; }

    constexpr E* begin() const noexcept { return data_; }
    constexpr E* end() const noexcept { return data_ + len_; }

    E& operator[](std::size_t i) const noexcept {
        assert(i < len_ && "SliceRef index out of range");
        return data_[i];
    }

    E& front() const noexcept { return (*this)[0]; }
    E& back() const noexcept { return (*this)[len_ - 1]; }

    // [offset, offset + count)
    SliceRef subslice(std::size_t offset, std::size_t count) const noexcept {
        assert(offset <= len_ && count <= len_ - offset && "SliceRef subslice out of range");
        return SliceRef(data_ + offset, count);
    }

private:
    E*          data_ = nullptr;
    std::size_t len_  = 0;
};

namespace detail {

// 子字段/整体负载的指针形态：定长类型用裸指针，数组类型 E[] 用 SliceRef<E>
template<typename T>
struct SubfieldTraits {
    using element_type    = T;
    using pointer         = T*;
    using const_pointer   = const T*;
    using const_reference = const T&;

    static constexpr bool kIsSlice = false;

    static pointer FromErased(void* p, std::size_t /*len*/) noexcept { return static_cast<T*>(p); }
    static const_reference DerefConst(const_pointer p) noexcept { return *p; }
};

template<typename E>
struct SubfieldTraits<E[]> {
    using element_type    = E;
    using pointer         = SliceRef<E>;
    using const_pointer   = SliceRef<const E>;
    using const_reference = SliceRef<const E>;

    static constexpr bool kIsSlice = true;

    static pointer FromErased(void* p, std::size_t len) noexcept { return SliceRef<E>(static_cast<E*>(p), len); }
    static const_reference DerefConst(const_pointer p) noexcept { return p; }
};

} // namespace detail

} // namespace arcrw
