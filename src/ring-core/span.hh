#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous run of T (pointer + runtime size).
///
/// ring_deque hands out its live elements as (at most) two spans, the front run and the back run,
/// and accepts bulk input as span<T const>.
/// Trivially copyable; the viewed memory must outlive the span.
template <class T>
struct rc::span
{
    // construction
public:
    /// Empty span: data() == nullptr, size() == 0.
    constexpr span() = default;

    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Views [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        RC_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Views [begin, end).
    /// Precondition: begin <= end.
    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        RC_ASSERT(begin <= end, "invalid pointer range");
    }

    /// Allows push_back_all({1, 2, 3}) for span<int const> parameters.
    /// WARNING: the initializer_list dies at the end of the full expression.
    /// Only use it as an immediate function argument.
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Views any contiguous container with .data() and .size() (std::vector, std::array, ...).
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    /// span<T> -> span<T const>
    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr span(span<U> rhs) : _data(rhs.data()), _size(rhs.size())
    {
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        RC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
