#pragma once

#include <cstddef>
#include <type_traits>

// Placement new without <new>
// The tag keeps our overload from colliding with the standard placement form.
//
// Usage:
//   new (rc::placement_new, slot) T(rc::forward<Args>(args)...);

namespace rc
{
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new = {};

/// Uninitialized, correctly aligned storage for exactly one T.
/// The union member is never constructed or destroyed implicitly;
/// the owner starts and ends its lifetime by hand.
template <class T>
union storage_for
{
    T value;

    storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    // trivial copies when T is trivially copyable (keeps rc::optional<int> trivial)
    storage_for(storage_for const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    storage_for& operator=(storage_for const&)
        requires std::is_trivially_copyable_v<T>
    = default;
};
} // namespace rc

inline void* operator new(std::size_t, rc::placement_new_t, void* buffer) noexcept
{
    return buffer;
}

// only needed for symmetry, never called
inline void operator delete(void*, rc::placement_new_t, void*) noexcept {}
