#pragma once

#include <ring-core/fwd.hh>
#include <ring-core/new.hh>
#include <ring-core/utility.hh>

#include <cstring>
#include <type_traits>

// Object lifetime helpers over raw slot ranges.
//
// All "create" helpers share one shape: `dest_end` points at the first unconstructed slot and is
// advanced after each successful construction. If a constructor throws, [original dest_end, dest_end)
// is exactly the set of objects that are alive, so the caller can destroy them.
//
// ring_deque relocates its front run and back run with these, one contiguous run at a time.

namespace rc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges and nullptr are valid no-ops; trivially destructible types compile to nothing.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs [src_start, src_end) into the uninitialized slots starting at dest_end.
/// Trivially copyable types use memcpy.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (rc::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs [src_start, src_end) into the uninitialized slots starting at dest_end.
/// The sources stay alive (moved-from); the caller destroys them.
/// No exception safety is promised for throwing move constructors.
/// Trivially copyable types use memcpy.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (rc::placement_new, dest_end) T(rc::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}
} // namespace rc::impl
