#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>

// =========================================================================================================
// Utility functions used across ring-core
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - the larger of two values (requires operator<)
//   min(a, b)                   - the smaller of two values (requires operator<)
//
// Ring arithmetic:
//   wrapped_increment(pos, max) - increment with wrap-around to 0 at max
//   wrapped_decrement(pos, max) - decrement with wrap-around to max-1 at 0
//   wrapped_add(pos, n, max)    - (pos + n) % max for 0 <= pos < max and 0 <= n <= max
//
// Swapping:
//   swap(a, b)                  - swap values, respects ADL swap overloads
//
// Alignment:
//   is_power_of_two(value)      - check if value is a power of 2
//
// Iterator utilities:
//   sentinel                    - lightweight end-of-range sentinel type
//

namespace rc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace obj with new_val and return obj's previous value
/// Usage:
///   auto* block = rc::exchange(rhs._slots, nullptr); // take ownership, leave rhs empty
template <class T, class U = T>
[[nodiscard]] RC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (min returns a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Ring arithmetic
// =========================================================================================================

/// Increment with wrap-around: (pos + 1) % max, without a division
/// Precondition: max > 0
/// Usage:
///   // wrapped_increment(0, 3) == 1
///   // wrapped_increment(2, 3) == 0
template <class T>
[[nodiscard]] constexpr T wrapped_increment(T pos, T max)
{
    RC_ASSERT(max > 0, "wrapped_increment: max must be positive");
    ++pos;
    return pos == max ? T(0) : pos;
}

/// Decrement with wrap-around: (pos - 1 + max) % max, without a division
/// Precondition: max > 0
/// Usage:
///   // wrapped_decrement(1, 3) == 0
///   // wrapped_decrement(0, 3) == 2
template <class T>
[[nodiscard]] constexpr T wrapped_decrement(T pos, T max)
{
    RC_ASSERT(max > 0, "wrapped_decrement: max must be positive");
    return pos == 0 ? max - 1 : pos - 1;
}

/// Offset with a single wrap-around: (pos + n) % max, without a division
/// Maps a logical ring index to a physical slot: wrapped_add(head, i, capacity)
/// Precondition: 0 <= pos < max and 0 <= n <= max
/// Usage:
///   // wrapped_add(2, 1, 4) == 3
///   // wrapped_add(2, 3, 4) == 1
template <class T>
[[nodiscard]] constexpr T wrapped_add(T pos, T n, T max)
{
    RC_ASSERT(0 <= pos && pos < max, "wrapped_add: pos must be in [0, max)");
    RC_ASSERT(0 <= n && n <= max, "wrapped_add: n must be in [0, max]");
    auto const r = pos + n;
    return r >= max ? r - max : r;
}

// =========================================================================================================
// Swapping
// =========================================================================================================

namespace impl
{
struct swap_fn
{
    template <class T>
    constexpr void operator()(T& a, T& b) const;
};
} // namespace impl

/// ADL-aware swap that respects custom swap overloads
/// A function object (not a function) so it cannot be found by ADL itself
/// Usage:
///   rc::swap(a, b); // finds custom swap via ADL if available, otherwise swaps by move
[[maybe_unused]] constexpr impl::swap_fn swap;

// =========================================================================================================
// Alignment
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    RC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

// =========================================================================================================
// Iterator utilities
// =========================================================================================================

/// A generic end-of-range sentinel type
/// Usage:
///   struct my_range {
///       my_iterator begin() { return ...; }
///       rc::sentinel end() const { return {}; }
///   };
///   struct my_iterator {
///       bool operator!=(rc::sentinel) const { return is_still_valid(); }
///   };
struct sentinel
{
};

} // namespace rc

// =========================================================================================================
// Implementation
// =========================================================================================================

// must be done outside of the rc namespace so rc::swap cannot be found anymore
namespace _no_rc_namespace // NOLINT
{
template <class T>
constexpr void do_swap_impl(T& a, T& b)
{
    if constexpr (requires { swap(a, b); })
    {
        swap(a, b);
    }
    else
    {
        T tmp = static_cast<T&&>(a);
        a = static_cast<T&&>(b);
        b = static_cast<T&&>(tmp);
    }
}
} // namespace _no_rc_namespace

template <class T>
constexpr void rc::impl::swap_fn::operator()(T& a, T& b) const
{
    _no_rc_namespace::do_swap_impl(a, b);
}
