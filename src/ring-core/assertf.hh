#pragma once

#include <ring-core/assert.hh>

#include <format>

// =========================================================================================================
// RC_ASSERTF - Runtime assertion with std::format message
//
// Same semantics as RC_ASSERT, but the message is a std::format string with arguments.
// The arguments are only evaluated when the condition fails.
//
// Usage:
//   RC_ASSERTF(n >= 0, "grow: n must be non-negative, got {}", n);
//   RC_ASSERTF_ALWAYS(i < size, "swap_elements: index {} out of range [0, {})", i, size);
//
// Prefer RC_ASSERT for fixed messages: this header pulls in <format>.
//
#define RC_ASSERTF(cond, msg, ...) RC_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// RC_ASSERTF_ALWAYS - Always-active formatted assertion
//
#define RC_ASSERTF_ALWAYS(cond, msg, ...) RC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define RC_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::rc::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::rc::source_location::current());                          \
            RC_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if RC_ASSERT_ENABLED

#define RC_IMPL_ASSERTF(cond, msg, ...) RC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

// stripped, the format string is still type-checked
#define RC_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        RC_UNUSED(cond);                                        \
        RC_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
