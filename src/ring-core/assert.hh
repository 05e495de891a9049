#pragma once

// Lean header: only macros and source_location, cheap to include from every container header.
// Formatted messages live in <ring-core/assertf.hh>.
#include <ring-core/macros.hh>
#include <ring-core/source_location.hh>

// =========================================================================================================
// RC_ASSERT - Runtime assertion with string literal message
//
// Checks a condition and, on failure, reports it through the assertion handler,
// breaks into an attached debugger and aborts.
//
// Active when RC_ASSERT_ENABLED is 1 (debug and release-with-debug-info builds,
// or release builds with RC_ENABLE_ASSERT_IN_RELEASE).
//
// Assertions guard PRECONDITIONS and INVARIANTS, i.e. programmer errors:
//   - reference access with an out-of-range index
//   - reading the value of an empty rc::optional
//   - malformed spans or allocation requests
//
// They are NOT used for expected outcomes. Probing an empty ring_deque with front(), at() or
// pop_back() returns an empty rc::optional instead.
//
// Error handling strategy:
//   - Assertions          -> programmer errors (negative sizes, out-of-range swaps, ...)
//   - rc::optional<T>     -> expected "nothing there" results
//
// Usage:
//   RC_ASSERT(i >= 0 && i < size(), "index out of bounds");
//   RC_ASSERT(has_value(), "attempted to access value of empty optional");
//
#define RC_ASSERT(cond, msg) RC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// RC_ASSERT_ALWAYS - Always-active assertion
//
// Like RC_ASSERT but checked in every build configuration.
// ring_deque uses the ALWAYS family for the argument checks callers can get wrong
// (negative growth, swap/compare bounds), because silently continuing would corrupt the ring.
//
// Usage:
//   RC_ASSERT_ALWAYS(p != nullptr, "allocation failed");
//
#define RC_ASSERT_ALWAYS(cond, msg) RC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// RC_DEBUG_BREAK - Break into the debugger if one is attached, otherwise do nothing
//
#define RC_DEBUG_BREAK() RC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// RC_BREAK_AND_ABORT - Debug break (if attached) followed by program termination
//
// Used by the assertion macros after the handler returned.
// A handler that throws never reaches this point.
//
#define RC_BREAK_AND_ABORT() (RC_DEBUG_BREAK(), ::rc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace rc::impl
{
// Called when an assertion fails
// Dispatches to the topmost custom handler, or prints a report to stderr
// Note: does not abort, caller must follow with RC_BREAK_AND_ABORT()
RC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, rc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace rc::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef RC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define RC_IMPL_DEBUG_BREAK() (::rc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(RC_COMPILER_POSIX)

// SIGTRAP is 5 (https://man7.org/linux/man-pages/man7/signal.7.html)
// raise is declared by hand to keep posix headers out of every container header
extern "C" int raise(int) noexcept;
#define RC_IMPL_DEBUG_BREAK() (::rc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define RC_IMPL_DEBUG_BREAK() void(0)

#endif

#define RC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::rc::impl::handle_assert_failure(#cond, msg, ::rc::source_location::current()); \
            RC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if RC_ASSERT_ENABLED

#define RC_IMPL_ASSERT(cond, msg) RC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define RC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        RC_UNUSED(cond);          \
        RC_UNUSED(msg);           \
    } while (false)

#endif
