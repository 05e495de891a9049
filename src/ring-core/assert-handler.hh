#pragma once

#include <ring-core/macros.hh>
#include <ring-core/source_location.hh>

#include <functional>
#include <string>

namespace rc::impl
{
// Customizable assertion handler stack
// NOTE: global state, must be externally synchronized
//
// A handler may throw to unwind to a recovery point instead of aborting.
// The tests use this to observe assertion failures:
//
//   {
//       auto handler = rc::impl::scoped_assertion_handler([](rc::impl::assertion_info const& info) {
//           throw my_assertion_error{info.message};
//       });
//       deque.swap_elements(0, 17); // throws my_assertion_error instead of aborting
//   }

struct assertion_info
{
    std::string expression;
    std::string message;
    rc::source_location location;
};

// Push a handler that receives all assertion failures until it is popped
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost handler (no-op if the stack is empty)
// Prefer scoped_assertion_handler, it also pops when a throwing handler unwinds
void pop_assertion_handler();

// Pushes on construction, pops on destruction
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace rc::impl
