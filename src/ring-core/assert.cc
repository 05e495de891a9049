#include "assert.hh"

#include <ring-core/assert-handler.hh>
#include <ring-core/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef RC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef RC_COMPILER_POSIX
#include <cstring>
#endif

namespace
{
// NOTE: not thread-safe, see assert-handler.hh
std::vector<std::move_only_function<void(rc::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(rc::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";

    std::cerr << "\nStacktrace:\n";
    auto trace = rc::stacktrace::current();
    std::cerr << std::to_string(trace) << '\n';
}
} // namespace

void rc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void rc::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

rc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

rc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

RC_COLD_FUNC void rc::impl::handle_assert_failure(char const* expression, char const* message, rc::source_location location)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool rc::impl::is_debugger_connected() noexcept
{
#ifdef RC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(RC_OS_LINUX)
    // TracerPid is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void rc::impl::perform_abort() noexcept
{
    std::abort();
}
