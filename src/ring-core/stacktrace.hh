#pragma once

#include <stacktrace>

namespace rc
{
/// Call stack snapshot printed by the default assertion handler.
/// Usage:
///   auto trace = rc::stacktrace::current();
///   std::cerr << std::to_string(trace);
using stacktrace = std::stacktrace;
} // namespace rc
