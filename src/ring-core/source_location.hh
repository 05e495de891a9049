#pragma once

#include <source_location>

namespace rc
{
/// Source position (file, line, column, function) captured by the assertion macros.
/// Plain alias, ring-core does not need anything beyond std::source_location.
using source_location = std::source_location;
} // namespace rc
