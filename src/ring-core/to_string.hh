#pragma once

#include <ring-core/fwd.hh>

#include <string>
#include <string_view>

// Plain (non-quoted) string conversion for primitives.
// rc::to_debug_string builds on these for element rendering.

namespace rc
{
// in hex
[[nodiscard]] std::string to_string(void const* ptr);

// true/false
[[nodiscard]] std::string to_string(bool b);

// 0xFF
[[nodiscard]] std::string to_string(byte b);

// simply the char
[[nodiscard]] std::string to_string(char c);

// integer types
// note: spelled out per C type so every integer alias resolves without ambiguity
[[nodiscard]] std::string to_string(signed char i);
[[nodiscard]] std::string to_string(unsigned char i);
[[nodiscard]] std::string to_string(signed short i);
[[nodiscard]] std::string to_string(unsigned short i);
[[nodiscard]] std::string to_string(signed int i);
[[nodiscard]] std::string to_string(unsigned int i);
[[nodiscard]] std::string to_string(signed long i);
[[nodiscard]] std::string to_string(unsigned long i);
[[nodiscard]] std::string to_string(signed long long i);
[[nodiscard]] std::string to_string(unsigned long long i);

// float/double, shortest round-trip representation
[[nodiscard]] std::string to_string(float f);
[[nodiscard]] std::string to_string(double f);

// no-op
[[nodiscard]] std::string to_string(char const* s);
[[nodiscard]] std::string to_string(std::string_view s);

} // namespace rc
