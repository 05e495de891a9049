#include "to_string.hh"

#include <format>

std::string rc::to_string(void const* ptr)
{
    return std::format("{}", ptr);
}

std::string rc::to_string(bool b)
{
    return b ? "true" : "false";
}

std::string rc::to_string(byte b)
{
    return std::format("0x{:02X}", static_cast<unsigned char>(b));
}

std::string rc::to_string(char c)
{
    return std::string(1, c);
}

std::string rc::to_string(signed char i)
{
    return std::format("{}", i);
}

std::string rc::to_string(unsigned char i)
{
    return std::format("{}", i);
}

std::string rc::to_string(signed short i)
{
    return std::format("{}", i);
}

std::string rc::to_string(unsigned short i)
{
    return std::format("{}", i);
}

std::string rc::to_string(signed int i)
{
    return std::format("{}", i);
}

std::string rc::to_string(unsigned int i)
{
    return std::format("{}", i);
}

std::string rc::to_string(signed long i)
{
    return std::format("{}", i);
}

std::string rc::to_string(unsigned long i)
{
    return std::format("{}", i);
}

std::string rc::to_string(signed long long i)
{
    return std::format("{}", i);
}

std::string rc::to_string(unsigned long long i)
{
    return std::format("{}", i);
}

std::string rc::to_string(float f)
{
    return std::format("{}", f);
}

std::string rc::to_string(double f)
{
    return std::format("{}", f);
}

std::string rc::to_string(char const* s)
{
    return {s};
}

std::string rc::to_string(std::string_view s)
{
    return std::string(s);
}
