#pragma once

#include <ring-core/fwd.hh>
#include <ring-core/to_string.hh>

#include <cstddef>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace rc
{
struct debug_string_config
{
    // collections stop appending elements once the output reaches this length (not strict)
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort and only meant for diagnostics (ring_deque::to_string renders its elements with it).
//
// Strategy (in order):
//   - String-likes: wrapped in double quotes "..."
//   - char: wrapped in single quotes, control characters escaped ('\n', '\x01', ...)
//   - rc::to_string(v) / ADL to_string(v) if available
//   - v.to_string() if available (this is how a ring_deque renders)
//   - Ranges: [v0, v1, ...], truncated with ", ..." after cfg.max_length characters
//   - Tuple-likes: (v0, v1, ...)
//   - Otherwise: hex dump of the object bytes
//
// Output is not stable and not meant to be parsed.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += rc::to_debug_string(v, cfg);

    return true;
}

template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(rc::impl::to_debug_string_append_elem(s, std::get<I>(v), cfg) && ...);
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");

        if (v == '\0')
            s += "\\0";
        else if (v == '\n')
            s += "\\n";
        else if (v == '\r')
            s += "\\r";
        else if (v == '\t')
            s += "\\t";
        else if (v == '\\')
            s += "\\\\";
        else if (v == '\'')
            s += "\\'";
        else if (v < 32 || v == 127)
            s += std::format("\\x{:02X}", static_cast<unsigned char>(v));
        else
            s += v;

        s += '\'';
        return s;
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
            if (!rc::impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        rc::impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = reinterpret_cast<unsigned char const*>(&v);
        for (std::size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            s += std::format("{:02X}", p_v[i]);
        }
        return s;
    }
}
} // namespace rc
