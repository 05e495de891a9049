#pragma once

#include <cstddef>
#include <cstdint>


namespace rc
{

//
// Primitives
//

// Explicitly-sized primitive types
// Used wherever the range matters for correctness or memory layout.
// Plain "int" is still fine for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// All sizes, capacities and indices are signed:
// * ring arithmetic subtracts a lot ("head - 1", "size - front_run") and unsigned underflows silently
// * "index < 0" is a meaningful out-of-range argument for at(), not a wrapped huge number
// * we only target 64-bit platforms, so i64 has plenty of range
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Views
//

template <class T>
struct span;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct ring_runs;
template <class T>
struct ring_deque;

template <class T>
struct sortable;

} // namespace rc
