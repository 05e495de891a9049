#pragma once

#include <ring-core/assertf.hh>
#include <ring-core/fwd.hh>

#include <limits>

// Raw, aligned byte storage from the system allocator.
//
// ring_deque keeps its slots in one such block. The block holds no live objects by itself:
// the deque constructs and destroys elements in place (see impl/object_lifetime_util.hh),
// which is why it does not go through an owning container type.
//
// Contract:
// - bytes == 0 returns nullptr without touching the system allocator
// - bytes > 0 returns a non-null block aligned to `alignment`; exhaustion is an always-on assertion
// - deallocate_bytes(nullptr, ...) is a no-op
// - bytes and alignment passed to deallocate_bytes must match the allocation

namespace rc::impl
{
/// Allocates `bytes` bytes aligned to `alignment` (a power of two).
[[nodiscard]] rc::byte* allocate_bytes(isize bytes, isize alignment);

/// Returns a block obtained from allocate_bytes.
void deallocate_bytes(rc::byte* p, isize bytes, isize alignment);

/// Typed convenience: uninitialized slots for `count` objects of type T.
/// A byte size that does not fit into isize is an always-on assertion.
template <class T>
[[nodiscard]] T* allocate_slots(isize count)
{
    RC_ASSERTF_ALWAYS(count <= std::numeric_limits<isize>::max() / isize(sizeof(T)),
                      "allocate_slots: {} slots of {} bytes overflow the byte size", count, sizeof(T));
    return reinterpret_cast<T*>(impl::allocate_bytes(count * isize(sizeof(T)), isize(alignof(T))));
}

template <class T>
void deallocate_slots(T* slots, isize count)
{
    impl::deallocate_bytes(reinterpret_cast<rc::byte*>(slots), count * isize(sizeof(T)), isize(alignof(T)));
}
} // namespace rc::impl
