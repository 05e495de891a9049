#include "memory.hh"

#include <ring-core/assertf.hh>
#include <ring-core/macros.hh>
#include <ring-core/utility.hh>

#include <cstdlib>

rc::byte* rc::impl::allocate_bytes(isize bytes, isize alignment)
{
    RC_ASSERT(alignment > 0 && rc::is_power_of_two(alignment), "alignment must be a power of 2");
    RC_ASSERTF(bytes >= 0, "cannot allocate a negative number of bytes ({})", bytes);

    if (bytes == 0)
        return nullptr;

    rc::byte* p = nullptr;

#ifdef RC_OS_WINDOWS
    p = static_cast<rc::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign instead of std::aligned_alloc: no bytes % alignment == 0 requirement
    // posix_memalign needs alignment >= sizeof(void*), so we clamp to that minimum
    void* raw_ptr = nullptr;
    isize const effective_alignment = alignment < isize(sizeof(void*)) ? isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, effective_alignment, bytes);
    p = result == 0 ? static_cast<rc::byte*>(raw_ptr) : nullptr;
#endif

    RC_ASSERTF_ALWAYS(p != nullptr, "allocation failed: requested {} bytes with alignment {}", bytes, alignment);
    return p;
}

void rc::impl::deallocate_bytes(rc::byte* p, isize bytes, isize alignment)
{
    // malloc-style allocators do not need size and alignment back
    RC_UNUSED(bytes);
    RC_UNUSED(alignment);

    if (p == nullptr)
        return;

#ifdef RC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}
