#include "allocation.hh"

#include <large-collections/macros.hh>
#include <large-collections/utility.hh>

#include <cstdlib>

namespace
{
/// Static function implementations for the system memory resource.
/// These ignore the userdata parameter as the system allocator is stateless.

lc::byte* system_allocate_bytes(lc::isize bytes, lc::isize alignment, void* userdata)
{
    LC_UNUSED(userdata);

    LC_ASSERT(alignment > 0 && lc::is_power_of_two(alignment), "alignment must be a power of 2");

    // Contract: bytes == 0 always returns nullptr
    if (bytes == 0)
        return nullptr;

    lc::byte* p = nullptr;

#ifdef LC_OS_WINDOWS
    p = static_cast<lc::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign has no bytes % alignment == 0 requirement (unlike std::aligned_alloc)
    // but requires alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    lc::isize const effective_alignment = alignment < lc::isize(sizeof(void*)) ? lc::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(bytes));
    p = result == 0 ? static_cast<lc::byte*>(raw_ptr) : nullptr;
#endif

    LC_ASSERT_ALWAYS(p != nullptr, "chunk allocation failed");
    return p;
}

void system_deallocate_bytes(lc::byte* p, lc::isize bytes, lc::isize alignment, void* userdata)
{
    LC_UNUSED(bytes);
    LC_UNUSED(alignment);
    LC_UNUSED(userdata);

#ifdef LC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

/// System memory resource instance stored in the data segment.
constinit lc::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit lc::memory_resource const* const lc::default_memory_resource = &system_memory_resource;
