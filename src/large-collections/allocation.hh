#pragma once

#include <large-collections/fwd.hh>
#include <large-collections/impl/object_lifetime_util.hh>
#include <large-collections/span.hh>
#include <large-collections/utility.hh>

// lc::allocation<T> is the owning "storage + liveness" handle behind every chunk.
//
// It models two things explicitly:
// 1) which bytes are owned (the allocation from an lc::memory_resource),
// 2) which objects inside those bytes are currently alive (the live window).
//
// A chunked container owns one allocation per chunk plus one allocation for the chunk table.
// Growing a container moves allocation handles between tables; element bytes stay where they are.
//
// Memory is obtained from a polymorphic lc::memory_resource (POD, function-pointer based, static-init safe).
// The resource pointer is stored *in the allocation*. A null resource means "use lc::default_memory_resource".
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the live object range (exclusive end), always within the allocation.
// - custom_resource == nullptr implies use of lc::default_memory_resource.

namespace lc
{
/// Default memory resource used when allocation::custom_resource == nullptr.
/// A system allocator stored in the data segment, valid even during static initialization.
extern lc::memory_resource const* const default_memory_resource;
} // namespace lc

/// Polymorphic memory resource interface powering lc::allocation<T>.
/// A POD struct of function pointers: no virtual dispatch and no non-trivial constructors.
/// Tests plug in counting resources to observe how many chunks a container allocates.
struct lc::memory_resource
{
    /// Allocate `bytes` with at least `alignment` alignment.
    /// bytes == 0 always returns nullptr.
    /// bytes > 0 always returns non-null; failure is fatal (assert/terminate) or throws.
    lc::function_ptr<lc::byte*(isize bytes, isize alignment, void* userdata)> allocate_bytes = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    lc::function_ptr<void(lc::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

/// Owning allocation handle for a contiguous byte block plus a typed "live window" inside it.
/// Not copyable: owners copy explicitly via create_copy_of.
template <class T>
struct lc::allocation
{
    /// Pointer to the first live object.
    T* obj_start = nullptr;

    /// Pointer one past the last live object (exclusive end).
    T* obj_end = nullptr;

    /// Start of the owned byte allocation (base pointer returned by the memory resource).
    lc::byte* alloc_start = nullptr;

    /// End of the owned byte allocation (exclusive).
    lc::byte* alloc_end = nullptr;

    /// Alignment that was used when allocating [alloc_start, alloc_end) from the resource.
    isize alignment = 0;

    /// Memory resource that owns the allocation, or nullptr for the global default.
    lc::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    /// Returns the effective resource to use for allocation operations.
    [[nodiscard]] lc::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff this owns a non-empty byte block
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Returns the span of live objects
    /// Note: proper mutability ("const correctness") is user responsibility
    [[nodiscard]] lc::span<T> obj_span() const { return lc::span<T>(obj_start, obj_end); }

    /// Number of live objects
    [[nodiscard]] isize size() const { return obj_end - obj_start; }

    /// Number of allocated bytes
    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    // factories
public:
    /// Creates an empty allocation with room for `size` objects but no live objects.
    /// size == 0 results in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_empty(isize size, memory_resource const* resource)
    {
        LC_ASSERT(size >= 0, "size must be non-negative");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignof(T);

        auto const& res = resource ? *resource : *default_memory_resource;
        auto const bytes = size * isize(sizeof(T));
        result.alloc_start = res.allocate_bytes(bytes, result.alignment, res.userdata);
        result.alloc_end = result.alloc_start + bytes;

        result.obj_start = reinterpret_cast<T*>(result.alloc_start);
        result.obj_end = result.obj_start;
        return result;
    }

    /// Creates a tight allocation of `size` value-initialized objects.
    [[nodiscard]] static allocation create_defaulted(isize size, memory_resource const* resource)
    {
        auto result = allocation::create_empty(size, resource);
        impl::default_create_objects_to(result.obj_end, size);
        return result;
    }

    /// Creates a tight deep copy of `source`.
    [[nodiscard]] static allocation create_copy_of(span<T const> source, memory_resource const* resource)
    {
        auto result = allocation::create_empty(source.size(), resource);
        impl::copy_create_objects_to(result.obj_end, source.data(), source.data() + source.size());
        return result;
    }

    /// Creates a tight allocation holding the first `keep` objects of `source` (moved),
    /// followed by value-initialized objects up to `size`.
    /// Used when the last chunk of a container changes width.
    [[nodiscard]] static allocation create_moved_from(allocation& source, isize keep, isize size, memory_resource const* resource)
    {
        LC_ASSERT(0 <= keep && keep <= source.size() && keep <= size, "invalid keep count");

        auto result = allocation::create_empty(size, resource);
        impl::move_create_objects_to(result.obj_end, source.obj_start, source.obj_start + keep);
        impl::default_create_objects_to(result.obj_end, size - keep);
        return result;
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies for allocations
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(lc::exchange(rhs.obj_start, nullptr)),
        obj_end(lc::exchange(rhs.obj_end, nullptr)),
        alloc_start(lc::exchange(rhs.alloc_start, nullptr)),
        alloc_end(lc::exchange(rhs.alloc_end, nullptr)),
        alignment(lc::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    /// Move assignment, safe even when rhs is nested inside one of the objects destroyed in *this:
    /// rhs is first moved into a temporary, then *this is released, then the temporary is adopted.
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = lc::move(rhs);

            _release();

            obj_start = lc::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = lc::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = lc::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = lc::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = lc::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource; // rhs resource stays
        }

        return *this;
    }

    ~allocation() { _release(); }

private:
    void _release()
    {
        // end life and call dtor of live objects
        impl::destroy_objects_in_reverse(obj_start, obj_end);

        // return allocation
        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }
};
