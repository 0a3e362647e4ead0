#pragma once

#include <large-collections/fwd.hh>
#include <large-collections/utility.hh>

#include <type_traits>

// Object lifetime helpers for raw chunk memory.
// All *_create_objects_to functions construct into uninitialized memory starting at dest_end
// and advance dest_end past every successfully constructed object. If a constructor throws,
// [original dest_end, dest_end) is exactly the set of live objects, so the owner can destroy them.

namespace lc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
template <class T>
void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Value-initializes count objects via T(), which zero-initializes trivial types.
template <class T>
void default_create_objects_to(T*& dest_end, isize count)
{
    static_assert(std::is_default_constructible_v<T>, "T must be default constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (lc::placement_new, dest_end) T();
        ++dest_end;
    }
}

/// Copy-constructs objects from [src_start, src_end).
/// Trivially copyable types are copied with memcpy.
template <class T>
void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            lc::memcpy(dest_end, src_start, size * isize(sizeof(T)));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (lc::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end).
/// The moved-from objects stay alive; the caller still owns their destruction.
template <class T>
void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            lc::memcpy(dest_end, src_start, size * isize(sizeof(T)));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (lc::placement_new, dest_end) T(lc::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}
} // namespace lc::impl
