#pragma once

#include <large-collections/assert.hh>
#include <large-collections/fwd.hh>
#include <large-collections/macros.hh>

#include <cstring>
#include <new>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//
// Integer division:
//   int_div_round_up(nom, denom) - divide integers and round up (both > 0)
//
// Swapping:
//   swap(a, b)                  - swap values, respects ADL swap overloads
//
// Memory:
//   is_power_of_two(value)      - check if value is a power of 2
//   placement_new               - tag for lc placement new without <new> ambiguity
//   memcpy(dest, src, bytes)    - byte copy for trivially copyable payloads
//
// Template metaprogramming:
//   always_false_t<T...>        - always false for static_assert with type parameters
//   function_ptr<Signature>     - convert function signature to function pointer type
//
// Iterator utilities:
//   sentinel                    - lightweight end-of-range sentinel type


namespace lc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto ptr = lc::exchange(p, nullptr);     // take ownership of p, set p to null
template <class T, class U = T>
[[nodiscard]] LC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Integer division
// =========================================================================================================

/// Divide integers and round up: ceil(nom / denom)
/// Precondition: nom > 0 && denom > 0
/// Usage:
///   // int_div_round_up(25, 10) == 3
template <class T>
[[nodiscard]] constexpr T int_div_round_up(T nom, T denom)
{
    LC_ASSERT(nom > 0 && denom > 0, "int_div_round_up: both nom and denom must be positive");
    return 1 + ((nom - 1) / denom);
}

// =========================================================================================================
// Swapping
// =========================================================================================================

namespace impl
{
struct swap_fn
{
    template <class T>
    constexpr void operator()(T& a, T& b) const;
};
} // namespace impl

/// ADL-aware swap that respects custom swap overloads
/// Implemented as a function object (not a function) so it cannot be found by ADL
/// Usage:
///   lc::swap(a, b);  // finds custom swap via ADL if available, otherwise uses move-based swap
[[maybe_unused]] constexpr impl::swap_fn swap;

// =========================================================================================================
// Memory
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    LC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Tag type selecting the lc placement new overload
/// Usage:
///   new (lc::placement_new, ptr) T(args...);
struct placement_new_t
{
};
[[maybe_unused]] constexpr placement_new_t placement_new;

/// Byte copy, only valid for trivially copyable payloads
inline void memcpy(void* dest, void const* src, isize bytes)
{
    LC_ASSERT(bytes >= 0, "memcpy: byte count must be non-negative");
    std::memcpy(dest, src, static_cast<std::size_t>(bytes));
}

// =========================================================================================================
// Template metaprogramming
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   lc::function_ptr<lc::byte*(lc::isize, lc::isize, void*)> -> lc::byte* (*)(lc::isize, lc::isize, void*)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Iterator utilities
// =========================================================================================================

/// A generic end-of-range sentinel type
/// Chunked iterators compare against it instead of carrying a second chunk cursor
struct sentinel
{
};

} // namespace lc

// =========================================================================================================
// Implementation
// =========================================================================================================

inline void* operator new(std::size_t, lc::placement_new_t, void* buffer) noexcept
{
    return buffer;
}
inline void operator delete(void*, lc::placement_new_t, void*) noexcept {}

// must be done outside of the lc namespace so lc::swap cannot be found anymore
namespace _no_lc_namespace // NOLINT
{
template <class T>
constexpr void do_swap_impl(T& a, T& b)
{
    if constexpr (requires { swap(a, b); })
    {
        swap(a, b);
    }
    else
    {
        T tmp = static_cast<T&&>(a);
        a = static_cast<T&&>(b);
        b = static_cast<T&&>(tmp);
    }
}
} // namespace _no_lc_namespace

template <class T>
constexpr void lc::impl::swap_fn::operator()(T& a, T& b) const
{
    _no_lc_namespace::do_swap_impl(a, b);
}
