#pragma once

#include <large-collections/assert.hh>
#include <large-collections/fwd.hh>
#include <large-collections/source_location.hh>

// =========================================================================================================
// Contract checks
//
// Caller-facing preconditions of the containers. Unlike LC_ASSERT these are active in every build:
// a bad index into a multi-billion element list is a caller error that must never silently corrupt memory.
//
// Each check is a cheap inline comparison. On failure a cold out-of-line function formats the message,
// routes an assertion_info with the matching lc::error_kind through the handler stack and, if the handler
// returns, aborts. The location is captured through the defaulted source_location parameter.
//
// Usage:
//   lc::check_index(index, _count);               // error_kind::range
//   lc::check_range(offset, count, _count);       // error_kind::range
//   lc::check_capacity(capacity, max_capacity);   // error_kind::capacity
// =========================================================================================================

namespace lc::impl
{
[[noreturn]] LC_COLD_FUNC void report_index_violation(isize index, isize count, lc::source_location site);
[[noreturn]] LC_COLD_FUNC void report_range_violation(isize offset, isize count, isize size, lc::source_location site);
[[noreturn]] LC_COLD_FUNC void report_capacity_violation(isize capacity, isize min, isize max, lc::source_location site);
[[noreturn]] LC_COLD_FUNC void report_count_limit(isize count, isize added, isize limit, lc::source_location site);
[[noreturn]] LC_COLD_FUNC void report_not_found(char const* what, lc::source_location site);
[[noreturn]] LC_COLD_FUNC void report_invalid_configuration(char const* expression,
                                                            char const* message,
                                                            lc::source_location site);
} // namespace lc::impl

namespace lc
{
/// 0 <= index < count, otherwise error_kind::range
constexpr void check_index(isize index, isize count, lc::source_location site = lc::source_location::current())
{
    if (index < 0 || index >= count) [[unlikely]]
        impl::report_index_violation(index, count, site);
}

/// offset >= 0, count >= 0 and offset + count <= size, otherwise error_kind::range
constexpr void check_range(isize offset, isize count, isize size, lc::source_location site = lc::source_location::current())
{
    // written so that offset + count cannot overflow
    if (offset < 0 || count < 0 || offset > size || count > size - offset) [[unlikely]]
        impl::report_range_violation(offset, count, size, site);
}

/// 0 <= capacity <= limit, otherwise error_kind::capacity
constexpr void check_capacity(isize capacity, isize limit, lc::source_location site = lc::source_location::current())
{
    if (capacity < 0 || capacity > limit) [[unlikely]]
        impl::report_capacity_violation(capacity, 0, limit, site);
}

/// min <= capacity <= max, otherwise error_kind::capacity
constexpr void check_capacity_between(isize capacity, isize min, isize max, lc::source_location site = lc::source_location::current())
{
    if (capacity < min || capacity > max) [[unlikely]]
        impl::report_capacity_violation(capacity, min, max, site);
}

/// count + added <= limit, otherwise error_kind::capacity
/// Used before inserting into a container whose count is already at its ceiling
constexpr void check_count_limit(isize count, isize added, isize limit, lc::source_location site = lc::source_location::current())
{
    if (added > limit - count) [[unlikely]]
        impl::report_count_limit(count, added, limit, site);
}

/// found must be true, otherwise error_kind::not_found
constexpr void check_found(bool found, char const* what, lc::source_location site = lc::source_location::current())
{
    if (!found) [[unlikely]]
        impl::report_not_found(what, site);
}
} // namespace lc

// LC_CHECK_CONFIG - validates a policy parameter, error_kind::invalid_configuration on failure
// Usage: LC_CHECK_CONFIG(grow_factor > 1.0, "grow factor must be greater than 1");
#define LC_CHECK_CONFIG(cond, msg)                                                                \
    do                                                                                            \
    {                                                                                             \
        if (!(cond)) [[unlikely]]                                                                 \
            ::lc::impl::report_invalid_configuration(#cond, msg, ::lc::source_location::current()); \
    } while (false)
