#pragma once

#include <large-collections/fwd.hh>

// =========================================================================================================
// Compile-time configuration
// =========================================================================================================
//
// LC_MAX_CHUNK_SIZE - maximum number of elements in a single chunk (default 2146435071).
//                     Every container splits its elements across chunks of at most this size.
//                     Test builds set it to 10 so multi-chunk behavior shows up with tiny containers.

#ifndef LC_MAX_CHUNK_SIZE
#define LC_MAX_CHUNK_SIZE 2146435071
#endif

namespace lc
{
/// Maximum number of elements stored in one chunk
inline constexpr isize max_chunk_size = LC_MAX_CHUNK_SIZE;
static_assert(max_chunk_size >= 1, "LC_MAX_CHUNK_SIZE must be positive");
static_assert(max_chunk_size <= 3037000499, "max_chunk_size^2 must fit into isize");

/// Maximum capacity (and count) of any container
inline constexpr isize max_capacity = max_chunk_size * max_chunk_size;

/// Maximum bucket count of a hash set, bounded by the 32 bit hash domain
inline constexpr isize max_bucket_count = max_capacity < 4294967295 ? max_capacity : 4294967295;

inline constexpr f64 max_grow_factor = 3.0;
inline constexpr f64 default_grow_factor = 1.4;
inline constexpr isize default_fixed_grow_amount = 100 * 1024 * 1024;
inline constexpr isize default_fixed_grow_limit = 50 * 1024 * 1024;

inline constexpr f64 default_min_load_factor = 0.5;
inline constexpr f64 default_max_load_factor = 1.0;
inline constexpr f64 default_min_load_factor_tolerance = 0.1;
} // namespace lc

/// Capacity growth of lists and hash sets.
/// Below fixed_grow_limit, capacity grows multiplicatively: floor(capacity * grow_factor) + 1.
/// At or above it, capacity grows additively: capacity + fixed_grow_amount.
struct lc::growth_policy
{
    f64 grow_factor = default_grow_factor;
    isize fixed_grow_amount = default_fixed_grow_amount;
    isize fixed_grow_limit = default_fixed_grow_limit;

    /// Raises error_kind::invalid_configuration unless
    /// 1 < grow_factor <= max_grow_factor, fixed_grow_amount >= 1 and fixed_grow_limit >= 1
    void validate() const;

    /// Next capacity after `capacity`, clamped to `limit`
    /// Always > capacity unless capacity already is at the limit
    [[nodiscard]] isize grown_capacity(isize capacity, isize limit = max_capacity) const;
};

/// Load factor bounds of a hash set (load factor = count / bucket count).
/// The set rehashes into more buckets when the load factor exceeds max_load_factor,
/// and into fewer when it drops to min_load_factor * min_load_factor_tolerance or below.
struct lc::load_factor_policy
{
    f64 min_load_factor = default_min_load_factor;
    f64 max_load_factor = default_max_load_factor;
    f64 min_load_factor_tolerance = default_min_load_factor_tolerance;

    /// Raises error_kind::invalid_configuration unless
    /// 0 < min_load_factor < max_load_factor and min_load_factor_tolerance >= 0
    void validate() const;
};
