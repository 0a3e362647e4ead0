#pragma once

#include <large-collections/fwd.hh>

#include <functional>

// Default strategy objects of the containers.
// Hash sets and dictionaries take a hash and an equality functor as template arguments,
// sort and binary_search take a strict weak ordering.

/// 32 bit hash built on std::hash, folding the upper half of 64 bit hashes into the lower half.
/// Bucket indices are (u64(hash) % bucket_count), so the hash domain bounds the bucket count (see max_bucket_count).
template <class T>
struct lc::default_hash
{
    [[nodiscard]] u32 operator()(T const& value) const
    {
        auto const h = u64(std::hash<T>{}(value));
        return u32(h ^ (h >> 32));
    }
};

template <class T>
struct lc::default_equal
{
    [[nodiscard]] bool operator()(T const& a, T const& b) const { return a == b; }
};

/// Ascending order via operator<
struct lc::default_less
{
    template <class T>
    [[nodiscard]] bool operator()(T const& a, T const& b) const
    {
        return a < b;
    }
};
