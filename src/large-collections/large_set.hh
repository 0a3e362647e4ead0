#pragma once

#include <large-collections/chunked_storage.hh>
#include <large-collections/config.hh>
#include <large-collections/contract.hh>
#include <large-collections/functors.hh>
#include <large-collections/fwd.hh>
#include <large-collections/large_array.hh>
#include <large-collections/utility.hh>

#include <cmath>
#include <initializer_list>

namespace lc::impl
{
/// Chain node of a large_set, addressed by its slot index in the node arena.
/// next == -1 terminates a chain (and the free list).
template <class T>
struct hash_node
{
    T item = T();
    isize next = -1;
};
} // namespace lc::impl

/// Separate-chaining hash set of up to max_capacity elements.
///
/// Layout:
///   - bucket array: large_array<isize> of chain-head slot indices, -1 for an empty bucket.
///     The bucket of an item is u64(hash(item)) % bucket_count().
///   - node arena: chunked storage of hash_node slots. Chains link slot indices, removed slots
///     go onto a free list and are reused by later adds.
///
/// The set grows (full rehash into growth_policy::grown_capacity buckets, at most max_bucket_count) when the
/// load factor exceeds max_load_factor, and shrinks (full rehash into count / min_load_factor buckets) when it
/// drops to min_load_factor * min_load_factor_tolerance or below after a remove.
///
/// Enumeration visits buckets in index order and each chain from head to tail.
///
/// HashT: u32 operator()(T const&), EqualT: bool operator()(T const&, T const&).
template <class T, class HashT, class EqualT>
struct lc::large_set
{
    using node_t = impl::hash_node<T>;

    static constexpr isize default_capacity = 1;

    // construction
public:
    large_set() : large_set(default_capacity) {}

    /// Empty set with `capacity` buckets.
    /// capacity error outside [1, max_bucket_count], invalid_configuration error for a bad policy.
    explicit large_set(isize capacity, load_factor_policy load = {}, growth_policy growth = {})
      : large_set(capacity, HashT{}, EqualT{}, load, growth)
    {
    }

    large_set(isize capacity, HashT hash, EqualT equal, load_factor_policy load = {}, growth_policy growth = {})
      : _hash(lc::move(hash)), _equal(lc::move(equal)), _load(load), _growth(growth)
    {
        lc::check_capacity_between(capacity, 1, max_bucket_count);
        _load.validate();
        _growth.validate();
        _buckets = large_array<isize>::create_filled(capacity, -1);
    }

    large_set(std::initializer_list<T> items) : large_set(default_capacity)
    {
        for (auto const& item : items)
            add(item);
    }

    // modification
public:
    /// Inserts `item`, or replaces the stored element equal to it (count unchanged).
    /// capacity error when a new element would exceed max_capacity.
    void add(T item)
    {
        if (_insert(lc::move(item)))
            _grow_if_needed();
    }

    template <class RangeT>
    void add_range(RangeT const& items)
    {
        for (auto const& item : items)
            add(item);
    }

    /// Removes the element equal to `item`, returns false if there is none.
    /// May shrink the bucket array afterwards.
    bool remove(T const& item) { return remove_matching(item); }

    /// remove() for a lookup key other than T, see try_get_matching
    template <class KeyT>
    bool remove_matching(KeyT const& key)
    {
        auto const bucket = _bucket_of(key);
        auto previous = isize(-1);
        auto current = _buckets[bucket];

        while (current >= 0)
        {
            auto& node = _nodes[current];
            if (_equal(node.item, key))
            {
                if (previous < 0)
                    _buckets[bucket] = node.next;
                else
                    _nodes[previous].next = node.next;

                _release_node(current);
                --_count;
                shrink();
                return true;
            }
            previous = current;
            current = node.next;
        }
        return false;
    }

    template <class RangeT>
    void remove_range(RangeT const& items)
    {
        for (auto const& item : items)
            remove(item);
    }

    /// Drops all elements, keeps the bucket count
    void clear()
    {
        _buckets.fill(-1);
        _nodes = chunked_storage<node_t>();
        _used_slots = 0;
        _free_head = -1;
        _count = 0;
    }

    /// Rehashes into max(1, ceil(size() / min_load_factor)) buckets if the load factor is at or below
    /// min_load_factor * min_load_factor_tolerance and that reduces the bucket count.
    /// The new load factor never exceeds min_load_factor.
    void shrink()
    {
        auto const capacity = _buckets.size();
        if (f64(_count) / f64(capacity) > _load.min_load_factor * _load.min_load_factor_tolerance)
            return;

        // the quotient may be far outside the isize range for tiny load factors
        auto const target = lc::max(1.0, std::ceil(f64(_count) / _load.min_load_factor));
        if (target < f64(capacity))
            _rehash(isize(target));
    }

    // lookup
public:
    [[nodiscard]] bool contains(T const& item) const { return _find(item) >= 0; }

    /// Stored element equal to `item`, nullptr if there is none.
    /// Invalidated by any modification of the set.
    [[nodiscard]] T const* try_get(T const& item) const { return try_get_matching(item); }

    /// Mutable access to the stored element equal to `item`, nullptr if there is none.
    /// Only parts of the element that HashT and EqualT ignore may be modified (see large_dictionary).
    [[nodiscard]] T* try_get_mutable(T const& item) { return try_get_mutable_matching(item); }

    /// Lookups by a key that is not a T.
    /// Requires hash(key) to equal hash(item) for every item with equal(item, key).
    template <class KeyT>
    [[nodiscard]] bool contains_matching(KeyT const& key) const
    {
        return _find(key) >= 0;
    }
    template <class KeyT>
    [[nodiscard]] T const* try_get_matching(KeyT const& key) const
    {
        auto const slot = _find(key);
        return slot < 0 ? nullptr : &_nodes[slot].item;
    }
    template <class KeyT>
    [[nodiscard]] T* try_get_mutable_matching(KeyT const& key)
    {
        auto const slot = _find(key);
        return slot < 0 ? nullptr : &_nodes[slot].item;
    }

    // iteration
public:
    /// Calls f(T const&) for every element, bucket by bucket
    template <class F>
    void for_each(F&& f) const
    {
        _buckets.for_each(
            [&](isize head)
            {
                for (auto slot = head; slot >= 0; slot = _nodes[slot].next)
                    f(_nodes[slot].item);
            });
    }

    struct iterator
    {
        large_set const* set = nullptr;
        isize bucket = 0;
        isize slot = -1;

        [[nodiscard]] T const& operator*() const { return set->_nodes[slot].item; }
        [[nodiscard]] T const* operator->() const { return &set->_nodes[slot].item; }

        iterator& operator++()
        {
            slot = set->_nodes[slot].next;
            if (slot < 0)
                _skip_empty_buckets(bucket + 1);
            return *this;
        }

        [[nodiscard]] bool operator==(lc::sentinel) const { return slot < 0; }
        [[nodiscard]] bool operator!=(lc::sentinel) const { return slot >= 0; }

        void _skip_empty_buckets(isize first)
        {
            auto const bucket_count = set->_buckets.size();
            for (bucket = first; bucket < bucket_count; ++bucket)
            {
                slot = set->_buckets[bucket];
                if (slot >= 0)
                    return;
            }
            slot = -1;
        }
    };

    [[nodiscard]] iterator begin() const
    {
        auto it = iterator{this, 0, -1};
        it._skip_empty_buckets(0);
        return it;
    }
    [[nodiscard]] lc::sentinel end() const { return {}; }

    // queries
public:
    [[nodiscard]] isize size() const { return _count; }
    [[nodiscard]] bool empty() const { return _count == 0; }

    /// Number of buckets
    [[nodiscard]] isize capacity() const { return _buckets.size(); }
    [[nodiscard]] f64 load_factor() const { return f64(_count) / f64(_buckets.size()); }

    [[nodiscard]] load_factor_policy const& load_policy() const { return _load; }
    [[nodiscard]] growth_policy const& policy() const { return _growth; }

    // helper
private:
    template <class KeyT>
    [[nodiscard]] isize _bucket_of(KeyT const& key) const
    {
        return isize(u64(u32(_hash(key))) % u64(_buckets.size()));
    }

    template <class KeyT>
    [[nodiscard]] isize _find(KeyT const& key) const
    {
        for (auto slot = _buckets[_bucket_of(key)]; slot >= 0; slot = _nodes[slot].next)
            if (_equal(_nodes[slot].item, key))
                return slot;
        return -1;
    }

    /// Adds to the current table without any growth check. Returns true if a new node was created.
    bool _insert(T&& item)
    {
        auto const bucket = _bucket_of(item);
        auto last = _buckets[bucket];

        if (last >= 0)
        {
            while (true)
            {
                auto& node = _nodes[last];
                if (_equal(node.item, item))
                {
                    node.item = lc::move(item);
                    return false;
                }
                if (node.next < 0)
                    break;
                last = node.next;
            }
        }

        lc::check_count_limit(_count, 1, max_capacity);

        // acquiring a slot may grow the arena, so no node reference is held across it
        auto const slot = _acquire_node(lc::move(item));
        if (last < 0)
            _buckets[bucket] = slot;
        else
            _nodes[last].next = slot;

        ++_count;
        return true;
    }

    [[nodiscard]] isize _acquire_node(T&& item)
    {
        isize slot;
        if (_free_head >= 0)
        {
            slot = _free_head;
            _free_head = _nodes[slot].next;
        }
        else
        {
            if (_used_slots == _nodes.size())
                _nodes.resize(_growth.grown_capacity(_nodes.size()));
            slot = _used_slots++;
        }

        auto& node = _nodes[slot];
        node.item = lc::move(item);
        node.next = -1;
        return slot;
    }

    void _release_node(isize slot)
    {
        auto& node = _nodes[slot];
        node.item = T();
        node.next = _free_head;
        _free_head = slot;
    }

    void _grow_if_needed()
    {
        auto const capacity = _buckets.size();
        if (f64(_count) / f64(capacity) <= _load.max_load_factor || capacity >= max_bucket_count)
            return;

        _rehash(_growth.grown_capacity(capacity, max_bucket_count));
    }

    /// Rebuilds every chain in a fresh bucket array and a fresh, compact node arena
    void _rehash(isize bucket_count)
    {
        auto old_buckets = lc::move(_buckets);
        auto old_nodes = lc::move(_nodes);
        auto const count = _count;

        _buckets = large_array<isize>::create_filled(bucket_count, -1);
        _nodes = chunked_storage<node_t>(count);
        _used_slots = 0;
        _free_head = -1;
        _count = 0;

        old_buckets.for_each(
            [&](isize head)
            {
                for (auto slot = head; slot >= 0; slot = old_nodes[slot].next)
                    _insert(lc::move(old_nodes[slot].item));
            });

        LC_ASSERT(_count == count, "rehash must preserve every element");
    }

    // members
private:
    HashT _hash;
    EqualT _equal;
    load_factor_policy _load;
    growth_policy _growth;

    large_array<isize> _buckets;
    chunked_storage<node_t> _nodes;
    isize _used_slots = 0; ///< slots [0, _used_slots) of _nodes were handed out at least once
    isize _free_head = -1;
    isize _count = 0;
};
