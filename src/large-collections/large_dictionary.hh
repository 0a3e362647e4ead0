#pragma once

#include <large-collections/config.hh>
#include <large-collections/contract.hh>
#include <large-collections/functors.hh>
#include <large-collections/fwd.hh>
#include <large-collections/large_set.hh>
#include <large-collections/pair.hh>

#include <initializer_list>

namespace lc::impl
{
/// Hashes only the key of a dictionary entry, or a bare key for lookups
template <class K, class V, class HashT>
struct key_hash
{
    HashT hash;

    [[nodiscard]] u32 operator()(pair<K, V> const& entry) const { return hash(entry.key); }
    [[nodiscard]] u32 operator()(K const& key) const { return hash(key); }
};

/// Compares only the keys of two dictionary entries
template <class K, class V, class EqualT>
struct key_equal
{
    EqualT equal;

    [[nodiscard]] bool operator()(pair<K, V> const& a, pair<K, V> const& b) const { return equal(a.key, b.key); }
    [[nodiscard]] bool operator()(pair<K, V> const& entry, K const& key) const { return equal(entry.key, key); }
};
} // namespace lc::impl

/// Hash dictionary of up to max_capacity entries.
/// A large_set of lc::pair<K, V> whose hash and equality only look at the key,
/// so growth, shrink and enumeration order follow large_set.
///
/// Usage:
///   auto ages = lc::large_dictionary<std::string, int>();
///   ages.set("ada", 36);
///   ages["alan"] += 41;              // inserts 0 first
///   int a = ages.get("ada");         // not_found error if absent
///   if (int* v = ages.try_get("x")) ...
template <class K, class V, class HashT, class EqualT>
struct lc::large_dictionary
{
    using entry_t = pair<K, V>;
    using set_t = large_set<entry_t, impl::key_hash<K, V, HashT>, impl::key_equal<K, V, EqualT>>;

    // construction
public:
    large_dictionary() : large_dictionary(set_t::default_capacity) {}

    explicit large_dictionary(isize capacity, load_factor_policy load = {}, growth_policy growth = {})
      : _entries(capacity, impl::key_hash<K, V, HashT>{}, impl::key_equal<K, V, EqualT>{}, load, growth)
    {
    }

    large_dictionary(isize capacity, HashT hash, EqualT equal, load_factor_policy load = {}, growth_policy growth = {})
      : _entries(capacity,
                 impl::key_hash<K, V, HashT>{lc::move(hash)},
                 impl::key_equal<K, V, EqualT>{lc::move(equal)},
                 load,
                 growth)
    {
    }

    large_dictionary(std::initializer_list<entry_t> entries) : large_dictionary()
    {
        for (auto const& e : entries)
            add(e);
    }

    // element access
public:
    /// Value stored under `key`, error_kind::not_found if there is none
    [[nodiscard]] V const& get(K const& key) const
    {
        auto const* entry = _entries.try_get_matching(key);
        lc::check_found(entry != nullptr, "key");
        return entry->value;
    }

    /// Value stored under `key`, nullptr if there is none
    [[nodiscard]] V* try_get(K const& key)
    {
        auto* entry = _entries.try_get_mutable_matching(key);
        return entry ? &entry->value : nullptr;
    }
    [[nodiscard]] V const* try_get(K const& key) const
    {
        auto const* entry = _entries.try_get_matching(key);
        return entry ? &entry->value : nullptr;
    }

    /// Value stored under `key`, inserting a value-initialized one first if there is none
    [[nodiscard]] V& operator[](K const& key)
    {
        if (auto* value = try_get(key))
            return *value;

        _entries.add(entry_t{key, V()});
        return _entries.try_get_mutable_matching(key)->value;
    }

    // modification
public:
    /// Inserts or overwrites the value under `key`
    void set(K key, V value) { _entries.add(entry_t{lc::move(key), lc::move(value)}); }

    /// Inserts or overwrites an entry
    void add(entry_t entry) { _entries.add(lc::move(entry)); }

    template <class RangeT>
    void add_range(RangeT const& entries)
    {
        for (auto const& e : entries)
            add(e);
    }

    /// Removes the entry under `key`, returns false if there is none
    bool remove(K const& key) { return _entries.remove_matching(key); }

    void clear() { _entries.clear(); }
    void shrink() { _entries.shrink(); }

    // lookup
public:
    [[nodiscard]] bool contains_key(K const& key) const { return _entries.contains_matching(key); }

    /// True if `key` is present and its value compares equal to `value`
    [[nodiscard]] bool contains(K const& key, V const& value) const
    {
        auto const* stored = try_get(key);
        return stored != nullptr && *stored == value;
    }
    [[nodiscard]] bool contains(entry_t const& entry) const { return contains(entry.key, entry.value); }

    // iteration
public:
    [[nodiscard]] auto begin() const { return _entries.begin(); }
    [[nodiscard]] lc::sentinel end() const { return {}; }

    template <class F>
    void for_each(F&& f) const
    {
        _entries.for_each(f);
    }

    template <class F>
    void for_each_key(F&& f) const
    {
        _entries.for_each([&](entry_t const& e) { f(e.key); });
    }

    template <class F>
    void for_each_value(F&& f) const
    {
        _entries.for_each([&](entry_t const& e) { f(e.value); });
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _entries.size(); }
    [[nodiscard]] bool empty() const { return _entries.empty(); }
    [[nodiscard]] isize capacity() const { return _entries.capacity(); }
    [[nodiscard]] f64 load_factor() const { return _entries.load_factor(); }

    // members
private:
    set_t _entries;
};
