#pragma once

#include <large-collections/chunked_storage.hh>
#include <large-collections/config.hh>
#include <large-collections/contract.hh>
#include <large-collections/functors.hh>
#include <large-collections/fwd.hh>
#include <large-collections/large_span.hh>
#include <large-collections/span.hh>

#include <initializer_list>

/// Growable list of up to max_capacity elements.
///
/// Tracks a logical count separate from the capacity of its chunked storage.
/// When an add finds the storage full, the capacity grows by the list's growth_policy
/// (multiplicative for small lists, additive beyond fixed_grow_limit).
/// Slots in [size(), capacity()) always hold value-initialized elements.
///
/// Usage:
///   auto list = lc::large_list<int>();         // capacity 1
///   list.add(3);
///   list.add_range({1, 2});
///   list.remove_at(0);
///   list.shrink();                             // capacity == size
template <class T>
struct lc::large_list
{
    static constexpr isize default_capacity = 1;

    // construction
public:
    large_list() : large_list(default_capacity) {}

    /// Empty list with room for `capacity` elements.
    /// capacity error outside [0, max_capacity], invalid_configuration error for a bad policy.
    explicit large_list(isize capacity, growth_policy policy = {}, memory_resource const* resource = nullptr)
      : _policy(_validated(policy)), _storage(capacity, resource)
    {
    }

    large_list(std::initializer_list<T> values) : large_list(isize(values.size()) > 0 ? isize(values.size()) : default_capacity)
    {
        add_range(span<T const>(values.begin(), values.end()));
    }

    // element access
public:
    /// Precondition: 0 <= index < size(), error_kind::range otherwise.
    [[nodiscard]] T& operator[](isize index)
    {
        lc::check_index(index, _count);
        return _storage[index];
    }
    [[nodiscard]] T const& operator[](isize index) const
    {
        lc::check_index(index, _count);
        return _storage[index];
    }

    [[nodiscard]] T const& get(isize index) const { return (*this)[index]; }
    void set(isize index, T value) { (*this)[index] = lc::move(value); }

    // iterators
public:
    [[nodiscard]] auto begin() { return _storage.iterate(0, _count); }
    [[nodiscard]] auto begin() const { return _storage.iterate(0, _count); }
    [[nodiscard]] lc::sentinel end() const { return {}; }

    // views
public:
    [[nodiscard]] large_span<T> as_span() { return large_span<T>(_storage, 0, _count); }
    [[nodiscard]] large_span<T const> as_span() const { return large_span<T const>(_storage, 0, _count); }

    [[nodiscard]] large_span<T> subspan(isize offset, isize count)
    {
        lc::check_range(offset, count, _count);
        return large_span<T>(_storage, offset, count);
    }
    [[nodiscard]] large_span<T const> subspan(isize offset, isize count) const
    {
        lc::check_range(offset, count, _count);
        return large_span<T const>(_storage, offset, count);
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _count; }
    [[nodiscard]] isize capacity() const { return _storage.size(); }
    [[nodiscard]] bool empty() const { return _count == 0; }
    [[nodiscard]] growth_policy const& policy() const { return _policy; }

    /// Backing storage of capacity() elements, of which [0, size()) are live
    [[nodiscard]] chunked_storage<T>& storage() { return _storage; }
    [[nodiscard]] chunked_storage<T> const& storage() const { return _storage; }

    // modification
public:
    /// Appends `item`, growing the capacity first if the list is full.
    /// capacity error if the list already holds max_capacity elements.
    void add(T item)
    {
        lc::check_count_limit(_count, 1, max_capacity);
        if (_count == _storage.size())
            _grow_to(_count + 1);

        _storage[_count] = lc::move(item);
        ++_count;
    }

    /// Appends all elements of a flat buffer
    void add_range(span<T const> values)
    {
        lc::check_count_limit(_count, values.size(), max_capacity);
        if (values.empty())
            return;

        _grow_to(_count + values.size());
        _storage.copy_from(values, _count);
        _count += values.size();
    }

    /// Appends all elements of an array, a list or a span (this list included)
    void add_range(large_span<T const> const& values)
    {
        lc::check_count_limit(_count, values.size(), max_capacity);
        if (values.empty())
            return;

        // values may view this list; growing keeps [0, _count) in place
        _grow_to(_count + values.size());
        chunked_storage<T>::copy_range(values.storage(), values.offset(), _storage, _count, values.size());
        _count += values.size();
    }

    /// Grows the capacity by repeated application of the growth policy until it holds `capacity` elements
    void ensure_capacity(isize capacity)
    {
        lc::check_capacity(capacity, max_capacity);
        _grow_to(capacity);
    }

    /// Removes the element at `index`, shifting all later elements one slot to the left. O(size() - index).
    void remove_at(isize index)
    {
        lc::check_index(index, _count);

        auto const moved = _count - index - 1;
        if (moved > 0)
            chunked_storage<T>::copy_range(_storage, index + 1, _storage, index, moved);

        // the vacated tail slot must not keep the old value alive
        _storage[_count - 1] = T();
        --_count;
    }

    /// Removes the first element equal to `item`, returns false if there is none
    template <class EqualT = default_equal<T>>
    bool remove(T const& item, EqualT const& equal = EqualT{})
    {
        auto const index = index_of(item, equal);
        if (index < 0)
            return false;
        remove_at(index);
        return true;
    }

    /// Resets all live elements and the count, keeps the capacity
    void clear()
    {
        _storage.fill(0, _count, T());
        _count = 0;
    }

    /// Reduces the capacity to exactly size()
    void shrink() { _storage.resize(_count); }

    // algorithms
public:
    template <class EqualT = default_equal<T>>
    [[nodiscard]] bool contains(T const& item, EqualT const& equal = EqualT{}) const
    {
        return _storage.contains(item, 0, _count, equal);
    }
    template <class EqualT = default_equal<T>>
    [[nodiscard]] bool contains(T const& item, isize offset, isize count, EqualT const& equal = EqualT{}) const
    {
        lc::check_range(offset, count, _count);
        return _storage.contains(item, offset, count, equal);
    }

    template <class EqualT = default_equal<T>>
    [[nodiscard]] isize index_of(T const& item, EqualT const& equal = EqualT{}) const
    {
        return _storage.index_of(item, 0, _count, equal);
    }

    template <class LessT = default_less>
    void sort(LessT const& less = LessT{})
    {
        _storage.sort(0, _count, less);
    }
    template <class LessT = default_less>
    void sort(isize offset, isize count, LessT const& less = LessT{})
    {
        lc::check_range(offset, count, _count);
        _storage.sort(offset, count, less);
    }

    template <class LessT = default_less>
    [[nodiscard]] isize binary_search(T const& item, LessT const& less = LessT{}) const
    {
        return _storage.binary_search(item, 0, _count, less);
    }
    template <class LessT = default_less>
    [[nodiscard]] isize binary_search(T const& item, isize offset, isize count, LessT const& less = LessT{}) const
    {
        lc::check_range(offset, count, _count);
        return _storage.binary_search(item, offset, count, less);
    }

    template <class F>
    void for_each(F&& f)
    {
        _storage.for_each(0, _count, f);
    }
    template <class F>
    void for_each(F&& f) const
    {
        _storage.for_each(0, _count, f);
    }

    void swap(isize i, isize j)
    {
        lc::check_index(i, _count);
        lc::check_index(j, _count);
        _storage.swap(i, j);
    }

    // bulk copy
public:
    /// Copies [offset, offset + target.size()) into the flat buffer `target`
    void copy_to(isize offset, span<T> target) const
    {
        lc::check_range(offset, target.size(), _count);
        _storage.copy_to(offset, target);
    }

    /// Overwrites [offset, offset + source.size()) with `source`, the range must lie within size()
    void copy_from(span<T const> source, isize offset)
    {
        lc::check_range(offset, source.size(), _count);
        _storage.copy_from(source, offset);
    }

    void copy_to(isize offset, large_span<T> const& target) const { subspan(offset, target.size()).copy_to(target); }
    void copy_from(large_span<T const> const& source, isize offset) { source.copy_to(subspan(offset, source.size())); }

    // helper
private:
    static growth_policy const& _validated(growth_policy const& policy)
    {
        policy.validate();
        return policy;
    }

    void _grow_to(isize capacity)
    {
        auto new_capacity = _storage.size();
        if (capacity <= new_capacity)
            return;

        while (new_capacity < capacity)
            new_capacity = _policy.grown_capacity(new_capacity);
        _storage.resize(new_capacity);
    }

    // members
private:
    growth_policy _policy;
    chunked_storage<T> _storage;
    isize _count = 0;
};
