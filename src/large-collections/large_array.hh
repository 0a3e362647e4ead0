#pragma once

#include <large-collections/chunked_storage.hh>
#include <large-collections/contract.hh>
#include <large-collections/functors.hh>
#include <large-collections/fwd.hh>
#include <large-collections/large_span.hh>
#include <large-collections/span.hh>

#include <initializer_list>

/// Fixed-size indexed array of up to max_capacity elements.
/// size() == capacity() at all times; elements are value-initialized on construction and on resize.
///
/// Usage:
///   auto values = lc::large_array<int>(25);   // 3 chunks at max_chunk_size 10
///   values[23] = 7;
///   values.sort();
///   auto idx = values.binary_search(7);
template <class T>
struct lc::large_array
{
    // construction
public:
    large_array() = default;

    /// `size` value-initialized elements, capacity error outside [0, max_capacity]
    explicit large_array(isize size, memory_resource const* resource = nullptr) : _storage(size, resource) {}

    large_array(std::initializer_list<T> values) : _storage(isize(values.size()))
    {
        _storage.copy_from(span<T const>(values.begin(), values.end()), 0);
    }

    [[nodiscard]] static large_array create_copy_of(span<T const> values, memory_resource const* resource = nullptr)
    {
        auto result = large_array(values.size(), resource);
        result._storage.copy_from(values, 0);
        return result;
    }

    [[nodiscard]] static large_array create_filled(isize size, T const& value, memory_resource const* resource = nullptr)
    {
        auto result = large_array(size, resource);
        result._storage.fill(0, size, value);
        return result;
    }

    /// Keeps [0, min(size(), new_size)), value-initializes the rest
    void resize(isize new_size) { _storage.resize(new_size); }

    // element access
public:
    [[nodiscard]] T& operator[](isize index) { return _storage[index]; }
    [[nodiscard]] T const& operator[](isize index) const { return _storage[index]; }

    [[nodiscard]] T const& get(isize index) const { return _storage[index]; }
    void set(isize index, T value) { _storage.set(index, lc::move(value)); }

    // iterators
public:
    [[nodiscard]] auto begin() { return _storage.begin(); }
    [[nodiscard]] auto begin() const { return _storage.begin(); }
    [[nodiscard]] lc::sentinel end() const { return {}; }

    // views
public:
    [[nodiscard]] large_span<T> as_span() { return large_span<T>(_storage, 0, size()); }
    [[nodiscard]] large_span<T const> as_span() const { return large_span<T const>(_storage, 0, size()); }

    [[nodiscard]] large_span<T> subspan(isize offset, isize count) { return large_span<T>(_storage, offset, count); }
    [[nodiscard]] large_span<T const> subspan(isize offset, isize count) const
    {
        return large_span<T const>(_storage, offset, count);
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _storage.size(); }
    [[nodiscard]] isize capacity() const { return _storage.size(); }
    [[nodiscard]] bool empty() const { return _storage.empty(); }

    [[nodiscard]] chunked_storage<T>& storage() { return _storage; }
    [[nodiscard]] chunked_storage<T> const& storage() const { return _storage; }

    // algorithms
public:
    template <class EqualT = default_equal<T>>
    [[nodiscard]] bool contains(T const& item, EqualT const& equal = EqualT{}) const
    {
        return _storage.contains(item, 0, size(), equal);
    }
    template <class EqualT = default_equal<T>>
    [[nodiscard]] bool contains(T const& item, isize offset, isize count, EqualT const& equal = EqualT{}) const
    {
        return _storage.contains(item, offset, count, equal);
    }

    template <class EqualT = default_equal<T>>
    [[nodiscard]] isize index_of(T const& item, EqualT const& equal = EqualT{}) const
    {
        return _storage.index_of(item, 0, size(), equal);
    }

    template <class LessT = default_less>
    void sort(LessT const& less = LessT{})
    {
        _storage.sort(0, size(), less);
    }
    template <class LessT = default_less>
    void sort(isize offset, isize count, LessT const& less = LessT{})
    {
        _storage.sort(offset, count, less);
    }

    /// Index of an element equivalent to `item` or -1; the array must be sorted by `less`
    template <class LessT = default_less>
    [[nodiscard]] isize binary_search(T const& item, LessT const& less = LessT{}) const
    {
        return _storage.binary_search(item, 0, size(), less);
    }
    template <class LessT = default_less>
    [[nodiscard]] isize binary_search(T const& item, isize offset, isize count, LessT const& less = LessT{}) const
    {
        return _storage.binary_search(item, offset, count, less);
    }

    template <class F>
    void for_each(F&& f)
    {
        _storage.for_each(0, size(), f);
    }
    template <class F>
    void for_each(F&& f) const
    {
        _storage.for_each(0, size(), f);
    }
    template <class F>
    void for_each(isize offset, isize count, F&& f)
    {
        _storage.for_each(offset, count, f);
    }

    void swap(isize i, isize j) { _storage.swap(i, j); }
    void fill(T const& value) { _storage.fill(0, size(), value); }

    // bulk copy
public:
    /// Copies [offset, offset + target.size()) into the flat buffer `target`
    void copy_to(isize offset, span<T> target) const { _storage.copy_to(offset, target); }

    /// Copies `source` to [offset, offset + source.size())
    void copy_from(span<T const> source, isize offset) { _storage.copy_from(source, offset); }

    /// Copies [offset, offset + target.size()) into another array, list or span
    void copy_to(isize offset, large_span<T> const& target) const { subspan(offset, target.size()).copy_to(target); }

    /// Copies `source` to [offset, offset + source.size())
    void copy_from(large_span<T const> const& source, isize offset) { source.copy_to(subspan(offset, source.size())); }

    // members
private:
    chunked_storage<T> _storage;
};
