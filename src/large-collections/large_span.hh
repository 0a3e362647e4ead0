#pragma once

#include <large-collections/chunked_storage.hh>
#include <large-collections/contract.hh>
#include <large-collections/functors.hh>
#include <large-collections/fwd.hh>
#include <large-collections/span.hh>

#include <concepts>
#include <type_traits>

namespace lc::impl
{
template <class T>
constexpr bool is_large_span = false;
template <class T>
constexpr bool is_large_span<large_span<T>> = true;

/// large_array and large_list: expose their chunked storage and a live element count
template <class ContainerT, class StorageT>
concept storage_backed = !is_large_span<std::remove_const_t<ContainerT>> && requires(ContainerT& c) {
    { c.storage() } -> std::convertible_to<StorageT&>;
    { c.size() } -> std::convertible_to<isize>;
};
} // namespace lc::impl

/// Non-owning window [offset, offset + size) over the chunked storage of a large container.
///
/// large_span<T const> is read-only, large_span<T> additionally allows set, swap, fill, sort and copy_from.
/// A mutable span converts implicitly to a read-only one.
///
/// A span over a span never nests: subspan() and the folding constructor translate the window
/// into one (storage, offset, size) triple over the original storage.
///
/// The span stores a pointer to the container's storage object. Resizing the container keeps the span
/// valid as long as the window stays inside the container; destroying or moving the container does not.
/// A span over a large_list is bounded by the list count at construction time.
template <class T>
struct lc::large_span
{
    using element_t = std::remove_const_t<T>;
    using storage_t = std::conditional_t<std::is_const_v<T>, chunked_storage<element_t> const, chunked_storage<element_t>>;
    using iterator = impl::chunked_iterator<T>;

    // construction
public:
    large_span() = default;

    /// Window [offset, offset + size) over the whole storage (capacity, not list count)
    large_span(storage_t& storage, isize offset, isize size) : _storage(&storage), _offset(offset), _size(size)
    {
        lc::check_range(offset, size, storage.size());
    }

    /// Window [offset, offset + size) over the live elements of a large_array or large_list
    template <class ContainerT>
        requires impl::storage_backed<ContainerT, storage_t>
    large_span(ContainerT& container, isize offset, isize size)
      : _storage(&container.storage()), _offset(offset), _size(size)
    {
        lc::check_range(offset, size, container.size());
    }

    /// Window over all live elements of a large_array or large_list
    template <class ContainerT>
        requires impl::storage_backed<ContainerT, storage_t>
    explicit large_span(ContainerT& container) : _storage(&container.storage()), _offset(0), _size(container.size())
    {
    }

    /// Window [offset, offset + size) relative to `source`, folded onto source's storage
    large_span(large_span const& source, isize offset, isize size)
      : _storage(source._storage), _offset(source._offset + offset), _size(size)
    {
        lc::check_range(offset, size, source._size);
    }

    /// large_span<T> -> large_span<T const>
    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<U const, T> && !std::is_same_v<U, T>)
    large_span(large_span<U> const& rhs) : _storage(rhs._storage), _offset(rhs._offset), _size(rhs._size)
    {
    }

    [[nodiscard]] large_span subspan(isize offset, isize size) const { return large_span(*this, offset, size); }

    // element access
public:
    /// Precondition: 0 <= index < size(), error_kind::range otherwise.
    [[nodiscard]] T& operator[](isize index) const
    {
        lc::check_index(index, _size);
        return (*_storage)[_offset + index];
    }

    [[nodiscard]] element_t const& get(isize index) const { return (*this)[index]; }

    void set(isize index, element_t value) const
        requires(!std::is_const_v<T>)
    {
        (*this)[index] = lc::move(value);
    }

    // iterators
public:
    [[nodiscard]] iterator begin() const
    {
        if (_size == 0)
            return {};
        return _storage->iterate(_offset, _size);
    }
    [[nodiscard]] lc::sentinel end() const { return {}; }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// Offset of the window inside the original storage
    [[nodiscard]] isize offset() const { return _offset; }

    /// The original storage, never another span
    [[nodiscard]] storage_t& storage() const { return *_storage; }

    // algorithms
public:
    template <class F>
    void for_each(F&& f) const
    {
        if (_size > 0)
            _storage->for_each(_offset, _size, f);
    }

    /// Index relative to the span of the first element equal to `item`, or -1
    template <class EqualT = default_equal<element_t>>
    [[nodiscard]] isize index_of(element_t const& item, EqualT const& equal = EqualT{}) const
    {
        if (_size == 0)
            return -1;
        auto const index = _storage->index_of(item, _offset, _size, equal);
        return index < 0 ? -1 : index - _offset;
    }

    template <class EqualT = default_equal<element_t>>
    [[nodiscard]] bool contains(element_t const& item, EqualT const& equal = EqualT{}) const
    {
        return index_of(item, equal) >= 0;
    }

    /// Index relative to the span, or -1. Precondition: the span is sorted ascending by `less`.
    template <class LessT = default_less>
    [[nodiscard]] isize binary_search(element_t const& item, LessT const& less = LessT{}) const
    {
        if (_size == 0)
            return -1;
        auto const index = _storage->binary_search(item, _offset, _size, less);
        return index < 0 ? -1 : index - _offset;
    }

    template <class LessT = default_less>
    void sort(LessT const& less = LessT{}) const
        requires(!std::is_const_v<T>)
    {
        if (_size > 0)
            _storage->sort(_offset, _size, less);
    }

    void swap(isize i, isize j) const
        requires(!std::is_const_v<T>)
    {
        lc::check_index(i, _size);
        lc::check_index(j, _size);
        _storage->swap(_offset + i, _offset + j);
    }

    void fill(element_t const& value) const
        requires(!std::is_const_v<T>)
    {
        if (_size > 0)
            _storage->fill(_offset, _size, value);
    }

    // bulk copy
public:
    /// Copies all elements into the first size() elements of `target`
    void copy_to(large_span<element_t> const& target) const
    {
        lc::check_range(0, _size, target.size());
        if (_size > 0)
            chunked_storage<element_t>::copy_range(*_storage, _offset, target.storage(), target.offset(), _size);
    }

    /// Copies all elements into the first size() elements of the flat buffer `target`
    void copy_to(span<element_t> target) const
    {
        lc::check_range(0, _size, target.size());
        if (_size > 0)
            _storage->copy_to(_offset, target.subspan(0, _size));
    }

    /// Copies the flat buffer `source` to the start of this span
    void copy_from(span<element_t const> source) const
        requires(!std::is_const_v<T>)
    {
        lc::check_range(0, source.size(), _size);
        if (source.size() > 0)
            _storage->copy_from(source, _offset);
    }

    // members
private:
    template <class>
    friend struct lc::large_span;

    storage_t* _storage = nullptr;
    isize _offset = 0;
    isize _size = 0;
};
