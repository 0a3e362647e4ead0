#pragma once

#include <large-collections/allocation.hh>
#include <large-collections/config.hh>
#include <large-collections/contract.hh>
#include <large-collections/functors.hh>
#include <large-collections/fwd.hh>
#include <large-collections/span.hh>
#include <large-collections/utility.hh>

#include <type_traits>

// lc::chunked_storage<T> is the addressing engine below every large container.
//
// Elements live in an ordered table of chunks. Every chunk holds exactly max_chunk_size elements,
// except the last one, which holds the remainder. A capacity of 0 has no chunks at all and there is
// never an empty trailing chunk:
//
//   capacity 25, max_chunk_size 10  ->  chunks of 10, 10, 5
//   logical index 23                ->  chunk 23 / 10 = 2, offset 23 % 10 = 3
//
// Range algorithms (copy, fill, search, for_each) walk the range chunk by chunk and run a tight loop
// over each contiguous segment. Sort and binary search address elements individually.
//
// All ranges are (offset, count) pairs; every public operation validates them with lc::check_range.

namespace lc
{
/// Physical position of a logical index
struct chunk_position
{
    isize chunk = 0;
    isize offset = 0;

    constexpr bool operator==(chunk_position const&) const = default;
};

/// Translates a logical index into its chunk position. Pure arithmetic, no bounds check.
[[nodiscard]] constexpr chunk_position locate(isize index)
{
    return {index / max_chunk_size, index % max_chunk_size};
}

/// Number of chunks holding `capacity` elements (0 for capacity 0)
[[nodiscard]] constexpr isize chunk_count_for(isize capacity)
{
    return capacity == 0 ? 0 : lc::int_div_round_up(capacity, max_chunk_size);
}

/// Width of chunk `chunk_index` in a storage of `capacity` elements
[[nodiscard]] constexpr isize chunk_width_for(isize chunk_index, isize capacity)
{
    auto const rest = capacity - chunk_index * max_chunk_size;
    return rest < max_chunk_size ? rest : max_chunk_size;
}
} // namespace lc

namespace lc::impl
{
/// Forward iterator over a logical range of a chunked storage.
/// T is the (possibly const) element type. Compares against lc::sentinel.
template <class T>
struct chunked_iterator
{
    using chunk_t = allocation<std::remove_const_t<T>>;

    chunk_t const* chunk = nullptr;
    T* pos = nullptr;
    T* chunk_end = nullptr;
    isize remaining = 0;

    [[nodiscard]] T& operator*() const { return *pos; }
    [[nodiscard]] T* operator->() const { return pos; }

    chunked_iterator& operator++()
    {
        --remaining;
        if (++pos == chunk_end && remaining > 0)
        {
            ++chunk;
            pos = chunk->obj_start;
            chunk_end = chunk->obj_end;
        }
        return *this;
    }

    [[nodiscard]] bool operator==(lc::sentinel) const { return remaining == 0; }
    [[nodiscard]] bool operator!=(lc::sentinel) const { return remaining != 0; }
};
} // namespace lc::impl

template <class T>
struct lc::chunked_storage
{
    static_assert(std::is_default_constructible_v<T>, "elements are value-initialized and must be default constructible");
    static_assert(std::is_copy_assignable_v<T>, "range copies assign elements");

    using iterator = impl::chunked_iterator<T>;
    using const_iterator = impl::chunked_iterator<T const>;

    // construction
public:
    chunked_storage() = default;

    /// Creates `capacity` value-initialized elements.
    /// capacity must be in [0, max_capacity], error_kind::capacity otherwise.
    /// All chunks (and the chunk table) are allocated from `resource` (nullptr: default resource).
    explicit chunked_storage(isize capacity, memory_resource const* resource = nullptr) : _resource(resource)
    {
        resize(capacity);
    }

    chunked_storage(chunked_storage const& rhs) : _resource(rhs._resource) { _copy_chunks_from(rhs); }

    chunked_storage& operator=(chunked_storage const& rhs)
    {
        if (this != &rhs)
        {
            _resource = rhs._resource;
            _copy_chunks_from(rhs);
        }
        return *this;
    }

    chunked_storage(chunked_storage&& rhs) noexcept
      : _chunks(lc::move(rhs._chunks)), _size(lc::exchange(rhs._size, 0)), _resource(rhs._resource)
    {
    }

    chunked_storage& operator=(chunked_storage&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _chunks = lc::move(rhs._chunks);
            _size = lc::exchange(rhs._size, 0);
            _resource = rhs._resource;
        }
        return *this;
    }

    ~chunked_storage() = default;

    /// Changes the capacity to `capacity`, preserving the values at [0, min(old, new)).
    /// New slots are value-initialized.
    /// Leading chunks that keep their width are moved into the new chunk table without touching
    /// their elements; only the old and new last chunks are reallocated.
    void resize(isize capacity)
    {
        lc::check_capacity(capacity, max_capacity);
        if (capacity == _size)
            return;

        auto const old_count = chunk_count();
        auto const new_count = lc::chunk_count_for(capacity);

        isize kept = 0;
        while (kept < old_count && kept < new_count && _chunks.obj_start[kept].size() == lc::chunk_width_for(kept, capacity))
            ++kept;

        // everything that can throw happens before *this is modified
        auto tail = allocation<allocation<T>>::create_empty(new_count - kept, _resource);
        for (isize i = kept; i < new_count; ++i)
        {
            auto const width = lc::chunk_width_for(i, capacity);
            if (i < old_count)
            {
                auto& old_chunk = _chunks.obj_start[i];
                new (lc::placement_new, tail.obj_end)
                    allocation<T>(allocation<T>::create_moved_from(old_chunk, lc::min(old_chunk.size(), width), width, _resource));
            }
            else
            {
                new (lc::placement_new, tail.obj_end) allocation<T>(allocation<T>::create_defaulted(width, _resource));
            }
            ++tail.obj_end;
        }

        auto table = allocation<allocation<T>>::create_empty(new_count, _resource);
        impl::move_create_objects_to(table.obj_end, _chunks.obj_start, _chunks.obj_start + kept);
        impl::move_create_objects_to(table.obj_end, tail.obj_start, tail.obj_end);

        _chunks = lc::move(table);
        _size = capacity;
    }

    // element access
public:
    /// Precondition: 0 <= index < size(), error_kind::range otherwise.
    [[nodiscard]] T& operator[](isize index)
    {
        lc::check_index(index, _size);
        return _at(index);
    }
    [[nodiscard]] T const& operator[](isize index) const
    {
        lc::check_index(index, _size);
        return _at(index);
    }

    [[nodiscard]] T const& get(isize index) const { return (*this)[index]; }

    void set(isize index, T value) { (*this)[index] = lc::move(value); }

    /// Contiguous elements of one chunk
    [[nodiscard]] span<T> chunk(isize chunk_index)
    {
        lc::check_index(chunk_index, chunk_count());
        return _chunks.obj_start[chunk_index].obj_span();
    }
    [[nodiscard]] span<T const> chunk(isize chunk_index) const
    {
        lc::check_index(chunk_index, chunk_count());
        return _chunks.obj_start[chunk_index].obj_span();
    }

    // iterators
public:
    /// Iterates [offset, offset + count) in index order
    [[nodiscard]] iterator iterate(isize offset, isize count)
    {
        lc::check_range(offset, count, _size);
        if (count == 0)
            return {};
        auto const p = lc::locate(offset);
        auto const* c = _chunks.obj_start + p.chunk;
        return {c, c->obj_start + p.offset, c->obj_end, count};
    }
    [[nodiscard]] const_iterator iterate(isize offset, isize count) const
    {
        lc::check_range(offset, count, _size);
        if (count == 0)
            return {};
        auto const p = lc::locate(offset);
        auto const* c = _chunks.obj_start + p.chunk;
        return {c, c->obj_start + p.offset, c->obj_end, count};
    }

    [[nodiscard]] iterator begin() { return iterate(0, _size); }
    [[nodiscard]] const_iterator begin() const { return iterate(0, _size); }
    [[nodiscard]] lc::sentinel end() const { return {}; }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }
    [[nodiscard]] isize chunk_count() const { return _chunks.size(); }
    [[nodiscard]] isize chunk_size(isize chunk_index) const { return chunk(chunk_index).size(); }

    /// Resource used for new chunks, nullptr for the default resource
    [[nodiscard]] memory_resource const* resource() const { return _resource; }

    // range algorithms
public:
    /// Calls f(T*, isize n) once per chunk-contiguous segment of [offset, offset + count)
    template <class F>
    void for_each_segment(isize offset, isize count, F&& f)
    {
        lc::check_range(offset, count, _size);
        while (count > 0)
        {
            auto const p = lc::locate(offset);
            auto& c = _chunks.obj_start[p.chunk];
            auto const n = lc::min(c.size() - p.offset, count);
            f(c.obj_start + p.offset, n);
            offset += n;
            count -= n;
        }
    }
    template <class F>
    void for_each_segment(isize offset, isize count, F&& f) const
    {
        lc::check_range(offset, count, _size);
        while (count > 0)
        {
            auto const p = lc::locate(offset);
            auto const& c = _chunks.obj_start[p.chunk];
            auto const n = lc::min(c.size() - p.offset, count);
            f(static_cast<T const*>(c.obj_start + p.offset), n);
            offset += n;
            count -= n;
        }
    }

    /// Calls f(T&) for every element of [offset, offset + count) in index order
    template <class F>
    void for_each(isize offset, isize count, F&& f)
    {
        for_each_segment(offset, count,
                         [&](T* p, isize n)
                         {
                             for (isize i = 0; i < n; ++i)
                                 f(p[i]);
                         });
    }
    template <class F>
    void for_each(isize offset, isize count, F&& f) const
    {
        for_each_segment(offset, count,
                         [&](T const* p, isize n)
                         {
                             for (isize i = 0; i < n; ++i)
                                 f(p[i]);
                         });
    }

    /// Assigns `value` to every element of [offset, offset + count)
    void fill(isize offset, isize count, T const& value)
    {
        for_each_segment(offset, count,
                         [&](T* p, isize n)
                         {
                             for (isize i = 0; i < n; ++i)
                                 p[i] = value;
                         });
    }

    /// Index of the first element of [offset, offset + count) equal to `item`, or -1
    template <class EqualT = default_equal<T>>
    [[nodiscard]] isize index_of(T const& item, isize offset, isize count, EqualT const& equal = EqualT{}) const
    {
        lc::check_range(offset, count, _size);
        auto const end = offset + count;
        while (offset < end)
        {
            auto const p = lc::locate(offset);
            auto const& c = _chunks.obj_start[p.chunk];
            auto const n = lc::min(c.size() - p.offset, end - offset);
            T const* values = c.obj_start + p.offset;
            for (isize i = 0; i < n; ++i)
                if (equal(values[i], item))
                    return offset + i;
            offset += n;
        }
        return -1;
    }

    template <class EqualT = default_equal<T>>
    [[nodiscard]] bool contains(T const& item, isize offset, isize count, EqualT const& equal = EqualT{}) const
    {
        return index_of(item, offset, count, equal) >= 0;
    }

    void swap(isize i, isize j)
    {
        lc::check_index(i, _size);
        lc::check_index(j, _size);
        lc::swap(_at(i), _at(j));
    }

    /// In-place heap sort of [offset, offset + count) by `less`.
    /// O(n log n), no additional memory, not stable.
    template <class LessT = default_less>
    void sort(isize offset, isize count, LessT const& less = LessT{})
    {
        lc::check_range(offset, count, _size);
        if (count < 2)
            return;

        auto const left = offset;
        auto const right = offset + count - 1;

        // build max-heap bottom up, starting at the last inner node
        for (auto i = left + count / 2 - 1; i >= left; --i)
            _sift_down(i, left, right, less);

        // move the current maximum behind the heap and restore the heap on the rest
        for (auto last = right; last > left; --last)
        {
            lc::swap(_at(left), _at(last));
            _sift_down(left, left, last - 1, less);
        }
    }

    /// Index of an element of [offset, offset + count) equivalent to `item`, or -1.
    /// Precondition: the range is sorted ascending by `less` (not checked).
    template <class LessT = default_less>
    [[nodiscard]] isize binary_search(T const& item, isize offset, isize count, LessT const& less = LessT{}) const
    {
        lc::check_range(offset, count, _size);

        auto lo = offset;
        auto hi = offset + count - 1;
        while (lo <= hi)
        {
            auto const mid = lo + (hi - lo) / 2;
            auto const& value = _at(mid);
            if (less(value, item))
                lo = mid + 1;
            else if (less(item, value))
                hi = mid - 1;
            else
                return mid;
        }
        return -1;
    }

    // bulk copy
public:
    /// Copies [offset, offset + target.size()) into the flat buffer `target`
    void copy_to(isize offset, span<T> target) const
    {
        T* out = target.data();
        for_each_segment(offset, target.size(),
                         [&](T const* p, isize n)
                         {
                             for (isize i = 0; i < n; ++i)
                                 out[i] = p[i];
                             out += n;
                         });
    }

    /// Copies the flat buffer `source` to [offset, offset + source.size())
    void copy_from(span<T const> source, isize offset)
    {
        T const* in = source.data();
        for_each_segment(offset, source.size(),
                         [&](T* p, isize n)
                         {
                             for (isize i = 0; i < n; ++i)
                                 p[i] = in[i];
                             in += n;
                         });
    }

    /// Copies count elements from source[source_offset..] to target[target_offset..].
    /// Every step copies min(rest of source chunk, rest of target chunk, rest of count) elements.
    /// source and target may be the same storage with overlapping ranges.
    static void copy_range(chunked_storage const& source, isize source_offset, chunked_storage& target, isize target_offset, isize count)
    {
        lc::check_range(source_offset, count, source._size);
        lc::check_range(target_offset, count, target._size);

        auto const overlaps_forward
            = &source == &target && source_offset < target_offset && target_offset < source_offset + count;

        if (!overlaps_forward)
        {
            while (count > 0)
            {
                auto const s = lc::locate(source_offset);
                auto const t = lc::locate(target_offset);
                auto const& s_chunk = source._chunks.obj_start[s.chunk];
                auto const& t_chunk = target._chunks.obj_start[t.chunk];
                auto const n = lc::min(lc::min(s_chunk.size() - s.offset, t_chunk.size() - t.offset), count);

                T const* in = s_chunk.obj_start + s.offset;
                T* out = t_chunk.obj_start + t.offset;
                for (isize i = 0; i < n; ++i)
                    out[i] = in[i];

                source_offset += n;
                target_offset += n;
                count -= n;
            }
        }
        else
        {
            // copy back to front so no source element is overwritten before it is read
            auto source_end = source_offset + count;
            auto target_end = target_offset + count;
            while (count > 0)
            {
                auto const s = lc::locate(source_end - 1);
                auto const t = lc::locate(target_end - 1);
                auto const n = lc::min(lc::min(s.offset + 1, t.offset + 1), count);

                T const* in = source._chunks.obj_start[s.chunk].obj_start + s.offset;
                T* out = target._chunks.obj_start[t.chunk].obj_start + t.offset;
                for (isize i = 0; i < n; ++i)
                    out[-i] = in[-i];

                source_end -= n;
                target_end -= n;
                count -= n;
            }
        }
    }

    // helper
private:
    [[nodiscard]] T& _at(isize index)
    {
        auto const p = lc::locate(index);
        return _chunks.obj_start[p.chunk].obj_start[p.offset];
    }
    [[nodiscard]] T const& _at(isize index) const
    {
        auto const p = lc::locate(index);
        return _chunks.obj_start[p.chunk].obj_start[p.offset];
    }

    template <class LessT>
    void _sift_down(isize i, isize left, isize right, LessT const& less)
    {
        while (true)
        {
            auto largest = i;
            auto const l = left + 2 * (i - left) + 1;
            auto const r = l + 1;
            if (l <= right && less(_at(largest), _at(l)))
                largest = l;
            if (r <= right && less(_at(largest), _at(r)))
                largest = r;
            if (largest == i)
                return;
            lc::swap(_at(i), _at(largest));
            i = largest;
        }
    }

    void _copy_chunks_from(chunked_storage const& rhs)
    {
        auto table = allocation<allocation<T>>::create_empty(rhs.chunk_count(), _resource);
        for (auto const& c : rhs._chunks.obj_span())
        {
            new (lc::placement_new, table.obj_end) allocation<T>(allocation<T>::create_copy_of(span<T const>(c.obj_start, c.obj_end), _resource));
            ++table.obj_end;
        }
        _chunks = lc::move(table);
        _size = rhs._size;
    }

    // members
private:
    allocation<allocation<T>> _chunks;
    isize _size = 0;
    memory_resource const* _resource = nullptr;
};
