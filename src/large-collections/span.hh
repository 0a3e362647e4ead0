#pragma once

#include <large-collections/contract.hh>
#include <large-collections/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// Used as the flat-buffer interop surface of the chunked containers (copy_to / copy_from / add_range)
/// and to expose a single chunk. For views into chunked containers see lc::large_span.
/// Trivially copyable regardless of T's triviality.
template <class T>
struct lc::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    // keep triviality
    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        LC_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span viewing [begin, end).
    /// Precondition: begin <= end.
    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        LC_ASSERT(begin <= end, "invalid pointer range");
    }

    /// Creates a span from an initializer_list.
    /// Only available when T is const; allows calling list.add_range({1, 2, 3}).
    /// WARNING: Safe ONLY as an immediate function argument, the list dies at the end of the full expression.
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    /// Creates a span viewing the entire C array.
    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Creates a span from any container providing .data() and .size() (e.g. std::vector).
    /// The container must outlive the span.
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    /// span<T> -> span<T const>
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U (*)[], T (*)[]>)
    constexpr span(span<U> const& rhs) : _data(rhs.data()), _size(rhs.size())
    {
    }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size(), error_kind::range otherwise.
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        lc::check_index(i, _size);
        return _data[i];
    }

    /// Returns a pointer to the underlying contiguous storage.
    /// May be nullptr if the span is default-constructed or empty.
    [[nodiscard]] constexpr T* data() const { return _data; }

    /// Returns the view [offset, offset + count).
    [[nodiscard]] constexpr span subspan(isize offset, isize count) const
    {
        lc::check_range(offset, count, _size);
        return span(_data + offset, count);
    }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
