#pragma once

#include <large-collections/fwd.hh>
#include <large-collections/utility.hh>

#include <type_traits>
#include <utility>

/// Key/value pair stored by large_dictionary
/// Aggregate type with no user-defined constructors
/// Supports structured bindings: auto const& [key, value] = pair;
template <class K, class V>
struct lc::pair
{
    using key_t = K;
    using value_t = V;

    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;

    K key;
    V value;

    template <std::size_t I, class P>
    [[nodiscard]] friend constexpr decltype(auto) get(P&& p) noexcept
        requires(std::is_same_v<std::remove_cvref_t<P>, pair> && I < 2)
    {
        if constexpr (I == 0)
            return (lc::forward<P>(p).key);
        else
            return (lc::forward<P>(p).value);
    }
};

namespace std
{
template <class K, class V>
struct tuple_size<lc::pair<K, V>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class K, class V>
struct tuple_element<I, lc::pair<K, V>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, K, V>;
};
} // namespace std
