#pragma once

#include <large-collections/fwd.hh>
#include <large-collections/large_array.hh>
#include <large-collections/large_dictionary.hh>
#include <large-collections/large_list.hh>
#include <large-collections/large_set.hh>
#include <large-collections/mutex.hh>

// Thread-safe containers: one mutex per container, held for the full duration of every operation.
// Enumerating inside lock() serializes against all other operations for as long as the enumeration runs.
//
// Usage:
//   lc::concurrent_list<int> list;
//   list.lock([](lc::large_list<int>& l) { l.add(1); });
//   list.lock([](lc::large_list<int> const& l) { for (auto v : l) consume(v); });

namespace lc
{
template <class T>
using concurrent_array = lc::mutex<large_array<T>>;

template <class T>
using concurrent_list = lc::mutex<large_list<T>>;

template <class T, class HashT = default_hash<T>, class EqualT = default_equal<T>>
using concurrent_set = lc::mutex<large_set<T, HashT, EqualT>>;

template <class K, class V, class HashT = default_hash<K>, class EqualT = default_equal<K>>
using concurrent_dictionary = lc::mutex<large_dictionary<K, V, HashT, EqualT>>;
} // namespace lc
