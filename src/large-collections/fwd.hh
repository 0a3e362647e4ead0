#pragma once

#include <cstddef>
#include <cstdint>


namespace lc
{

//
// Primitives
//

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, counts, offsets and logical indices are all i64.
// Negative values double as sentinels (e.g. binary_search returns -1 when absent).
// The largest addressable capacity (max_chunk_size^2, see config.hh) stays well below 2^63.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;

//
// Configuration
//

struct growth_policy;
struct load_factor_policy;

//
// Views
//

template <class T>
struct span;
template <class T>
struct large_span;

//
// Containers
//

template <class K, class V>
struct pair;

template <class T>
struct chunked_storage;

template <class T>
struct large_array;
template <class T>
struct large_list;

template <class T>
struct default_hash;
template <class T>
struct default_equal;
struct default_less;

template <class T, class HashT = default_hash<T>, class EqualT = default_equal<T>>
struct large_set;
template <class K, class V, class HashT = default_hash<K>, class EqualT = default_equal<K>>
struct large_dictionary;

//
// Synchronization
//

template <class T>
struct mutex;

} // namespace lc
