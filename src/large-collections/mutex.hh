#pragma once

#include <large-collections/fwd.hh>
#include <large-collections/utility.hh>

#include <functional>
#include <mutex>

/// Thread-safe wrapper for data T protected by a mutex
/// Rust-style mutex that encapsulates both the data and the mutex protecting it
/// Access to the protected data is only possible through scoped lock operations
template <class T>
struct lc::mutex
{
    /// Acquire lock, invoke function with protected value, and return result
    /// The mutex is held for the duration of the function call, including any enumeration inside f
    /// Returns: The result of invoking f with the protected value (auto to prevent reference leaks)
    /// Usage:
    ///   lc::mutex<lc::large_list<int>> list;
    ///   list.lock([](auto& l) { l.add(1); });
    ///   auto count = list.lock([](auto const& l) { return l.size(); });
    template <class F>
    auto lock(F&& f)
    {
        std::lock_guard lock(_mutex);
        return std::invoke(lc::forward<F>(f), _value);
    }

    /// Default constructor - default-constructs the protected value
    mutex() = default;

    /// Construct with initial value
    template <class... Args>
    explicit mutex(Args&&... args) : _value(lc::forward<Args>(args)...)
    {
    }

private:
    T _value;
    std::mutex _mutex;
};
