#pragma once

#include <large-collections/assert-handler.hh>

#include <large-collections/fwd.hh>

#include <initializer_list>
#include <string>
#include <vector>

// Shared test helpers.
//
// Contract violations are observed through a throwing assertion handler, so a test can check the
// reported error_kind instead of aborting:
//   CHECK(lc_test::raises(lc::error_kind::range, [&] { (void)list[5]; }));
//
// Container contents are compared element-wise against a literal list:
//   CHECK(lc_test::equals(list, {1, 2, 3}));
//
// Sort and search tests fill containers from scrambled_values(size, duplicates).

namespace lc_test
{
struct raised_violation
{
    lc::error_kind kind;
    std::string message;
};

/// Runs f with a throwing handler. Returns true if f reported a violation, and stores it in `out`.
template <class F>
bool capture_violation(F&& f, raised_violation& out)
{
    auto handler = lc::impl::scoped_assertion_handler([](lc::impl::assertion_info const& info)
                                                      { throw raised_violation{info.kind, info.message}; });
    try
    {
        f();
    }
    catch (raised_violation const& v)
    {
        out = v;
        return true;
    }
    return false;
}

/// True if f reports a violation of exactly `kind`
template <class F>
bool raises(lc::error_kind kind, F&& f)
{
    raised_violation v{lc::error_kind::assertion, {}};
    return capture_violation(f, v) && v.kind == kind;
}

/// True if f reports any violation
template <class F>
bool raises_any(F&& f)
{
    raised_violation v{lc::error_kind::assertion, {}};
    return capture_violation(f, v);
}

/// Message of the violation reported by f, empty if there was none
template <class F>
std::string violation_message(F&& f)
{
    raised_violation v{lc::error_kind::assertion, {}};
    capture_violation(f, v);
    return v.message;
}

/// True if iterating `range` yields exactly the elements of `expected`
template <class RangeT, class T>
bool equals(RangeT const& range, std::initializer_list<T> expected)
{
    auto it = expected.begin();
    for (auto const& v : range)
    {
        if (it == expected.end() || !(v == *it))
            return false;
        ++it;
    }
    return it == expected.end();
}

/// `size` scrambled even numbers in [0, 2 * size + 4].
/// Without duplicates all values are distinct, with duplicates a value repeats up to three times.
/// Odd numbers never occur, so they are safe probes for absent values.
inline std::vector<int> scrambled_values(lc::isize size, bool duplicates)
{
    // 37 is coprime to size + 3 for every size used in the tests, so the residues are distinct
    auto const modulus = size + 3;

    std::vector<int> values;
    for (lc::isize i = 0; i < size; ++i)
    {
        auto const r = int((i * 37 + 11) % modulus);
        values.push_back(2 * (duplicates ? r / 3 : r));
    }
    return values;
}
} // namespace lc_test
