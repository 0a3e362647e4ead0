#include <large-collections/span.hh>
#include <large-collections/utility.hh>

#include <nexus/test.hh>

#include "helpers.hh"

#include <type_traits>
#include <vector>

// static assertions for triviality
static_assert(std::is_trivially_copyable_v<lc::span<int>>, "span should be trivially copyable");

// verify triviality even with non-trivial element type
namespace
{
struct non_trivial
{
    int value = 0;
    ~non_trivial() {} // makes it non-trivial
};
} // namespace

static_assert(std::is_trivially_copyable_v<lc::span<non_trivial>>,
              "span should be trivially copyable even with non-trivial T");

TEST("span - construction")
{
    SECTION("default construction")
    {
        auto const s = lc::span<int>{};
        CHECK(s.data() == nullptr);
        CHECK(s.size() == 0);
        CHECK(s.empty());
    }

    SECTION("pointer + size construction")
    {
        int data[] = {1, 2, 3, 4, 5};
        auto const s = lc::span<int>{data, 5};
        CHECK(s.data() == data);
        CHECK(s.size() == 5);
        CHECK(!s.empty());
    }

    SECTION("two pointer construction")
    {
        int data[] = {1, 2, 3, 4, 5};
        auto const s = lc::span<int>{data, data + 5};
        CHECK(s.data() == data);
        CHECK(s.size() == 5);
    }

    SECTION("container construction")
    {
        auto vec = std::vector<int>{1, 2, 3, 4, 5};
        auto const s = lc::span<int>{vec};
        CHECK(s.data() == vec.data());
        CHECK(s.size() == 5);
        CHECK(s[4] == 5);

        auto const& const_vec = vec;
        auto const cs = lc::span<int const>{const_vec};
        CHECK(cs.data() == vec.data());
    }

    SECTION("C array construction")
    {
        int const data[] = {10, 20, 30};
        auto const s = lc::span<int const>{data};
        CHECK(s.data() == data);
        CHECK(s.size() == 3);
        CHECK(s[2] == 30);
    }

    SECTION("mutable to const conversion")
    {
        int data[] = {1, 2, 3};
        auto const s = lc::span<int>{data, 3};
        lc::span<int const> const cs = s;
        CHECK(cs.data() == data);
        CHECK(cs.size() == 3);

        static_assert(!std::is_convertible_v<lc::span<int const>, lc::span<int>>);
    }
}

TEST("span - element access")
{
    int data[] = {10, 20, 30, 40, 50};
    auto const s = lc::span<int>{data, 5};

    CHECK(s[0] == 10);
    CHECK(s[4] == 50);

    s[2] = 99;
    CHECK(data[2] == 99);

    CHECK(lc_test::raises(lc::error_kind::range, [&] { (void)s[5]; }));
    CHECK(lc_test::raises(lc::error_kind::range, [&] { (void)s[-1]; }));
}

TEST("span - subspan")
{
    int data[] = {1, 2, 3, 4, 5, 6};
    auto const s = lc::span<int>{data, 6};

    auto const mid = s.subspan(2, 3);
    CHECK(mid.data() == data + 2);
    CHECK(lc_test::equals(mid, {3, 4, 5}));

    CHECK(s.subspan(6, 0).empty());
    CHECK(lc_test::raises(lc::error_kind::range, [&] { (void)s.subspan(4, 3); }));
    CHECK(lc_test::raises(lc::error_kind::range, [&] { (void)s.subspan(-1, 1); }));
    CHECK(lc_test::raises(lc::error_kind::range, [&] { (void)s.subspan(1, -1); }));
}

TEST("span - iterators")
{
    int data[] = {1, 2, 3, 4, 5};
    auto const s = lc::span<int>{data, 5};

    CHECK(s.begin() == data);
    CHECK(s.end() == data + 5);

    for (auto& val : s)
        val *= 2;

    int sum = 0;
    for (auto const& val : s)
        sum += val;
    CHECK(sum == 30);
}

TEST("span - function arguments")
{
    auto sum_span = [](lc::span<int const> s) -> int
    {
        int sum = 0;
        for (auto val : s)
            sum += val;
        return sum;
    };

    SECTION("braced list")
    {
        CHECK(sum_span({1, 2, 3, 4, 5}) == 15);
    }

    SECTION("vector by explicit construction")
    {
        auto vec = std::vector<int>{1, 2, 3, 4, 5};
        CHECK(sum_span(lc::span<int const>{vec}) == 15);
    }

    SECTION("C array directly")
    {
        int data[] = {1, 2, 3, 4, 5};
        CHECK(sum_span(data) == 15);
    }
}
