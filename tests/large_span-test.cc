#include <large-collections/large_array.hh>
#include <large-collections/large_list.hh>
#include <large-collections/large_span.hh>

#include <nexus/test.hh>

#include "helpers.hh"

#include <algorithm>
#include <type_traits>
#include <vector>

// The test build uses LC_MAX_CHUNK_SIZE=10, so max_capacity is 100.

namespace
{
lc::large_array<int> make_array(lc::isize size)
{
    auto array = lc::large_array<int>(size);
    for (lc::isize i = 0; i < size; ++i)
        array[i] = int(i);
    return array;
}
} // namespace

TEST("large_span - construction")
{
    SECTION("over an array")
    {
        auto array = make_array(25);
        auto span = lc::large_span<int>(array, 5, 10);

        CHECK(span.size() == 10);
        CHECK(span.offset() == 5);
        CHECK(&span.storage() == &array.storage());
        CHECK(span[0] == 5);
        CHECK(span[9] == 14);
    }

    SECTION("whole container")
    {
        auto array = make_array(25);
        auto span = lc::large_span<int const>(array);
        CHECK(span.size() == 25);
        CHECK(span.offset() == 0);
    }

    SECTION("over a list uses the count")
    {
        auto list = lc::large_list<int>(30);
        list.add_range({1, 2, 3});

        auto span = lc::large_span<int>(list);
        CHECK(span.size() == 3);
        CHECK(lc_test::raises(lc::error_kind::range, [&] { lc::large_span<int>(list, 2, 2); }));
    }

    SECTION("default is empty")
    {
        auto span = lc::large_span<int>();
        CHECK(span.size() == 0);
        CHECK(span.empty());
        CHECK(span.index_of(0) == -1);
    }

    SECTION("invalid window")
    {
        auto array = make_array(25);
        CHECK(lc_test::raises(lc::error_kind::range, [&] { lc::large_span<int>(array, 20, 6); }));
        CHECK(lc_test::raises(lc::error_kind::range, [&] { lc::large_span<int>(array, -1, 2); }));
        CHECK(lc_test::raises(lc::error_kind::range, [&] { lc::large_span<int>(array, 3, -1); }));
        CHECK(!lc_test::raises_any([&] { lc::large_span<int>(array, 25, 0); }));
    }

    SECTION("const correctness")
    {
        static_assert(std::is_constructible_v<lc::large_span<int const>, lc::large_span<int>>);
        static_assert(!std::is_constructible_v<lc::large_span<int>, lc::large_span<int const>>);
        static_assert(std::is_constructible_v<lc::large_span<int const>, lc::large_array<int> const&, lc::isize, lc::isize>);
        static_assert(!std::is_constructible_v<lc::large_span<int>, lc::large_array<int> const&, lc::isize, lc::isize>);
    }
}

TEST("large_span - folding")
{
    auto array = make_array(40);

    auto outer = lc::large_span<int>(array, 10, 25);
    auto inner = lc::large_span<int>(outer, 5, 10);
    auto innermost = inner.subspan(2, 3);

    // all windows refer to the array storage directly
    CHECK(&inner.storage() == &array.storage());
    CHECK(&innermost.storage() == &array.storage());
    CHECK(inner.offset() == 15);
    CHECK(innermost.offset() == 17);
    CHECK(innermost.size() == 3);
    CHECK(innermost[0] == 17);

    CHECK(lc_test::raises(lc::error_kind::range, [&] { (void)outer.subspan(20, 6); }));
    CHECK(lc_test::raises(lc::error_kind::range, [&] { (void)innermost[3]; }));

    // a read-only view of a mutable span folds as well
    auto const read_only = lc::large_span<int const>(outer);
    auto folded = read_only.subspan(24, 1);
    CHECK(folded.offset() == 34);
    CHECK(folded[0] == 34);
}

TEST("large_span - folded windows match direct windows")
{
    auto array = make_array(40);

    for (lc::isize outer_offset : {0, 3, 10, 15})
    {
        auto const outer = lc::large_span<int>(array, outer_offset, 25);

        for (lc::isize offset : {0, 1, 9, 10, 24, 25})
            for (lc::isize count : {lc::isize(0), lc::isize(1), 25 - offset})
            {
                if (offset + count > 25)
                    continue;

                auto const folded = lc::large_span<int>(outer, offset, count);
                auto const direct = lc::large_span<int>(array, outer_offset + offset, count);

                REQUIRE(folded.offset() == direct.offset());
                REQUIRE(folded.size() == direct.size());
                CHECK(&folded.storage() == &array.storage());
                for (lc::isize i = 0; i < count; ++i)
                {
                    CHECK(folded[i] == direct[i]);
                    CHECK(&folded[i] == &direct[i]);
                }

                // folding twice lands on the same window
                auto const twice = outer.subspan(offset, count).subspan(0, count);
                CHECK(twice.offset() == direct.offset());
            }
    }
}

TEST("large_span - sort and binary_search inside a window")
{
    struct window
    {
        lc::isize offset;
        lc::isize count;
    };

    for (auto duplicates : {false, true})
        for (auto w : {window{0, 0}, window{7, 1}, window{9, 2}, window{10, 10}, window{3, 11}, window{15, 25}})
        {
            auto const values = lc_test::scrambled_values(40, duplicates);
            auto array = lc::large_array<int>(40);
            for (lc::isize i = 0; i < 40; ++i)
                array[i] = values[i];

            auto expected = values;
            std::sort(expected.begin() + w.offset, expected.begin() + (w.offset + w.count));

            auto const span = lc::large_span<int>(array, w.offset, w.count);
            span.sort();
            for (lc::isize i = 0; i < 40; ++i)
                CHECK(array[i] == expected[i]);

            for (lc::isize i = 0; i < w.count; ++i)
            {
                auto const index = span.binary_search(span[i]);
                REQUIRE(index >= 0);
                REQUIRE(index < w.count);
                CHECK(span[index] == span[i]);
            }

            for (int v = -1; v <= 2 * 40 + 7; v += 2)
                CHECK(span.binary_search(v) == -1);
        }
}

TEST("large_span - element access and iteration")
{
    auto array = make_array(30);
    auto span = array.subspan(7, 16);

    span.set(0, -7);
    span[15] = -22;
    CHECK(array[7] == -7);
    CHECK(array[22] == -22);
    CHECK(span.get(1) == 8);

    std::vector<int> seen;
    for (auto v : span)
        seen.push_back(v);
    REQUIRE(seen.size() == 16);
    CHECK(seen[0] == -7);
    CHECK(seen[3] == 10);
    CHECK(seen[15] == -22);

    int count = 0;
    span.for_each([&](int&) { ++count; });
    CHECK(count == 16);
}

TEST("large_span - algorithms")
{
    SECTION("search results are relative to the span")
    {
        auto array = make_array(30);
        auto const span = array.subspan(12, 10);

        CHECK(span.index_of(15) == 3);
        CHECK(span.index_of(5) == -1);
        CHECK(span.contains(21));
        CHECK(!span.contains(22));
        CHECK(span.binary_search(20) == 8);
        CHECK(span.binary_search(11) == -1);
    }

    SECTION("sort only touches the window")
    {
        auto array = lc::large_array<int>(20);
        for (lc::isize i = 0; i < 20; ++i)
            array[i] = int(20 - i);

        array.subspan(5, 10).sort();
        CHECK(array[4] == 16);
        CHECK(array[5] == 6);
        CHECK(array[14] == 15);
        CHECK(array[15] == 5);
    }

    SECTION("swap and fill")
    {
        auto array = make_array(25);
        auto span = array.subspan(8, 10);

        span.swap(0, 9);
        CHECK(array[8] == 17);
        CHECK(array[17] == 8);
        CHECK(lc_test::raises(lc::error_kind::range, [&] { span.swap(0, 10); }));

        span.fill(-1);
        CHECK(array[7] == 7);
        CHECK(array[8] == -1);
        CHECK(array[17] == -1);
        CHECK(array[18] == 18);
    }
}

TEST("large_span - copies")
{
    SECTION("between containers")
    {
        auto source = make_array(25);
        auto target = lc::large_list<int>(40);
        for (int i = 0; i < 30; ++i)
            target.add(-1);

        source.subspan(3, 20).copy_to(target.subspan(9, 20));
        CHECK(target[8] == -1);
        CHECK(target[9] == 3);
        CHECK(target[28] == 22);
        CHECK(target[29] == -1);
    }

    SECTION("into a shorter target")
    {
        auto source = make_array(25);
        auto target = lc::large_array<int>(4);
        CHECK(lc_test::raises(lc::error_kind::range, [&] { source.subspan(0, 5).copy_to(target.as_span()); }));
    }

    SECTION("overlapping windows of the same storage")
    {
        auto array = make_array(30);
        array.subspan(0, 20).copy_to(array.subspan(5, 20));
        for (int i = 0; i < 20; ++i)
            CHECK(array[5 + i] == i);
    }

    SECTION("flat buffers")
    {
        auto array = make_array(25);
        auto span = array.subspan(6, 8);

        std::vector<int> out(10, -1);
        span.copy_to(lc::span<int>(out));
        CHECK(out[0] == 6);
        CHECK(out[7] == 13);
        CHECK(out[8] == -1);

        span.copy_from({100, 101, 102});
        CHECK(array[6] == 100);
        CHECK(array[8] == 102);
        CHECK(array[9] == 9);

        std::vector<int> too_long(9);
        CHECK(lc_test::raises(lc::error_kind::range, [&] { span.copy_from(lc::span<int const>(too_long)); }));
    }
}
