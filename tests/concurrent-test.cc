#include <large-collections/concurrent.hh>
#include <large-collections/mutex.hh>

#include <nexus/test.hh>

#include <string>
#include <thread>
#include <utility>
#include <vector>

// The test build uses LC_MAX_CHUNK_SIZE=10, so max_capacity is 100.

TEST("mutex - construction")
{
    SECTION("default construction")
    {
        auto m = lc::mutex<int>{};
        auto value = m.lock([](int const& val) { return val; });
        CHECK(value == 0);
    }

    SECTION("construction with initial value")
    {
        auto m = lc::mutex<int>{42};
        auto value = m.lock([](int const& val) { return val; });
        CHECK(value == 42);
    }

    SECTION("construction with container arguments")
    {
        auto m = lc::mutex<lc::large_list<int>>{25};
        auto capacity = m.lock([](lc::large_list<int> const& l) { return l.capacity(); });
        CHECK(capacity == 25);
    }
}

TEST("mutex - lock with modification and return values")
{
    auto m = lc::mutex<std::string>{"hello"};
    m.lock([](std::string& val) { val += " world"; });

    auto value = m.lock([](std::string const& val) { return val; });
    CHECK(value == "hello world");

    auto old_size = m.lock([](std::string& val) { return std::exchange(val, "x").size(); });
    CHECK(old_size == 11);
    CHECK(m.lock([](std::string const& val) { return val; }) == "x");
}

TEST("concurrent containers - parallel adds")
{
    constexpr int thread_count = 4;
    constexpr int adds_per_thread = 25;

    SECTION("list")
    {
        auto list = lc::concurrent_list<int>();

        std::vector<std::thread> threads;
        for (int t = 0; t < thread_count; ++t)
            threads.emplace_back(
                [&list, t]
                {
                    for (int i = 0; i < adds_per_thread; ++i)
                        list.lock([&](lc::large_list<int>& l) { l.add(t * adds_per_thread + i); });
                });
        for (auto& thread : threads)
            thread.join();

        auto const count = list.lock([](lc::large_list<int> const& l) { return l.size(); });
        CHECK(count == thread_count * adds_per_thread);

        // every value arrived exactly once
        auto const sorted = list.lock(
            [](lc::large_list<int>& l)
            {
                l.sort();
                for (lc::isize i = 0; i < l.size(); ++i)
                    if (l[i] != int(i))
                        return false;
                return true;
            });
        CHECK(sorted);
    }

    SECTION("set")
    {
        auto set = lc::concurrent_set<int>();

        std::vector<std::thread> threads;
        for (int t = 0; t < thread_count; ++t)
            threads.emplace_back(
                [&set]
                {
                    // all threads add the same values
                    for (int i = 0; i < adds_per_thread; ++i)
                        set.lock([&](lc::large_set<int>& s) { s.add(i); });
                });
        for (auto& thread : threads)
            thread.join();

        auto const count = set.lock([](lc::large_set<int> const& s) { return s.size(); });
        CHECK(count == adds_per_thread);
    }

    SECTION("dictionary")
    {
        auto dict = lc::concurrent_dictionary<int, int>();

        std::vector<std::thread> threads;
        for (int t = 0; t < thread_count; ++t)
            threads.emplace_back(
                [&dict]
                {
                    for (int i = 0; i < adds_per_thread; ++i)
                        dict.lock([&](lc::large_dictionary<int, int>& d) { d[i % 5] += 1; });
                });
        for (auto& thread : threads)
            thread.join();

        auto const total = dict.lock(
            [](lc::large_dictionary<int, int> const& d)
            {
                int sum = 0;
                d.for_each_value([&](int v) { sum += v; });
                return sum;
            });
        CHECK(total == thread_count * adds_per_thread);
        CHECK(dict.lock([](lc::large_dictionary<int, int> const& d) { return d.get(0); }) == thread_count * 5);
    }

    SECTION("array")
    {
        auto array = lc::concurrent_array<int>(thread_count);

        std::vector<std::thread> threads;
        for (int t = 0; t < thread_count; ++t)
            threads.emplace_back(
                [&array, t]
                {
                    for (int i = 0; i < adds_per_thread; ++i)
                        array.lock([&](lc::large_array<int>& a) { a[t] += 1; });
                });
        for (auto& thread : threads)
            thread.join();

        auto const sum = array.lock(
            [](lc::large_array<int> const& a)
            {
                int s = 0;
                for (auto v : a)
                    s += v;
                return s;
            });
        CHECK(sum == thread_count * adds_per_thread);
    }
}
