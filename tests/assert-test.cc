#include <large-collections/assert-handler.hh>
#include <large-collections/assert.hh>
#include <large-collections/contract.hh>
#include <large-collections/large_dictionary.hh>
#include <large-collections/large_list.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>


TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<lc::impl::assertion_info> captured;
    // CAREFUL: this is a bit brittle wrt. formatting but it should be fine
    int const test_line = __LINE__ + 11; // line where LC_ASSERT_ALWAYS is called

    {
        auto handler = lc::impl::scoped_assertion_handler(
            [&](lc::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // Must throw to prevent abort
            });
        try
        {
            LC_ASSERT_ALWAYS(false, "hello 42");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    CHECK(std::string(lc::to_string(captured->kind)) == "assertion");

    // Expression: should contain the stringified condition
    CHECK(!captured->expression.empty());
    CHECK(captured->expression.find("false") != std::string::npos);

    CHECK(captured->message == "hello 42");

    // Location: file name should end with this test file
    auto file_name = std::string(captured->location.file_name());
    CHECK(file_name.ends_with("assert-test.cc"));

    // Location: line should be exact
    CHECK(captured->location.line() == test_line);
}

TEST("assertions - passing assertion does not call handler")
{
    bool handler_called = false;

    {
        auto handler
            = lc::impl::scoped_assertion_handler([&](lc::impl::assertion_info const&) { handler_called = true; });
        LC_ASSERT_ALWAYS(true, "should not matter");
        LC_ASSERT(1 < 2, "should not matter either");
        lc::check_index(0, 1);
        lc::check_range(0, 3, 3);
    }

    CHECK(!handler_called);
}

TEST("assertions - handler stack is LIFO and nesting works")
{
    std::vector<int> events;

    auto handler_a = lc::impl::scoped_assertion_handler(
        [&](lc::impl::assertion_info const&)
        {
            events.push_back(1); // handler A
            throw 0;
        });

    {
        auto handler_b = lc::impl::scoped_assertion_handler(
            [&](lc::impl::assertion_info const&)
            {
                events.push_back(2); // handler B
                throw 0;
            });

        // Trigger failure with B active
        try
        {
            LC_ASSERT_ALWAYS(false, "first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    // B is now popped

    // Trigger failure with only A active
    try
    {
        LC_ASSERT_ALWAYS(false, "second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2); // first failure hit handler B
    CHECK(events[1] == 1); // second failure hit handler A
}

TEST("assertions - scoped_assertion_handler pops on scope exit even when handler throws")
{
    std::vector<int> events;
    bool outer_handler_works = false;

    auto outer = lc::impl::scoped_assertion_handler(
        [&](lc::impl::assertion_info const&)
        {
            events.push_back(1);
            outer_handler_works = true;
            throw 0; // Must throw to prevent abort
        });

    struct sentinel_exception
    {
    };

    try
    {
        auto inner = lc::impl::scoped_assertion_handler(
            [&](lc::impl::assertion_info const&)
            {
                events.push_back(2);
                throw sentinel_exception{};
            });

        LC_ASSERT_ALWAYS(false, "trigger inner");
        CHECK(false); // should not reach here
    }
    catch (sentinel_exception const&)
    {
        // Expected: inner handler threw
    }

    REQUIRE(events.size() == 1);
    CHECK(events[0] == 2);

    // Now trigger another failure: outer handler should still work
    try
    {
        LC_ASSERT_ALWAYS(false, "trigger outer");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(outer_handler_works);
    REQUIRE(events.size() == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - contract violations carry their error kind")
{
    std::vector<lc::impl::assertion_info> captures;

    auto handler = lc::impl::scoped_assertion_handler(
        [&](lc::impl::assertion_info const& info)
        {
            captures.push_back(info);
            throw 0;
        });

    auto list = lc::large_list<int>();
    list.add(1);

    try
    {
        (void)list[1];
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        (void)lc::large_list<int>(-5);
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        auto dict = lc::large_dictionary<int, int>();
        (void)dict.get(3);
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        (void)lc::large_list<int>(1, lc::growth_policy{.grow_factor = 5.0});
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(captures.size() == 4);
    CHECK(std::string(lc::to_string(captures[0].kind)) == "range");
    CHECK(std::string(lc::to_string(captures[1].kind)) == "capacity");
    CHECK(std::string(lc::to_string(captures[2].kind)) == "not_found");
    CHECK(std::string(lc::to_string(captures[3].kind)) == "invalid_configuration");

    CHECK(captures[0].message.find("index 1") != std::string::npos);
    CHECK(captures[3].expression.find("grow_factor") != std::string::npos);

    // the list is untouched by the rejected access
    CHECK(list.size() == 1);
}

TEST("assertions - error kind names")
{
    CHECK(std::string(lc::to_string(lc::error_kind::assertion)) == "assertion");
    CHECK(std::string(lc::to_string(lc::error_kind::range)) == "range");
    CHECK(std::string(lc::to_string(lc::error_kind::capacity)) == "capacity");
    CHECK(std::string(lc::to_string(lc::error_kind::not_found)) == "not_found");
    CHECK(std::string(lc::to_string(lc::error_kind::invalid_configuration)) == "invalid_configuration");
}
