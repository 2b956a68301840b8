#include <inline-core/assert-handler.hh>
#include <inline-core/assert.hh>
#include <inline-core/index.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
// Reports a failure the way the checked paths do, independent of IC_ASSERT_ENABLED
void report_failure(char const* message)
{
    ic::impl::handle_assert_failure("report_failure", message, ic::source_location::current());
}
} // namespace

#if IC_ASSERT_ENABLED
TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<ic::impl::assertion_info> captured;
    // line numbers are brittle wrt. formatting, keep the assert right below the marker
    int test_line = 0;

    {
        auto handler = ic::impl::scoped_assertion_handler(
            [&](ic::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // must throw to prevent abort
            });
        try
        {
            test_line = __LINE__ + 1;
            IC_ASSERT(1 > 2, "hello 42");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    // expression: the stringified condition
    CHECK(captured->expression == "1 > 2");

    CHECK(captured->message == "hello 42");

    auto const file_name = std::string(captured->location.file_name());
    CHECK(file_name.ends_with("assert-test.cc"));
    CHECK(int(captured->location.line()) == test_line);
    CHECK(!std::string(captured->location.function_name()).empty());
}

TEST("assertions - passing assertion does not call handler")
{
    bool handler_called = false;
    int counter = 0;

    auto check = [&]() -> bool
    {
        ++counter;
        return true;
    };

    {
        auto handler
            = ic::impl::scoped_assertion_handler([&](ic::impl::assertion_info const&) { handler_called = true; });
        IC_ASSERT(check(), "should not matter");
    }

    CHECK(!handler_called);
    CHECK(counter == 1); // the condition is evaluated exactly once
}
#endif

TEST("assertions - IC_ASSERT follows the build configuration")
{
    int evaluated = 0;
    bool handler_called = false;

    auto fails = [&]() -> bool
    {
        ++evaluated;
        return false;
    };

    {
        auto handler = ic::impl::scoped_assertion_handler(
            [&](ic::impl::assertion_info const&)
            {
                handler_called = true;
                throw 0;
            });
        try
        {
            IC_ASSERT(fails(), "checked build only");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

#if IC_ASSERT_ENABLED
    CHECK(handler_called);
    CHECK(evaluated == 1);
#else
    // stripped: the condition is not even evaluated
    CHECK(!handler_called);
    CHECK(evaluated == 0);
#endif
}

TEST("assertions - handler stack is LIFO and nesting works")
{
    std::vector<int> events;

    auto handler_a = ic::impl::scoped_assertion_handler(
        [&](ic::impl::assertion_info const&)
        {
            events.push_back(1); // handler A
            throw 0;
        });

    {
        auto handler_b = ic::impl::scoped_assertion_handler(
            [&](ic::impl::assertion_info const&)
            {
                events.push_back(2); // handler B
                throw 0;
            });

        try
        {
            report_failure("first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    // B is popped

    try
    {
        report_failure("second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - scoped_assertion_handler pops on scope exit even when handler throws")
{
    std::vector<int> events;
    bool outer_handler_works = false;

    auto outer = ic::impl::scoped_assertion_handler(
        [&](ic::impl::assertion_info const&)
        {
            events.push_back(1);
            outer_handler_works = true;
            throw 0;
        });

    struct sentinel_exception
    {
    };

    try
    {
        auto inner = ic::impl::scoped_assertion_handler(
            [&](ic::impl::assertion_info const&)
            {
                events.push_back(2);
                throw sentinel_exception{};
            });

        report_failure("trigger inner");
        CHECK(false); // unreachable
    }
    catch (sentinel_exception const&) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 1);
    CHECK(events[0] == 2);

    // the outer handler is active again
    try
    {
        report_failure("trigger outer");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(outer_handler_works);
    REQUIRE(events.size() == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - manual push and pop")
{
    int calls = 0;

    ic::impl::push_assertion_handler(
        [&](ic::impl::assertion_info const&)
        {
            ++calls;
            throw 0;
        });

    try
    {
        report_failure("manual handler");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    ic::impl::pop_assertion_handler();
    CHECK(calls == 1);
}

TEST("assertions - bounds failures reach the installed handler in every build configuration")
{
    std::vector<ic::impl::assertion_info> captures;

    {
        auto handler = ic::impl::scoped_assertion_handler(
            [&](ic::impl::assertion_info const& info)
            {
                captures.push_back(info);
                throw 0;
            });
        try
        {
            (void)ic::normalize_index("inline_array", 4, 4);
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
        try
        {
            report_failure("second message");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captures.size() == 2);

    CHECK(captures[0].expression == "-length <= index && index < length");
    CHECK(captures[0].message == "inline_array index out of bounds: index (4) valid range: -4 <= index < 4");
    CHECK(std::string(captures[0].location.file_name()).ends_with("assert-test.cc"));

    CHECK(captures[1].expression == "report_failure");
    CHECK(captures[1].message == "second message");
    CHECK(captures[0].location.line() != captures[1].location.line());
}
