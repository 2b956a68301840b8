#include <inline-core/assert-handler.hh>
#include <inline-core/index.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>

// compile-time normalization
static_assert(ic::normalize_static_index<0, 4>() == 0);
static_assert(ic::normalize_static_index<3, 4>() == 3);
static_assert(ic::normalize_static_index<-1, 4>() == 3);
static_assert(ic::normalize_static_index<-4, 4>() == 0);
static_assert(ic::normalize_static_index<0, 1>() == 0);
static_assert(ic::normalize_static_index<-1, 1>() == 0);

// bool is not an index
static_assert(ic::impl::index_integral<int>);
static_assert(ic::impl::index_integral<unsigned char>);
static_assert(ic::impl::index_integral<ic::u64 const>);
static_assert(!ic::impl::index_integral<bool>);
static_assert(!ic::impl::index_integral<double>);

namespace
{
// Runs normalize_index with a throwing handler and returns the reported message, if any.
template <class I>
std::optional<std::string> bounds_report(char const* name, I idx, ic::isize length)
{
    std::optional<std::string> message;
    auto handler = ic::impl::scoped_assertion_handler(
        [&](ic::impl::assertion_info const& info)
        {
            message = info.message;
            throw 0;
        });
    try
    {
        (void)ic::normalize_index(name, idx, length);
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }
    return message;
}
} // namespace

TEST("index - runtime normalization")
{
    SECTION("non-negative indices map to themselves")
    {
        for (ic::isize i = 0; i < 5; ++i)
            CHECK(ic::normalize_index("test", i, 5) == i);
    }

    SECTION("negative indices count from the back")
    {
        CHECK(ic::normalize_index("test", -1, 5) == 4);
        CHECK(ic::normalize_index("test", -5, 5) == 0);
        CHECK(ic::normalize_index("test", ic::i8(-2), 3) == 1);
    }

    SECTION("unsigned indices")
    {
        CHECK(ic::normalize_index("test", 4u, 5) == 4);
        CHECK(ic::normalize_index("test", ic::u8(0), 1) == 0);
        CHECK(ic::normalize_index("test", ic::u64(2), 3) == 2);
    }

    SECTION("agrees with the compile-time mapping")
    {
        CHECK(ic::normalize_index("test", -3, 7) == ic::normalize_static_index<-3, 7>());
        CHECK(ic::normalize_index("test", 6, 7) == ic::normalize_static_index<6, 7>());
    }
}

TEST("index - bounds failures")
{
    SECTION("index == length")
    {
        auto const msg = bounds_report("inline_array", 3, 3);
        REQUIRE(msg.has_value());
        CHECK(*msg == "inline_array index out of bounds: index (3) valid range: -3 <= index < 3");
    }

    SECTION("index == -length - 1")
    {
        auto const msg = bounds_report("inline_array", -4, 3);
        REQUIRE(msg.has_value());
        CHECK(*msg == "inline_array index out of bounds: index (-4) valid range: -3 <= index < 3");
    }

    SECTION("custom container name")
    {
        auto const msg = bounds_report("ring", ic::i64(100), 8);
        REQUIRE(msg.has_value());
        CHECK(*msg == "ring index out of bounds: index (100) valid range: -8 <= index < 8");
    }

    SECTION("unsigned values beyond the signed range")
    {
        auto const msg = bounds_report("inline_array", ic::u64(18446744073709551615ull), 2);
        REQUIRE(msg.has_value());
        CHECK(*msg == "inline_array index out of bounds: index (18446744073709551615) valid range: -2 <= index < 2");
    }

    SECTION("smallest signed value")
    {
        auto const msg = bounds_report("inline_array", ic::i64(-9223372036854775807ll - 1), 2);
        REQUIRE(msg.has_value());
        CHECK(msg->find("index (-9223372036854775808)") != std::string::npos);
    }

    SECTION("in-range indices never report")
    {
        CHECK(!bounds_report("inline_array", -1, 1).has_value());
        CHECK(!bounds_report("inline_array", 0u, 1).has_value());
    }

    SECTION("failures are reported regardless of the assertion configuration")
    {
        // release builds strip IC_ASSERT but bounds checks stay
        auto const msg = bounds_report("inline_array", 10, 2);
        CHECK(msg.has_value());
    }
}
