#include "test_helpers.hpp"

#include <untrusted_value/maybe_untrusted.hpp>
#include <untrusted_value/sanitizers.hpp>

#include <catch2/catch.hpp>
#include <string>

using namespace untrusted_value;

namespace maybe_untrusted_test
{
    struct Percentage
    {
        int value;

        friend bool operator==(const Percentage&, const Percentage&) = default;
    };

    struct OutOfRange
    {
        int value;

        friend bool operator==(const OutOfRange&, const OutOfRange&) = default;
    };
}    // namespace maybe_untrusted_test

namespace untrusted_value
{
    template<>
    struct SanitizeValue<int, maybe_untrusted_test::Percentage>
    {
        using Error = maybe_untrusted_test::OutOfRange;

        static Result<maybe_untrusted_test::Percentage, Error> sanitize_value(int value)
        {
            if (value < 0 || value > 100)
            {
                return fail(Error{value});
            }
            return maybe_untrusted_test::Percentage{value};
        }
    };
}    // namespace untrusted_value

using namespace maybe_untrusted_test;

static_assert(is_maybe_untrusted_v<MaybeUntrusted<int>>);
static_assert(!is_maybe_untrusted_v<Untrusted<int>>);
static_assert(!std::is_convertible_v<MaybeUntrusted<int>, int>);
static_assert(!std::is_copy_constructible_v<MaybeUntrusted<int>>);
static_assert(std::is_copy_constructible_v<MaybeUntrusted<int, Copy>>);
static_assert(!test::ComparableWith<MaybeUntrusted<int>, MaybeUntrusted<int>>);
static_assert(test::ComparableWith<MaybeUntrusted<int, Equality>, MaybeUntrusted<int, Equality>>);
static_assert(!test::CanSanitizeLvalue<MaybeUntrusted<int>, decltype(pass_through())>);
static_assert(SanitizeWith<MaybeUntrusted<int>, decltype(pass_through())>);
static_assert(SanitizableTo<MaybeUntrusted<int>, Percentage>);

TEST_CASE("MaybeUntrusted tracks provenance at runtime", "[maybe_untrusted]")
{
    SECTION("trusted")
    {
        auto value = MaybeUntrusted<int>::trusted(1);
        REQUIRE(value.is_trusted());
        REQUIRE_FALSE(value.is_untrusted());
    }
    SECTION("untrusted")
    {
        auto value = MaybeUntrusted<int>::untrusted(1);
        REQUIRE(value.is_untrusted());
        REQUIRE_FALSE(value.is_trusted());
    }
    SECTION("from an Untrusted")
    {
        MaybeUntrusted<std::string> value = Untrusted<std::string>{std::string("input")};
        REQUIRE(value.is_untrusted());
    }
    SECTION("wrap")
    {
        REQUIRE(MaybeUntrusted<int>::wrap(1, true).is_untrusted());
        REQUIRE(MaybeUntrusted<int>::wrap(1, false).is_trusted());
    }
}

TEST_CASE("MaybeUntrusted runs the same sanitizer for both alternatives", "[maybe_untrusted]")
{
    int calls = 0;
    auto halve = [&calls](int x) -> Result<int, OutOfRange> {
        ++calls;
        if (x % 2 != 0)
        {
            return fail(OutOfRange{x});
        }
        return x / 2;
    };

    for (int input : {-4, 0, 3, 10})
    {
        auto expected = halve(input);
        calls         = 0;

        auto from_trusted   = MaybeUntrusted<int>::trusted(input).sanitize_with(halve);
        auto from_untrusted = MaybeUntrusted<int>::untrusted(input).sanitize_with(halve);

        REQUIRE(calls == 2);
        REQUIRE(from_trusted == expected);
        REQUIRE(from_untrusted == expected);
    }
}

TEST_CASE("MaybeUntrusted sanitize_value", "[maybe_untrusted]")
{
    SECTION("trusted values are validated too")
    {
        REQUIRE(MaybeUntrusted<int>::trusted(150).sanitize_value<Percentage>().error() == OutOfRange{150});
        REQUIRE(MaybeUntrusted<int>::trusted(50).sanitize_value<Percentage>() == Percentage{50});
    }
    SECTION("untrusted values")
    {
        REQUIRE(MaybeUntrusted<int>::untrusted(-1).sanitize_value<Percentage>().error() == OutOfRange{-1});
        REQUIRE(MaybeUntrusted<int>::untrusted(99).sanitize_value<Percentage>() == Percentage{99});
    }
    SECTION("free function")
    {
        REQUIRE(sanitize_value<Percentage>(MaybeUntrusted<int>::wrap(100, true)) == Percentage{100});
    }
}

TEST_CASE("MaybeUntrusted escape hatch and capabilities", "[maybe_untrusted]")
{
    SECTION("use_untrusted_value")
    {
        REQUIRE(MaybeUntrusted<int>::trusted(3).use_untrusted_value() == 3);
        REQUIRE(MaybeUntrusted<int>::untrusted(4).use_untrusted_value() == 4);
    }
    SECTION("copy keeps the alternative")
    {
        auto original = MaybeUntrusted<int, Copy>::untrusted(5);
        auto copy     = original;
        REQUIRE(copy.is_untrusted());
    }
    SECTION("equality compares alternative and value")
    {
        using Maybe = MaybeUntrusted<int, Equality>;

        REQUIRE(Maybe::untrusted(1) == Maybe::untrusted(1));
        REQUIRE(Maybe::trusted(1) == Maybe::trusted(1));
        REQUIRE(Maybe::trusted(1) != Maybe::untrusted(1));
        REQUIRE(Maybe::untrusted(1) != Maybe::untrusted(2));
    }
}
