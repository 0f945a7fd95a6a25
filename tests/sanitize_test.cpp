#include "test_helpers.hpp"

#include <untrusted_value/sanitize.hpp>
#include <untrusted_value/sanitizers.hpp>
#include <untrusted_value/untrusted.hpp>

#include <catch2/catch.hpp>
#include <cstdint>
#include <limits>
#include <string>

namespace sanitize_test
{
    struct Port
    {
        std::uint16_t number;

        friend bool operator==(const Port&, const Port&) = default;
    };

    enum class PortError
    {
        reserved,
        out_of_range
    };

    struct Username
    {
        std::string name;

        friend bool operator==(const Username&, const Username&) = default;
    };
}    // namespace sanitize_test

namespace untrusted_value
{
    template<>
    struct SanitizeValue<int, sanitize_test::Port>
    {
        using Error = sanitize_test::PortError;

        static Result<sanitize_test::Port, Error> sanitize_value(int value)
        {
            if (value > std::numeric_limits<std::uint16_t>::max() || value < 0)
            {
                return fail(Error::out_of_range);
            }
            if (value < 1024)
            {
                return fail(Error::reserved);
            }
            return sanitize_test::Port{static_cast<std::uint16_t>(value)};
        }
    };

    template<>
    struct SanitizeValue<std::string, sanitize_test::Username>
    {
        using Error = Infallible;

        static Result<sanitize_test::Username, Error> sanitize_value(std::string value)
        {
            auto end = value.find_first_of("\r\n");
            return sanitize_test::Username{value.substr(0, end)};
        }
    };
}    // namespace untrusted_value

using namespace untrusted_value;
using namespace sanitize_test;

static_assert(SanitizableTo<int, Port>);
static_assert(SanitizableTo<Untrusted<int>, Port>);
static_assert(SanitizableTo<Untrusted<int, Copy>, Port>);
static_assert(!SanitizableTo<Untrusted<int>, Username>);
static_assert(!SanitizableTo<Untrusted<double>, double>);
static_assert(std::is_same_v<sanitization_error_t<Untrusted<int>, Port>, PortError>);
static_assert(std::is_same_v<sanitization_error_t<Untrusted<std::string>, Username>, Infallible>);

static_assert(test::CanSanitizeValue<Untrusted<int>, Port>);
static_assert(test::CanSanitizeValue<Untrusted<int>, int>);
static_assert(!test::CanSanitizeValue<Untrusted<double>, double>);
static_assert(!test::CanSanitizeValue<Untrusted<int>, Username>);

static_assert(SanitizeWith<Untrusted<int>, decltype(pass_through())>);
static_assert(!SanitizeWith<int, decltype(pass_through())>);

TEST_CASE("sanitize_value runs the registered sanitizer", "[sanitize]")
{
    SECTION("accepted")
    {
        auto port = Untrusted<int>{8080}.sanitize_value<Port>();
        STATIC_REQUIRE(std::is_same_v<decltype(port), Result<Port, PortError>>);
        REQUIRE(port == Port{8080});
    }
    SECTION("rejected")
    {
        REQUIRE(Untrusted<int>{22}.sanitize_value<Port>().error() == PortError::reserved);
        REQUIRE(Untrusted<int>{70000}.sanitize_value<Port>().error() == PortError::out_of_range);
        REQUIRE(Untrusted<int>{-1}.sanitize_value<Port>().error() == PortError::out_of_range);
    }
    SECTION("default target is the wrapped type")
    {
        auto same = Untrusted<int>{5}.sanitize_value();
        STATIC_REQUIRE(std::is_same_v<decltype(same), Result<int, Infallible>>);
        REQUIRE(same == 5);
    }
    SECTION("infallible sanitizer")
    {
        Untrusted<std::string> input = std::string("admin\r\nSet-Cookie: x");
        REQUIRE(std::move(input).sanitize_value<Username>() == Username{"admin"});
    }
}

TEST_CASE("sanitize_value free function", "[sanitize]")
{
    REQUIRE(sanitize_value<Port>(Untrusted<int>{1024}) == Port{1024});
    REQUIRE(sanitize_value<Port>(Untrusted<int>{80}).error() == PortError::reserved);

    Untrusted<int, Copy> copyable{443};
    REQUIRE(sanitize_value<Port>(std::move(copyable)).error() == PortError::reserved);
}
