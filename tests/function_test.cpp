#include "test_helpers.hpp"

#include <untrusted_value/function.hpp>
#include <untrusted_value/sanitizers.hpp>

#include <catch2/catch.hpp>
#include <string>
#include <type_traits>

using namespace untrusted_value;

namespace function_test
{
    int greeting_length(Untrusted<std::string> name, Untrusted<int> repeat)
    {
        auto text  = std::move(name).sanitize_with(pass_through()).value();
        auto times = std::move(repeat).sanitize_with(infallible([](int x) { return x < 0 ? 0 : x; })).value();
        return static_cast<int>(text.size()) * times;
    }

    std::string read_config_line() { return "listen=0.0.0.0"; }
}    // namespace function_test

using namespace function_test;

static_assert(std::is_same_v<detail::tainted_argument_t<int>, Untrusted<int>>);
static_assert(std::is_same_v<detail::tainted_argument_t<const std::string&>, Untrusted<std::string>>);
static_assert(std::is_same_v<detail::tainted_argument_t<Untrusted<int>>, Untrusted<int>&&>);
static_assert(std::is_same_v<detail::tainted_result_t<int>, Untrusted<int>>);
static_assert(std::is_same_v<detail::tainted_result_t<Untrusted<int>>, Untrusted<int>>);

TEST_CASE("untrusted_inputs wraps every argument", "[function]")
{
    auto handler = untrusted_inputs(greeting_length);

    SECTION("plain arguments")
    {
        std::string name = "bob";
        REQUIRE(handler(name, 2) == 6);
        REQUIRE(handler(std::string("alice"), -3) == 0);
    }
    SECTION("tainted arguments are not wrapped twice")
    {
        REQUIRE(handler(Untrusted<std::string>{std::string("eve")}, 1) == 3);
    }
    SECTION("the callable sees only Untrusted parameters")
    {
        auto taints = untrusted_inputs([](auto value) { return is_untrusted_v<decltype(value)>; });
        REQUIRE(taints(1));
        REQUIRE(taints(std::string("x")));
        REQUIRE(taints(Untrusted<int>{1}));
    }
}

TEST_CASE("untrusted_output wraps the result", "[function]")
{
    SECTION("plain result")
    {
        auto read = untrusted_output(read_config_line);
        auto line = read();

        STATIC_REQUIRE(std::is_same_v<decltype(line), Untrusted<std::string>>);
        REQUIRE(std::move(line).use_untrusted_value() == "listen=0.0.0.0");
    }
    SECTION("arguments are forwarded")
    {
        auto add  = untrusted_output([](int a, int b) { return a + b; });
        auto sum  = add(2, 3);
        STATIC_REQUIRE(std::is_same_v<decltype(sum), Untrusted<int>>);
        REQUIRE(std::move(sum).use_untrusted_value() == 5);
    }
    SECTION("tainted result is not wrapped twice")
    {
        auto read   = untrusted_output([] { return Untrusted<int>{7}; });
        auto result = read();
        STATIC_REQUIRE(std::is_same_v<decltype(result), Untrusted<int>>);
    }
    SECTION("conditional form")
    {
        auto enabled  = untrusted_output_if<true>(read_config_line);
        auto disabled = untrusted_output_if<false>(read_config_line);

        STATIC_REQUIRE(std::is_same_v<decltype(enabled()), Untrusted<std::string>>);
        STATIC_REQUIRE(std::is_same_v<decltype(disabled()), std::string>);
        REQUIRE(disabled() == "listen=0.0.0.0");
    }
}
