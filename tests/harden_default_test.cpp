#include "test_helpers.hpp"

#include <untrusted_value/untrusted_value.hpp>

#include <catch2/catch.hpp>
#include <type_traits>

// Built with UNTRUSTED_VALUE_HARDEN_SANITIZE=1.
static_assert(UNTRUSTED_VALUE_HARDEN_SANITIZE == 1);

namespace harden_default_test
{
    inline int sanitizer_calls = 0;

    struct Digit
    {
        int value;
    };

    struct NotADigit
    {
        int value;

        friend bool operator==(const NotADigit&, const NotADigit&) = default;
    };

    struct Pin
    {
        Digit first;
        Digit second;
    };
    UNTRUSTED_VALUE_VARIANT(Pin, PinUntrusted, first, second)

    struct Code
    {
        Digit first;
        Digit second;
    };
    UNTRUSTED_VALUE_VARIANT_WITH(Code,
                                 CodeUntrusted,
                                 (untrusted_value::VariantOptions<untrusted_value::FailFast>),
                                 first,
                                 second)
}    // namespace harden_default_test

namespace untrusted_value
{
    template<>
    struct SanitizeValue<harden_default_test::Digit, harden_default_test::Digit>
    {
        using Error = harden_default_test::NotADigit;

        static Result<harden_default_test::Digit, Error> sanitize_value(harden_default_test::Digit digit)
        {
            ++harden_default_test::sanitizer_calls;
            if (digit.value < 0 || digit.value > 9)
            {
                return fail(Error{digit.value});
            }
            return digit;
        }
    };
}    // namespace untrusted_value

using namespace untrusted_value;
using namespace harden_default_test;

static_assert(std::is_same_v<DefaultPolicy, Harden>);
static_assert(std::is_same_v<VariantOptions<>::policy, Harden>);
static_assert(std::is_same_v<PinUntrusted::options::policy, Harden>);
static_assert(std::is_same_v<CodeUntrusted::options::policy, FailFast>);

TEST_CASE("Generated variants default to Harden", "[policy]")
{
    sanitizer_calls = 0;

    auto result = to_untrusted_variant(Pin{{42}, {1}}).sanitize_value();

    REQUIRE(result.error() == NotADigit{42});
    REQUIRE(sanitizer_calls == 2);
}

TEST_CASE("FailFast can still be chosen per struct", "[policy]")
{
    sanitizer_calls = 0;

    auto result = to_untrusted_variant(Code{{42}, {1}}).sanitize_value();

    REQUIRE(result.error() == NotADigit{42});
    REQUIRE(sanitizer_calls == 1);
}
