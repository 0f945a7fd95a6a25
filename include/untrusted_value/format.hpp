#pragma once

#include "untrusted_value/result.hpp"
#include "untrusted_value/sanitizers.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

// Formatters for the outcome of a sanitization. Tainted values have none on
// purpose: printing one is a compile error.
namespace fmt
{
    template<typename T, typename E>
    struct formatter<untrusted_value::Result<T, E>>
    {
        constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

        template<typename FormatContext>
        auto format(const untrusted_value::Result<T, E>& result, FormatContext& ctx) const
        {
            if (result.has_value())
            {
                return fmt::format_to(ctx.out(), "Ok({})", result.value());
            }
            return fmt::format_to(ctx.out(), "Err({})", result.error());
        }
    };

    template<>
    struct formatter<untrusted_value::Infallible> : formatter<string_view>
    {
        template<typename FormatContext>
        auto format(untrusted_value::Infallible, FormatContext& ctx) const
        {
            return formatter<string_view>::format("infallible", ctx);
        }
    };

    template<>
    struct formatter<untrusted_value::VerificationFailed> : formatter<string_view>
    {
        template<typename FormatContext>
        auto format(untrusted_value::VerificationFailed, FormatContext& ctx) const
        {
            return formatter<string_view>::format("verification failed", ctx);
        }
    };
}    // namespace fmt
