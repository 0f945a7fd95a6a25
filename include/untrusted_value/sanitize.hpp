#pragma once

#include "untrusted_value/registry.hpp"
#include "untrusted_value/result.hpp"

#include <concepts>
#include <type_traits>
#include <utility>

namespace untrusted_value
{
    // Canonical sanitization of an Insecure value into a Trusted one.
    //
    // Specialize once per (Insecure, Trusted) pair, the way fmt::formatter is
    // specialized:
    //
    //     template<>
    //     struct untrusted_value::SanitizeValue<UserInput, Query>
    //     {
    //         using Error = ParseError;
    //         static Result<Query, Error> sanitize_value(UserInput input);
    //     };
    //
    // sanitize_value must be deterministic and must report malformed input as
    // an error instead of throwing. On failure nothing of the input may be
    // observable as trusted.
    template<typename Insecure, typename Trusted>
    struct SanitizeValue;

    template<typename R, typename Trusted>
    concept ResultOf = ResultType<R> && std::same_as<typename std::remove_cvref_t<R>::value_type, Trusted>;

    template<typename Insecure, typename Trusted>
    concept SanitizableTo = requires(Insecure&& value) {
        { SanitizeValue<Insecure, Trusted>::sanitize_value(std::move(value)) } -> ResultOf<Trusted>;
    };

    template<typename Insecure, typename Trusted>
        requires SanitizableTo<Insecure, Trusted>
    using sanitization_error_t =
        typename decltype(SanitizeValue<Insecure, Trusted>::sanitize_value(std::declval<Insecure>()))::error_type;

    // Types offering the sanitize_with gate for the sanitizer F.
    template<typename Insecure, typename F>
    concept SanitizeWith = requires(Insecure&& insecure, F&& sanitizer) {
        { std::move(insecure).sanitize_with(std::forward<F>(sanitizer)) } -> ResultType;
    };

    template<typename Trusted, typename Insecure>
        requires(!std::is_lvalue_reference_v<Insecure> && SanitizableTo<std::remove_cvref_t<Insecure>, Trusted>)
    auto sanitize_value(Insecure&& insecure)
    {
        return SanitizeValue<std::remove_cvref_t<Insecure>, Trusted>::sanitize_value(std::move(insecure));
    }

    namespace detail
    {
        // A plain T reaches Trusted either through its own SanitizeValue
        // specialization or, for a struct with a registered variant, field by
        // field through that variant.
        template<typename T, typename Trusted>
        concept SanitizableInner =
            SanitizableTo<T, Trusted> ||
            (std::same_as<T, Trusted> && HasUntrustedVariant<T> && SanitizableTo<untrusted_variant_t<T>, T>);

        template<typename Trusted, typename T>
            requires SanitizableInner<T, Trusted>
        auto sanitize_inner(T value)
        {
            if constexpr (SanitizableTo<T, Trusted>)
            {
                return SanitizeValue<T, Trusted>::sanitize_value(std::move(value));
            }
            else
            {
                return SanitizeValue<untrusted_variant_t<T>, T>::sanitize_value(to_untrusted_variant(std::move(value)));
            }
        }
    }    // namespace detail
}    // namespace untrusted_value
