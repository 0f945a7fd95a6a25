#pragma once

#include "untrusted_value/maybe_untrusted.hpp"
#include "untrusted_value/policy.hpp"
#include "untrusted_value/registry.hpp"
#include "untrusted_value/result.hpp"
#include "untrusted_value/sanitize.hpp"
#include "untrusted_value/untrusted.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

namespace untrusted_value
{
    // Field types the structural transform knows how to taint. Anything else
    // (references, arrays, cv-qualified or immovable types, values that are
    // already tainted) is refused rather than guessed at.
    template<typename T>
    concept VariantFieldType = std::is_object_v<T> && !std::is_array_v<T> && !std::is_const_v<T> &&
                               !std::is_volatile_v<T> && std::move_constructible<T> && !is_untrusted_v<T> &&
                               !is_maybe_untrusted_v<T> && !UntrustedVariantType<T>;

    template<typename T, typename DeriveList>
    struct VariantField;

    template<typename T, typename... Capabilities>
    struct VariantField<T, Derive<Capabilities...>>
    {
        static_assert(VariantFieldType<T>,
                      "cannot derive an untrusted variant for this field type: it must be a movable, non-const, "
                      "non-array object type that is not already tainted");

        using type = Untrusted<T, Capabilities...>;
    };

    // A field whose type has its own variant becomes that variant, unless it was
    // registered as a Leaf.
    template<typename T, typename... Capabilities>
        requires(HasUntrustedVariant<T> && !is_leaf_variant_v<untrusted_variant_t<T>>)
    struct VariantField<T, Derive<Capabilities...>>
    {
        using type = untrusted_variant_t<T>;
    };

    template<typename T, typename... Capabilities>
    using variant_field_t = typename VariantField<T, Derive<Capabilities...>>::type;

    template<typename Options, typename T>
    using variant_field_for_t = typename VariantField<T, typename Options::derive>::type;

    // Conversion of a trusted struct into its variant, without sanitization.
    template<typename S>
    concept IntoUntrustedVariant = HasUntrustedVariant<S> && requires(S&& value) {
        { to_untrusted_variant(std::move(value)) } -> std::same_as<untrusted_variant_t<S>>;
    };

    // Collapses a variant back into a whole-struct taint. Every field stays
    // tainted.
    template<typename V>
        requires(UntrustedVariantType<V> && requires(V&& variant) { std::move(variant).into_untrusted(); })
    Untrusted<typename V::trusted_type> into_untrusted(V&& variant)
    {
        return std::move(variant).into_untrusted();
    }

    template<typename V, typename Trusted>
        requires(UntrustedVariantType<V> && std::same_as<Trusted, typename V::trusted_type>)
    struct SanitizeValue<V, Trusted>
    {
        static auto sanitize_value(V value) { return std::move(value).sanitize_value(); }
    };

    namespace detail
    {
        template<typename Field, typename T>
        Field into_variant_field(T&& value)
        {
            if constexpr (is_untrusted_v<Field>)
            {
                return Field(std::forward<T>(value));
            }
            else
            {
                return to_untrusted_variant(std::forward<T>(value));
            }
        }

        // Delay only makes the call depend on a template parameter of the
        // caller, so the field's sanitizer is looked up when the caller is used.
        template<typename Trusted, typename Delay, typename Field>
        auto sanitize_field(Field&& field)
        {
            using Insecure = std::remove_cvref_t<Field>;
            static_assert(SanitizableTo<Insecure, Trusted>,
                          "no sanitizer for this field: specialize untrusted_value::SanitizeValue for its type");

            return SanitizeValue<Insecure, Trusted>::sanitize_value(std::move(field));
        }

        template<typename V, typename F>
            requires Sanitizer<F, V>
        std::invoke_result_t<F, V&&> sanitize_variant_with(V&& variant, F&& sanitizer)
        {
            return std::invoke(std::forward<F>(sanitizer), std::move(variant));
        }

        template<typename T, typename... Capabilities>
        Untrusted<T, Capabilities...> into_whole_taint(Untrusted<T, Capabilities...>&& field)
        {
            return std::move(field);
        }

        template<typename V>
            requires UntrustedVariantType<V>
        Untrusted<typename V::trusted_type> into_whole_taint(V&& field)
        {
            return std::move(field).into_untrusted();
        }

        template<typename Trusted, typename... Fields>
        Untrusted<Trusted> collapse_variant(FieldList, Fields&&... fields)
        {
            return Untrusted<Trusted>(Trusted{std::move(into_whole_taint(std::move(fields)).m_value)...});
        }

        // Counts how many initializers an aggregate accepts.
        struct AnyField
        {
            template<typename T>
            operator T() const;
        };

        template<typename T, std::size_t... I>
        constexpr bool brace_constructible_from(std::index_sequence<I...>)
        {
            return requires { T{(static_cast<void>(I), AnyField{})...}; };
        }

        // True unless T has more fields than the N that were listed.
        template<typename T, std::size_t N>
        inline constexpr bool lists_every_field_v = !brace_constructible_from<T>(std::make_index_sequence<N + 1>{});

        template<typename T>
        struct Unparenthesize;

        template<typename T>
        struct Unparenthesize<void(T)>
        {
            using type = T;
        };
    }    // namespace detail
}    // namespace untrusted_value
