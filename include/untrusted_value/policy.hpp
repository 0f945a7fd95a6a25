#pragma once

#include "untrusted_value/capabilities.hpp"
#include "untrusted_value/config.hpp"
#include "untrusted_value/result.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace untrusted_value
{
    // Stops at the first field that fails, later fields are not sanitized.
    struct FailFast
    {
    };

    // Sanitizes every field before reporting the first failure, so that the
    // time spent does not depend on which field failed. Only the first error in
    // declaration order is kept.
    struct Harden
    {
    };

    // End marker: the variant is treated as a plain value when its struct is a
    // field of another struct.
    struct Leaf
    {
    };

    // Capabilities forwarded onto every leaf field of a generated variant.
    template<typename... Capabilities>
    struct Derive
    {
        template<typename Capability>
        static constexpr bool grants = has_capability_v<Capability, Capabilities...>;
    };

#if UNTRUSTED_VALUE_HARDEN_SANITIZE
    using DefaultPolicy = Harden;
#else
    using DefaultPolicy = FailFast;
#endif

    namespace detail
    {
        template<typename T, typename... Ts>
        inline constexpr bool contains_v = (std::is_same_v<T, Ts> || ...);

        template<typename... Options>
        struct DeriveOf
        {
            using type = Derive<>;
        };

        template<typename... Capabilities, typename... Rest>
        struct DeriveOf<Derive<Capabilities...>, Rest...>
        {
            using type = Derive<Capabilities...>;
        };

        template<typename First, typename... Rest>
        struct DeriveOf<First, Rest...> : DeriveOf<Rest...>
        {
        };
    }    // namespace detail

    // Per-struct options of a generated variant: any of Derive<...>, FailFast or
    // Harden, and Leaf.
    template<typename... Options>
    struct VariantOptions
    {
        static_assert(!(detail::contains_v<FailFast, Options...> && detail::contains_v<Harden, Options...>),
                      "a variant is either FailFast or Harden");

        using policy = std::conditional_t<detail::contains_v<Harden, Options...>,
                                          Harden,
                                          std::conditional_t<detail::contains_v<FailFast, Options...>, FailFast, DefaultPolicy>>;
        using derive = typename detail::DeriveOf<Options...>::type;

        static constexpr bool is_leaf = detail::contains_v<Leaf, Options...>;
    };

    namespace detail
    {
        template<typename... Ts>
        struct TypeList
        {
        };

        template<typename List, typename T>
        struct AppendUnique;

        template<typename... Ts, typename T>
        struct AppendUnique<TypeList<Ts...>, T>
        {
            using type = std::conditional_t<contains_v<T, Ts...> || std::is_same_v<T, Infallible>,
                                            TypeList<Ts...>,
                                            TypeList<Ts..., T>>;
        };

        template<typename List, typename... Errors>
        struct UniqueErrors
        {
            using type = List;
        };

        template<typename List, typename First, typename... Rest>
        struct UniqueErrors<List, First, Rest...> : UniqueErrors<typename AppendUnique<List, First>::type, Rest...>
        {
        };

        template<typename List>
        struct CommonErrorOf;

        template<>
        struct CommonErrorOf<TypeList<>>
        {
            using type = Infallible;
        };

        template<typename Error>
        struct CommonErrorOf<TypeList<Error>>
        {
            using type = Error;
        };

        template<typename First, typename Second, typename... Rest>
        struct CommonErrorOf<TypeList<First, Second, Rest...>>
        {
            using type = std::variant<First, Second, Rest...>;
        };
    }    // namespace detail

    // Error type able to hold the error of any of the given field sanitizers:
    // Infallible when none can fail, the shared type when they agree, a
    // std::variant of the distinct types otherwise.
    template<typename... Errors>
    using common_error_t =
        typename detail::CommonErrorOf<typename detail::UniqueErrors<detail::TypeList<>, Errors...>::type>::type;

    namespace detail
    {
        template<typename Thunk>
        using thunk_result_t = std::invoke_result_t<Thunk&>;

        template<typename Error, typename... Thunks>
        using resolved_error_t =
            typename std::conditional_t<std::is_void_v<Error>,
                                        std::type_identity<common_error_t<typename thunk_result_t<Thunks>::error_type...>>,
                                        std::type_identity<Error>>::type;

        // Sanitizes one field into its slot. Keeps the first error only.
        template<typename Error, typename Thunk, typename Slot>
        bool sanitize_into(Thunk& thunk, Slot& slot, std::optional<Error>& error)
        {
            auto result = thunk();
            using FieldError = typename decltype(result)::error_type;

            if constexpr (std::is_same_v<FieldError, Infallible>)
            {
                slot.emplace(std::move(result).value());
                return true;
            }
            else
            {
                static_assert(std::is_constructible_v<Error, FieldError&&>,
                              "the variant's error type must be constructible from the error of every field");

                if (result.has_value())
                {
                    slot.emplace(std::move(result).value());
                    return true;
                }
                if (!error.has_value())
                {
                    error.emplace(std::move(result).error());
                }
                return false;
            }
        }

        template<typename Error, typename... Thunks, typename... Slots, std::size_t... I>
        void run_fields(FailFast,
                        std::tuple<Thunks...>& thunks,
                        std::tuple<Slots...>& slots,
                        std::optional<Error>& error,
                        std::index_sequence<I...>)
        {
            static_cast<void>((sanitize_into(std::get<I>(thunks), std::get<I>(slots), error) && ...));
        }

        template<typename Error, typename... Thunks, typename... Slots, std::size_t... I>
        void run_fields(Harden,
                        std::tuple<Thunks...>& thunks,
                        std::tuple<Slots...>& slots,
                        std::optional<Error>& error,
                        std::index_sequence<I...>)
        {
            (static_cast<void>(sanitize_into(std::get<I>(thunks), std::get<I>(slots), error)), ...);
        }

        template<typename Trusted, typename Error, typename Policy, typename... Thunks, std::size_t... I>
        Result<Trusted, Error> sanitize_fields_impl(Policy policy, std::tuple<Thunks...>& thunks, std::index_sequence<I...> indices)
        {
            std::optional<Error> error;
            std::tuple<std::optional<typename thunk_result_t<Thunks>::value_type>...> slots;

            run_fields(policy, thunks, slots, error, indices);

            if (error.has_value())
            {
                return fail(std::move(*error));
            }
            return Trusted{std::move(*std::get<I>(slots))...};
        }

        // Sanitizes every field of a variant in declaration order under the given
        // policy and reassembles Trusted from the results. Each thunk sanitizes
        // one field and returns its Result.
        template<typename Trusted, typename Error, typename Policy, typename... Thunks>
        Result<Trusted, resolved_error_t<Error, Thunks...>> sanitize_fields(Policy policy, Thunks... thunks)
        {
            static_assert(std::is_same_v<Policy, FailFast> || std::is_same_v<Policy, Harden>,
                          "unknown sanitization policy");

            std::tuple<Thunks...> fields{std::move(thunks)...};
            return sanitize_fields_impl<Trusted, resolved_error_t<Error, Thunks...>>(
                policy, fields, std::index_sequence_for<Thunks...>{});
        }
    }    // namespace detail
}    // namespace untrusted_value
