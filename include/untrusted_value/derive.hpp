#pragma once

#include "untrusted_value/config.hpp"
#include "untrusted_value/variant.hpp"

#if UNTRUSTED_VALUE_DERIVE

#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

// Generates the untrusted variant of an aggregate struct.
//
//     struct NetworkConfig
//     {
//         std::uint32_t port;
//         std::string listen_address;
//     };
//     UNTRUSTED_VALUE_VARIANT(NetworkConfig, NetworkConfigUntrusted, port, listen_address)
//
// defines, in the current namespace,
//
//     struct NetworkConfigUntrusted
//     {
//         untrusted_value::Untrusted<std::uint32_t> port;
//         untrusted_value::Untrusted<std::string> listen_address;
//         ...
//     };
//
// registers it as the variant of NetworkConfig and adds to_untrusted_variant(NetworkConfig).
// A field whose type has a variant of its own gets that variant instead of
// Untrusted<T>. Every field must be listed, in declaration order.
//
// Use it at namespace scope, after the variants of all nested structs.
#define UNTRUSTED_VALUE_VARIANT(Name, VariantName, ...)                                                             \
    UNTRUSTED_VALUE_VARIANT_WITH(Name, VariantName, (::untrusted_value::VariantOptions<>)__VA_OPT__(, ) __VA_ARGS__)

// Same as UNTRUSTED_VALUE_VARIANT with a parenthesized VariantOptions type:
//
//     UNTRUSTED_VALUE_VARIANT_WITH(NetworkConfig, NetworkConfigUntrusted,
//                                  (untrusted_value::VariantOptions<untrusted_value::Derive<untrusted_value::Copy>,
//                                                                   untrusted_value::Harden>),
//                                  port, listen_address)
#define UNTRUSTED_VALUE_VARIANT_WITH(Name, VariantName, Options, ...)                                               \
    struct VariantName                                                                                              \
    {                                                                                                               \
        using trusted_type = Name;                                                                                  \
        using variant_type = VariantName;                                                                           \
        using options      = typename ::untrusted_value::detail::Unparenthesize<void Options>::type;                \
                                                                                                                    \
        static constexpr std::size_t field_count = 0 UNTRUSTED_VALUE_DETAIL_FOR_EACH(                               \
            UNTRUSTED_VALUE_DETAIL_COUNT_FIELD __VA_OPT__(, ) __VA_ARGS__);                                         \
        static constexpr std::array<std::string_view, field_count> field_names{UNTRUSTED_VALUE_DETAIL_FOR_EACH(     \
            UNTRUSTED_VALUE_DETAIL_NAME_FIELD __VA_OPT__(, ) __VA_ARGS__)};                                         \
                                                                                                                    \
        static_assert(::untrusted_value::detail::lists_every_field_v<trusted_type, field_count>,                    \
                      "every field of " #Name " must be listed in its untrusted variant");                          \
        static_assert(sizeof(trusted_type{UNTRUSTED_VALUE_DETAIL_FOR_EACH(                                          \
                          UNTRUSTED_VALUE_DETAIL_DESIGNATE_FIELD __VA_OPT__(, ) __VA_ARGS__)}) > 0,                 \
                      "fields of " #Name " must be listed in declaration order");                                   \
                                                                                                                    \
        UNTRUSTED_VALUE_DETAIL_FOR_EACH(UNTRUSTED_VALUE_DETAIL_DECLARE_FIELD __VA_OPT__(, ) __VA_ARGS__)            \
                                                                                                                    \
        static VariantName from_trusted_variant(Name value)                                                         \
        {                                                                                                           \
            return VariantName{UNTRUSTED_VALUE_DETAIL_FOR_EACH(UNTRUSTED_VALUE_DETAIL_WRAP_FIELD __VA_OPT__(, )     \
                                                                   __VA_ARGS__)};                                   \
        }                                                                                                           \
                                                                                                                    \
        template<typename Sanitizer>                                                                                \
        auto sanitize_with(Sanitizer&& sanitizer) &&                                                                \
        {                                                                                                           \
            return ::untrusted_value::detail::sanitize_variant_with(std::move(*this),                               \
                                                                    std::forward<Sanitizer>(sanitizer));            \
        }                                                                                                           \
                                                                                                                    \
        template<typename Error = void>                                                                             \
        auto sanitize_value() &&                                                                                    \
        {                                                                                                           \
            return ::untrusted_value::detail::sanitize_fields<trusted_type, Error>(                                 \
                typename options::policy{} UNTRUSTED_VALUE_DETAIL_FOR_EACH(                                         \
                    UNTRUSTED_VALUE_DETAIL_FIELD_THUNK __VA_OPT__(, ) __VA_ARGS__));                                \
        }                                                                                                           \
                                                                                                                    \
        ::untrusted_value::Untrusted<trusted_type> into_untrusted() &&                                              \
        {                                                                                                           \
            return ::untrusted_value::detail::collapse_variant<trusted_type>(                                       \
                ::untrusted_value::detail::FieldList{} UNTRUSTED_VALUE_DETAIL_FOR_EACH(                             \
                    UNTRUSTED_VALUE_DETAIL_MOVE_FIELD __VA_OPT__(, ) __VA_ARGS__));                                 \
        }                                                                                                           \
                                                                                                                    \
        template<typename Self>                                                                                     \
            requires(std::is_same_v<Self, VariantName> &&                                                           \
                     options::derive::template grants<::untrusted_value::Equality>)                                 \
        friend bool operator==(const Self& lhs, const Self& rhs)                                                    \
        {                                                                                                           \
            return true UNTRUSTED_VALUE_DETAIL_FOR_EACH(UNTRUSTED_VALUE_DETAIL_COMPARE_FIELD __VA_OPT__(, )         \
                                                        __VA_ARGS__);                                               \
        }                                                                                                           \
    };                                                                                                              \
                                                                                                                    \
    VariantName untrusted_variant_of(::untrusted_value::type_tag<Name>);                                            \
                                                                                                                    \
    inline VariantName to_untrusted_variant(Name value)                                                             \
    {                                                                                                               \
        return VariantName::from_trusted_variant(std::move(value));                                                 \
    }

#define UNTRUSTED_VALUE_DETAIL_COUNT_FIELD(field) +1
#define UNTRUSTED_VALUE_DETAIL_NAME_FIELD(field) #field,
#define UNTRUSTED_VALUE_DETAIL_DESIGNATE_FIELD(field) .field = std::declval<decltype(trusted_type::field)>(),
#define UNTRUSTED_VALUE_DETAIL_DECLARE_FIELD(field)                                                                 \
    ::untrusted_value::variant_field_for_t<options, decltype(trusted_type::field)> field;
#define UNTRUSTED_VALUE_DETAIL_FIELD_THUNK(field)                                                                   \
    , [this] {                                                                                                      \
        return ::untrusted_value::detail::sanitize_field<decltype(trusted_type::field), Error>(                     \
            std::move(this->field));                                                                                \
    }
#define UNTRUSTED_VALUE_DETAIL_MOVE_FIELD(field) , std::move(this->field)
#define UNTRUSTED_VALUE_DETAIL_WRAP_FIELD(field)                                                                    \
    .field = ::untrusted_value::detail::into_variant_field<decltype(variant_type::field)>(std::move(value.field)),
#define UNTRUSTED_VALUE_DETAIL_COMPARE_FIELD(field) &&lhs.field == rhs.field

// Applies macro to every argument. Supports up to 64 arguments.
#define UNTRUSTED_VALUE_DETAIL_FOR_EACH(macro, ...)                                                                 \
    __VA_OPT__(UNTRUSTED_VALUE_DETAIL_EXPAND(UNTRUSTED_VALUE_DETAIL_FOR_EACH_HELPER(macro, __VA_ARGS__)))
#define UNTRUSTED_VALUE_DETAIL_FOR_EACH_HELPER(macro, first, ...)                                                   \
    macro(first) __VA_OPT__(UNTRUSTED_VALUE_DETAIL_FOR_EACH_AGAIN UNTRUSTED_VALUE_DETAIL_PARENS(macro, __VA_ARGS__))
#define UNTRUSTED_VALUE_DETAIL_FOR_EACH_AGAIN() UNTRUSTED_VALUE_DETAIL_FOR_EACH_HELPER
#define UNTRUSTED_VALUE_DETAIL_PARENS ()

#define UNTRUSTED_VALUE_DETAIL_EXPAND(...)                                                                          \
    UNTRUSTED_VALUE_DETAIL_EXPAND4(UNTRUSTED_VALUE_DETAIL_EXPAND4(                                                  \
        UNTRUSTED_VALUE_DETAIL_EXPAND4(UNTRUSTED_VALUE_DETAIL_EXPAND4(__VA_ARGS__))))
#define UNTRUSTED_VALUE_DETAIL_EXPAND4(...)                                                                         \
    UNTRUSTED_VALUE_DETAIL_EXPAND3(UNTRUSTED_VALUE_DETAIL_EXPAND3(                                                  \
        UNTRUSTED_VALUE_DETAIL_EXPAND3(UNTRUSTED_VALUE_DETAIL_EXPAND3(__VA_ARGS__))))
#define UNTRUSTED_VALUE_DETAIL_EXPAND3(...)                                                                         \
    UNTRUSTED_VALUE_DETAIL_EXPAND2(UNTRUSTED_VALUE_DETAIL_EXPAND2(                                                  \
        UNTRUSTED_VALUE_DETAIL_EXPAND2(UNTRUSTED_VALUE_DETAIL_EXPAND2(__VA_ARGS__))))
#define UNTRUSTED_VALUE_DETAIL_EXPAND2(...) __VA_ARGS__

#endif
