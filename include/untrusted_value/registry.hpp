#pragma once

#include <concepts>
#include <type_traits>

namespace untrusted_value
{
    template<typename T>
    struct type_tag
    {
    };

    // A trusted struct S registers its untrusted variant by declaring, in S's
    // own namespace,
    //
    //     SUntrusted untrusted_variant_of(untrusted_value::type_tag<S>);
    //
    // The declaration is found by argument dependent lookup and never called.
    // Register right after the variant is defined, before the first use.
    template<typename T>
    concept HasUntrustedVariant = requires { untrusted_variant_of(type_tag<T>{}); };

    template<typename T>
        requires HasUntrustedVariant<T>
    using untrusted_variant_t = decltype(untrusted_variant_of(type_tag<T>{}));

    template<typename V>
    concept UntrustedVariantType = requires { typename V::trusted_type; } &&
                                   HasUntrustedVariant<typename V::trusted_type> &&
                                   std::same_as<untrusted_variant_t<typename V::trusted_type>, V>;

    // Variants registered with the Leaf option are treated as plain values when
    // they appear as a field of another struct.
    template<typename V>
    inline constexpr bool is_leaf_variant_v = false;

    template<typename V>
        requires requires { V::options::is_leaf; }
    inline constexpr bool is_leaf_variant_v<V> = V::options::is_leaf;
}    // namespace untrusted_value
