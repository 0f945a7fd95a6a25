#pragma once

#include "untrusted_value/capabilities.hpp"
#include "untrusted_value/config.hpp"
#include "untrusted_value/registry.hpp"
#include "untrusted_value/result.hpp"
#include "untrusted_value/sanitize.hpp"

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace untrusted_value
{
    template<typename T, typename... Capabilities>
    class Untrusted;

    // Spreads a whole-struct taint over the fields of the struct's variant.
    template<typename S, typename... Capabilities>
        requires HasUntrustedVariant<S>
    untrusted_variant_t<S> to_untrusted_variant(Untrusted<S, Capabilities...>&& value);

    namespace detail
    {
        struct FieldList
        {
        };

        // Rebuilds a whole-struct taint from the fields of its variant.
        template<typename Trusted, typename... Fields>
        Untrusted<Trusted> collapse_variant(FieldList, Fields&&... fields);
    }    // namespace detail

    // A value an attacker may control, in whole or in part.
    //
    // The value can only be read back through sanitize_with(), sanitize_value()
    // or, when enabled, use_untrusted_value(). Each of them consumes the
    // wrapper. Nothing of T is forwarded: no formatting, no ordering, no
    // arithmetic. Copying and comparing are granted per type through the
    // Copy and Equality capabilities.
    template<typename T, typename... Capabilities>
    class Untrusted
    {
        static_assert(std::is_object_v<T> && !std::is_array_v<T> && !std::is_const_v<T> && !std::is_volatile_v<T>,
                      "Untrusted<T> wraps a non-const, non-array object type");

    public:
        using value_type = T;

        template<typename U = T>
            requires(std::is_constructible_v<T, U &&> && !std::is_same_v<std::remove_cvref_t<U>, std::in_place_t> &&
                     !std::is_same_v<std::remove_cvref_t<U>, Untrusted>)
        explicit(!std::is_convertible_v<U&&, T>) Untrusted(U&& value) : m_value(std::forward<U>(value))
        {
        }

        template<typename... Args>
            requires std::is_constructible_v<T, Args&&...>
        explicit Untrusted(std::in_place_t, Args&&... args) : m_value(std::forward<Args>(args)...)
        {
        }

        // The converted value stays tainted. Capabilities can be dropped on the
        // way, never gained.
        template<typename U, typename... Other>
            requires(!std::is_same_v<Untrusted<U, Other...>, Untrusted> && std::is_constructible_v<T, U &&> &&
                     has_capabilities_v<CapabilityList<Capabilities...>, Other...>)
        explicit(!std::is_convertible_v<U&&, T>) Untrusted(Untrusted<U, Other...>&& other)
            : m_value(std::move(other.m_value))
        {
        }

        static Untrusted wrap(T value) { return Untrusted(std::move(value)); }

        Untrusted(const Untrusted&)
            requires has_capability_v<Copy, Capabilities...>
        = default;
        Untrusted& operator=(const Untrusted&)
            requires has_capability_v<Copy, Capabilities...>
        = default;

        Untrusted(Untrusted&&)            = default;
        Untrusted& operator=(Untrusted&&) = default;

        friend bool operator==(const Untrusted& lhs, const Untrusted& rhs)
            requires(has_capability_v<Equality, Capabilities...> && std::equality_comparable<T>)
        {
            return lhs.m_value == rhs.m_value;
        }

        // No comparison against anything else, bare values included.
        template<typename U>
            requires(!std::is_same_v<U, Untrusted>)
        friend bool operator==(const Untrusted&, const U&) = delete;

        // Hands the value to the sanitizer and returns its verdict.
        // The sanitizer may produce a different type.
        template<typename F>
            requires Sanitizer<F, T>
        std::invoke_result_t<F, T&&> sanitize_with(F&& sanitizer) &&
        {
            return std::invoke(std::forward<F>(sanitizer), std::move(m_value));
        }

        // Runs the sanitizer registered for (T, Trusted) through SanitizeValue.
        template<typename Trusted = T>
            requires SanitizableTo<Untrusted, Trusted>
        auto sanitize_value() &&
        {
            return SanitizeValue<Untrusted, Trusted>::sanitize_value(std::move(*this));
        }

#if UNTRUSTED_VALUE_ALLOW_USAGE_WITHOUT_SANITIZATION
        // Clears the taint without any sanitization.
        // The returned value may be controlled by an attacker: handle with care.
        T use_untrusted_value() && { return std::move(m_value); }
#endif

    private:
        template<typename, typename...>
        friend class Untrusted;

        template<typename S, typename... Other>
            requires HasUntrustedVariant<S>
        friend untrusted_variant_t<S> to_untrusted_variant(Untrusted<S, Other...>&& value);

        template<typename Trusted, typename... Fields>
        friend Untrusted<Trusted> detail::collapse_variant(detail::FieldList, Fields&&... fields);

        T m_value;
    };

    template<typename T>
    inline constexpr bool is_untrusted_v = false;

    template<typename T, typename... Capabilities>
    inline constexpr bool is_untrusted_v<Untrusted<T, Capabilities...>> = true;

    template<typename Trusted, typename T, typename... Capabilities>
        requires detail::SanitizableInner<T, Trusted>
    struct SanitizeValue<Untrusted<T, Capabilities...>, Trusted>
    {
        static auto sanitize_value(Untrusted<T, Capabilities...> value)
        {
            return std::move(value).sanitize_with(
                [](T&& inner) { return detail::sanitize_inner<Trusted>(std::move(inner)); });
        }
    };

    template<typename S, typename... Capabilities>
        requires HasUntrustedVariant<S>
    untrusted_variant_t<S> to_untrusted_variant(Untrusted<S, Capabilities...>&& value)
    {
        return to_untrusted_variant(std::move(value.m_value));
    }
}    // namespace untrusted_value
