#pragma once

#include "untrusted_value/config.hpp"
#include "untrusted_value/result.hpp"
#include "untrusted_value/sanitize.hpp"
#include "untrusted_value/untrusted.hpp"

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

namespace untrusted_value
{
    // A value whose provenance is only known at runtime: either trusted or
    // tainted. Both alternatives pass through the same sanitizer, so code
    // handling it does not depend on where the value came from.
    template<typename T, typename... Capabilities>
    class MaybeUntrusted
    {
    public:
        using value_type     = T;
        using untrusted_type = Untrusted<T, Capabilities...>;

        MaybeUntrusted(untrusted_type value) : m_value{std::in_place_index<1>, std::move(value)} {}

        static MaybeUntrusted trusted(T value) { return MaybeUntrusted{std::in_place_index<0>, std::move(value)}; }
        static MaybeUntrusted untrusted(T value) { return MaybeUntrusted{untrusted_type{std::move(value)}}; }

        // Wraps the value as untrusted or trusted according to the flag.
        static MaybeUntrusted wrap(T value, bool is_untrusted)
        {
            if (is_untrusted)
            {
                return untrusted(std::move(value));
            }
            return trusted(std::move(value));
        }

        bool is_untrusted() const noexcept { return m_value.index() == 1; }
        bool is_trusted() const noexcept { return !is_untrusted(); }

        // Runs the sanitizer on the value, whichever alternative holds it.
        template<typename F>
            requires Sanitizer<F, T>
        std::invoke_result_t<F, T&&> sanitize_with(F&& sanitizer) &&
        {
            if (is_untrusted())
            {
                return std::get<1>(std::move(m_value)).sanitize_with(std::forward<F>(sanitizer));
            }
            return std::invoke(std::forward<F>(sanitizer), std::get<0>(std::move(m_value)));
        }

        template<typename Trusted = T>
            requires SanitizableTo<MaybeUntrusted, Trusted>
        auto sanitize_value() &&
        {
            return SanitizeValue<MaybeUntrusted, Trusted>::sanitize_value(std::move(*this));
        }

#if UNTRUSTED_VALUE_ALLOW_USAGE_WITHOUT_SANITIZATION
        // Clears the taint without any sanitization, see Untrusted::use_untrusted_value().
        T use_untrusted_value() &&
        {
            if (is_untrusted())
            {
                return std::get<1>(std::move(m_value)).use_untrusted_value();
            }
            return std::get<0>(std::move(m_value));
        }
#endif

        friend bool operator==(const MaybeUntrusted& lhs, const MaybeUntrusted& rhs)
            requires(std::equality_comparable<untrusted_type> && std::equality_comparable<T>)
        {
            return lhs.m_value == rhs.m_value;
        }

    private:
        template<std::size_t I, typename U>
        MaybeUntrusted(std::in_place_index_t<I> index, U&& value) : m_value{index, std::forward<U>(value)}
        {
        }

        std::variant<T, untrusted_type> m_value;
    };

    template<typename T>
    inline constexpr bool is_maybe_untrusted_v = false;

    template<typename T, typename... Capabilities>
    inline constexpr bool is_maybe_untrusted_v<MaybeUntrusted<T, Capabilities...>> = true;

    template<typename Trusted, typename T, typename... Capabilities>
        requires detail::SanitizableInner<T, Trusted>
    struct SanitizeValue<MaybeUntrusted<T, Capabilities...>, Trusted>
    {
        static auto sanitize_value(MaybeUntrusted<T, Capabilities...> value)
        {
            return std::move(value).sanitize_with(
                [](T&& inner) { return detail::sanitize_inner<Trusted>(std::move(inner)); });
        }
    };
}    // namespace untrusted_value
