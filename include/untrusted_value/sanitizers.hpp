#pragma once

#include "untrusted_value/result.hpp"

#include <functional>
#include <type_traits>
#include <utility>

namespace untrusted_value
{
    // Error of verified_by(): the predicate rejected the value.
    struct VerificationFailed
    {
        friend bool operator==(const VerificationFailed&, const VerificationFailed&) = default;
    };

    // Passes the value on unchanged if the predicate accepts it.
    //
    //     auto message = std::move(command.message).sanitize_with(verified_by(is_friendly));
    template<typename Predicate>
    auto verified_by(Predicate predicate)
    {
        return [predicate = std::move(predicate)]<typename T>(T&& value) -> Result<std::remove_cvref_t<T>, VerificationFailed> {
            if (std::invoke(predicate, std::as_const(value)))
            {
                return std::forward<T>(value);
            }
            return fail(VerificationFailed{});
        };
    }

    // Turns a transformation that accepts every input, e.g. clamping a length,
    // into a sanitizer that never fails.
    template<typename F>
    auto infallible(F transform)
    {
        return [transform = std::move(transform)]<typename T>(T&& value)
                   -> Result<std::remove_cvref_t<std::invoke_result_t<const F&, T&&>>, Infallible> {
            return std::invoke(transform, std::forward<T>(value));
        };
    }

    // Accepts every value as it is.
    inline auto pass_through()
    {
        return []<typename T>(T&& value) -> Result<std::remove_cvref_t<T>, Infallible> { return std::forward<T>(value); };
    }
}    // namespace untrusted_value
