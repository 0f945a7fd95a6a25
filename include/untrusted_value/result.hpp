#pragma once

#include <concepts>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace untrusted_value
{
    // Error type of sanitizers that cannot fail.
    struct Infallible
    {
        friend bool operator==(const Infallible&, const Infallible&) = default;
    };

    // Tags an error so that Result<T, E> can be built from it even when T == E.
    template<typename E>
    struct Failure
    {
        E error;
    };

    template<typename E>
    Failure<std::decay_t<E>> fail(E&& error)
    {
        return Failure<std::decay_t<E>>{std::forward<E>(error)};
    }

    // Thrown when the wrong alternative of a Result is accessed. An expected
    // sanitization failure is never reported this way.
    struct BadResultAccess : std::logic_error
    {
        using std::logic_error::logic_error;
    };

    template<typename T, typename E>
    class Result;

    template<typename T>
    inline constexpr bool is_result_v = false;

    template<typename T, typename E>
    inline constexpr bool is_result_v<Result<T, E>> = true;

    template<typename T>
    inline constexpr bool is_failure_v = false;

    template<typename E>
    inline constexpr bool is_failure_v<Failure<E>> = true;

    template<typename T>
    concept ResultType = is_result_v<std::remove_cvref_t<T>>;

    // Outcome of a sanitization: either the trusted value or the error reported
    // by the sanitizer.
    template<typename T, typename E>
    class Result
    {
    public:
        using value_type = T;
        using error_type = E;

        template<typename U = T>
            requires(std::is_constructible_v<T, U &&> && !is_result_v<std::remove_cvref_t<U>> &&
                     !is_failure_v<std::remove_cvref_t<U>>)
        explicit(!std::is_convertible_v<U&&, T>) Result(U&& value)
            : m_storage{std::in_place_index<0>, std::forward<U>(value)}
        {
        }

        template<typename U>
            requires std::is_constructible_v<E, U &&>
        Result(Failure<U> failure) : m_storage{std::in_place_index<1>, std::move(failure.error)}
        {
        }

        bool has_value() const noexcept { return m_storage.index() == 0; }
        explicit operator bool() const noexcept { return has_value(); }

        T& value() &
        {
            check_value();
            return std::get<0>(m_storage);
        }
        const T& value() const&
        {
            check_value();
            return std::get<0>(m_storage);
        }
        T&& value() &&
        {
            check_value();
            return std::get<0>(std::move(m_storage));
        }

        E& error() &
        {
            check_error();
            return std::get<1>(m_storage);
        }
        const E& error() const&
        {
            check_error();
            return std::get<1>(m_storage);
        }
        E&& error() &&
        {
            check_error();
            return std::get<1>(std::move(m_storage));
        }

        template<typename U>
        T value_or(U&& fallback) &&
        {
            if (has_value())
            {
                return std::get<0>(std::move(m_storage));
            }
            return static_cast<T>(std::forward<U>(fallback));
        }

        // Transforms the value, keeps the error.
        template<typename F>
        auto map(F&& f) && -> Result<std::invoke_result_t<F, T&&>, E>
        {
            if (has_value())
            {
                return std::invoke(std::forward<F>(f), std::get<0>(std::move(m_storage)));
            }
            return fail(std::get<1>(std::move(m_storage)));
        }

        // Transforms the error, keeps the value.
        template<typename F>
        auto map_error(F&& f) && -> Result<T, std::invoke_result_t<F, E&&>>
        {
            if (has_value())
            {
                return std::get<0>(std::move(m_storage));
            }
            return fail(std::invoke(std::forward<F>(f), std::get<1>(std::move(m_storage))));
        }

        // Chains another fallible step sharing the same error type.
        template<typename F>
            requires ResultType<std::invoke_result_t<F, T&&>>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&>
        {
            if (has_value())
            {
                return std::invoke(std::forward<F>(f), std::get<0>(std::move(m_storage)));
            }
            return fail(std::get<1>(std::move(m_storage)));
        }

        friend bool operator==(const Result&, const Result&) = default;

        // R is deduced so that nothing converts into a Result on the way.
        template<typename R, typename U>
            requires(std::same_as<R, Result> && !is_result_v<U> && !is_failure_v<U> &&
                     requires(const T& lhs, const U& rhs) {
                         { lhs == rhs } -> std::convertible_to<bool>;
                     })
        friend bool operator==(const R& result, const U& value)
        {
            return result.has_value() && std::get<0>(result.m_storage) == value;
        }

    private:
        void check_value() const
        {
            if (!has_value())
            {
                throw BadResultAccess{"value() called on a failed Result"};
            }
        }

        void check_error() const
        {
            if (has_value())
            {
                throw BadResultAccess{"error() called on a successful Result"};
            }
        }

        std::variant<T, E> m_storage;
    };

    // A callable turning a T into a Result.
    template<typename F, typename T>
    concept Sanitizer = std::invocable<F, T&&> && ResultType<std::invoke_result_t<F, T&&>>;
}    // namespace untrusted_value
