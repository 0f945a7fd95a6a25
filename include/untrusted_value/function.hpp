#pragma once

#include "untrusted_value/untrusted.hpp"

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace untrusted_value
{
    namespace detail
    {
        // An argument is wrapped unless it is tainted already.
        template<typename Arg>
        using tainted_argument_t =
            std::conditional_t<is_untrusted_v<std::remove_cvref_t<Arg>>, Arg&&, Untrusted<std::decay_t<Arg>>>;

        template<typename Arg>
        tainted_argument_t<Arg> taint_argument(Arg&& arg)
        {
            return static_cast<tainted_argument_t<Arg>>(std::forward<Arg>(arg));
        }

        template<typename R>
        using tainted_result_t =
            std::conditional_t<is_untrusted_v<std::remove_cvref_t<R>>, std::remove_cvref_t<R>, Untrusted<std::remove_cvref_t<R>>>;
    }    // namespace detail

    // Calls F with every argument wrapped in Untrusted.
    template<typename F>
    class UntrustedInputs
    {
    public:
        explicit UntrustedInputs(F function) : m_function(std::move(function)) {}

        template<typename... Args>
            requires std::invocable<F&, detail::tainted_argument_t<Args>...>
        decltype(auto) operator()(Args&&... args)
        {
            return std::invoke(m_function, detail::taint_argument(std::forward<Args>(args))...);
        }

        template<typename... Args>
            requires std::invocable<const F&, detail::tainted_argument_t<Args>...>
        decltype(auto) operator()(Args&&... args) const
        {
            return std::invoke(m_function, detail::taint_argument(std::forward<Args>(args))...);
        }

    private:
        F m_function;
    };

    // Calls F and wraps its result in Untrusted.
    template<typename F>
    class UntrustedOutput
    {
    public:
        explicit UntrustedOutput(F function) : m_function(std::move(function)) {}

        template<typename... Args>
            requires std::invocable<F&, Args&&...>
        auto operator()(Args&&... args)
        {
            return taint(m_function, std::forward<Args>(args)...);
        }

        template<typename... Args>
            requires std::invocable<const F&, Args&&...>
        auto operator()(Args&&... args) const
        {
            return taint(m_function, std::forward<Args>(args)...);
        }

    private:
        template<typename Function, typename... Args>
        static auto taint(Function& function, Args&&... args)
        {
            using R = std::invoke_result_t<Function&, Args&&...>;
            static_assert(!std::is_void_v<R>, "untrusted_output() needs a function returning a value");

            return detail::tainted_result_t<R>(std::invoke(function, std::forward<Args>(args)...));
        }

        F m_function;
    };

    // Wraps every argument of f in Untrusted before calling it. Arguments that
    // are Untrusted already are passed on as they are.
    //
    //     auto handler = untrusted_inputs([](Untrusted<std::string> name, Untrusted<int> age) { ... });
    //     handler(request.name, request.age);
    template<typename F>
    UntrustedInputs<std::decay_t<F>> untrusted_inputs(F&& function)
    {
        return UntrustedInputs<std::decay_t<F>>(std::forward<F>(function));
    }

    // Wraps the result of f in Untrusted, unless it is Untrusted already.
    template<typename F>
    UntrustedOutput<std::decay_t<F>> untrusted_output(F&& function)
    {
        return UntrustedOutput<std::decay_t<F>>(std::forward<F>(function));
    }

    // untrusted_output(f) when Enabled, f itself otherwise. Meant to be driven
    // by a build flag.
    template<bool Enabled, typename F>
    auto untrusted_output_if(F&& function)
    {
        if constexpr (Enabled)
        {
            return untrusted_output(std::forward<F>(function));
        }
        else
        {
            return std::decay_t<F>(std::forward<F>(function));
        }
    }
}    // namespace untrusted_value
