#include "billboard_example.hpp"

#include <untrusted_value/format.hpp>
#include <untrusted_value/untrusted_value.hpp>

#include <cstdint>
#include <fmt/core.h>
#include <fmt/format.h>
#include <string>

using namespace untrusted_value;

// ##################################################
// A server configuration read from a file the server does not control

namespace config
{
    enum class ConfigError
    {
        privileged_port,
        empty_value,
        too_many_connections
    };

    struct NetworkConfig
    {
        std::uint16_t port;
        std::string listen_address;
    };
    UNTRUSTED_VALUE_VARIANT(NetworkConfig, NetworkConfigUntrusted, port, listen_address)

    struct DatabaseConfig
    {
        std::string url;
        std::uint32_t max_connections;
    };
    UNTRUSTED_VALUE_VARIANT_WITH(DatabaseConfig,
                                 DatabaseConfigUntrusted,
                                 (untrusted_value::VariantOptions<untrusted_value::Harden>),
                                 url,
                                 max_connections)

    struct ServerConfig
    {
        NetworkConfig network;
        DatabaseConfig database;
        bool verbose;
    };
    UNTRUSTED_VALUE_VARIANT(ServerConfig, ServerConfigUntrusted, network, database, verbose)

    ServerConfig load_from_file(bool tampered)
    {
        if (tampered)
        {
            return {{22, "0.0.0.0"}, {"", 100000}, true};
        }
        return {{8080, "0.0.0.0"}, {"postgres://localhost/app", 64}, false};
    }
}    // namespace config

namespace fmt
{
    template<>
    struct formatter<config::ConfigError> : formatter<string_view>
    {
        template<typename FormatContext>
        auto format(config::ConfigError error, FormatContext& ctx) const
        {
            string_view name = "unknown";
            switch (error)
            {
                case config::ConfigError::privileged_port:
                    name = "privileged port";
                    break;
                case config::ConfigError::empty_value:
                    name = "empty value";
                    break;
                case config::ConfigError::too_many_connections:
                    name = "too many connections";
                    break;
            }
            return formatter<string_view>::format(name, ctx);
        }
    };
}    // namespace fmt

namespace untrusted_value
{
    template<>
    struct SanitizeValue<std::uint16_t, std::uint16_t>
    {
        using Error = config::ConfigError;

        static Result<std::uint16_t, Error> sanitize_value(std::uint16_t port)
        {
            if (port < 1024)
            {
                return fail(Error::privileged_port);
            }
            return port;
        }
    };

    template<>
    struct SanitizeValue<std::uint32_t, std::uint32_t>
    {
        using Error = config::ConfigError;

        static Result<std::uint32_t, Error> sanitize_value(std::uint32_t connections)
        {
            if (connections > 1000)
            {
                return fail(Error::too_many_connections);
            }
            return connections;
        }
    };

    template<>
    struct SanitizeValue<std::string, std::string>
    {
        using Error = config::ConfigError;

        static Result<std::string, Error> sanitize_value(std::string value)
        {
            if (value.empty())
            {
                return fail(Error::empty_value);
            }
            return value;
        }
    };

    template<>
    struct SanitizeValue<bool, bool>
    {
        using Error = Infallible;

        static Result<bool, Error> sanitize_value(bool value) { return value; }
    };
}    // namespace untrusted_value

void demo_untrusted()
{
    fmt::print("### {} ###\n", __func__);

    auto absolute = [](int x) -> Result<unsigned, Infallible> { return static_cast<unsigned>(x < 0 ? -x : x); };
    auto at_least_minus_100 = [](int x) -> Result<int, std::string> {
        if (x < -100)
        {
            return fail(fmt::format("{} is below -100", x));
        }
        return x;
    };

    for (auto input : {-36, -150})
    {
        fmt::print("raw:       {}\n", input);
        fmt::print("absolute:  {}\n", Untrusted<int>{input}.sanitize_with(absolute));
        fmt::print("verified:  {}\n\n", Untrusted<int>{input}.sanitize_with(at_least_minus_100));
    }
}

void demo_maybe_untrusted()
{
    fmt::print("### {} ###\n", __func__);

    auto non_negative = verified_by([](int x) { return x >= 0; });
    for (auto from_user : {false, true})
    {
        for (auto input : {7, -7})
        {
            auto value  = MaybeUntrusted<int>::wrap(input, from_user);
            auto origin = value.is_untrusted() ? "untrusted" : "trusted";
            fmt::print("{:<9} {:>2}: {}\n", origin, input, std::move(value).sanitize_with(non_negative));
        }
    }
}

void demo_variants()
{
    fmt::print("### {} ###\n", __func__);

    auto describe = [](config::ServerConfig server) {
        return fmt::format("{}:{} -> {}", server.network.listen_address, server.network.port, server.database.url);
    };

    for (auto tampered : {false, true})
    {
        auto file   = untrusted_output(config::load_from_file);
        auto loaded = file(tampered);

        // Each section of the configuration is checked on its own.
        auto fields   = untrusted_value::to_untrusted_variant(std::move(loaded));
        auto network  = std::move(fields.network).sanitize_value();
        auto database = std::move(fields.database).sanitize_value();
        fmt::print("network:   {}\n", std::move(network).map([](config::NetworkConfig n) { return n.port; }));
        fmt::print("database:  {}\n",
                   std::move(database).map([](config::DatabaseConfig d) { return d.max_connections; }));

        // Or all at once, through the whole-struct taint.
        auto server = file(tampered).sanitize_value();
        fmt::print("server:    {}\n\n", std::move(server).map(describe));
    }
}

void demo_function_sugar()
{
    fmt::print("### {} ###\n", __func__);

    auto handle_request = untrusted_inputs([](Untrusted<std::string> user, Untrusted<int> age) {
        auto checked_age  = std::move(age).sanitize_with(verified_by([](int x) { return x >= 0 && x < 150; }));
        auto checked_user = std::move(user).sanitize_value();
        return fmt::format("user {}, age {}", checked_user, checked_age);
    });

    fmt::print("{}\n", handle_request(std::string("alice"), 31));
    fmt::print("{}\n", handle_request(std::string(""), -4));
}

int main()
{
    demo_untrusted();
    fmt::print("\n");
    demo_maybe_untrusted();
    fmt::print("\n");
    demo_variants();
    fmt::print("\n");
    demo_function_sugar();
    fmt::print("\n");
    billboard_example();
}
