#include "billboard_example.hpp"

#include <untrusted_value/format.hpp>
#include <untrusted_value/untrusted_value.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <fmt/core.h>
#include <fmt/format.h>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

using namespace untrusted_value;

// ##################################################
// The API struct, and its untrusted variant used by the firmware

namespace api
{
    enum class Status
    {
        waiting,
        accepted,
        rejected
    };

    struct ShowMessageCommand
    {
        const char* message;    // [input]  text to display
        std::size_t length;     // [input]  length of text to display
        Status* status;         // [output] reports status to user
    };

    // Every field is checked even when an earlier one is already rejected.
    UNTRUSTED_VALUE_VARIANT_WITH(ShowMessageCommand,
                                 ShowMessageCommandUntrusted,
                                 (untrusted_value::VariantOptions<untrusted_value::Harden>),
                                 message,
                                 length,
                                 status)
}    // namespace api

// Helper to pretty-print the status enum
namespace fmt
{
    template<>
    struct formatter<api::Status> : formatter<string_view>
    {
        template<typename FormatContext>
        auto format(api::Status status, FormatContext& ctx) const
        {
            string_view name = "unknown";
            switch (status)
            {
                case api::Status::waiting:
                    name = "waiting";
                    break;
                case api::Status::accepted:
                    name = "accepted";
                    break;
                case api::Status::rejected:
                    name = "rejected";
                    break;
            }
            return formatter<string_view>::format(name, ctx);
        }
    };
}    // namespace fmt

#define RED "\33[0;31m"
#define GREEN "\33[0;32m"
#define COLOR_RESET "\33[0m"

namespace shared_memory
{
    namespace
    {
        std::byte* m_ptr;
    }

    template<typename T>
    T deserialize()
    {
        static_assert(std::is_trivially_copyable_v<T>);

        T value;
        std::memcpy(&value, m_ptr, sizeof(T));
        return value;
    }

    void send(void* ptr) { m_ptr = reinterpret_cast<std::byte*>(ptr); }
}    // namespace shared_memory

// ##################################################
// The following helpers emulate the internals of the billboard firmware

namespace
{
    const char* wifi_password = RED "nobody_will_ever_guess_this_pw" COLOR_RESET;

    bool is_friendly(std::string_view text) { return text.find("sucks") == std::string_view::npos; }

    std::size_t truncate_to_max_text_length(std::size_t length) { return std::min<std::size_t>(length, 50); }

    bool is_in_shared_memory(const void* ptr) { return ptr != wifi_password; }

    std::function<void(void)> timed_exploit;

    void update_statistics(api::Status status)
    {
        fmt::print("  Decision: {}\n", status);
        // this is the point in time where the attacker would strike
        if (timed_exploit)
        {
            timed_exploit();
        }
    }

    void show_on_billboard(const std::string& text) { fmt::print("  Billboard: \"{}\"\n", text); }
}    // namespace

// ##################################################
// Sanitizers of the command fields

namespace untrusted_value
{
    template<>
    struct SanitizeValue<const char*, const char*>
    {
        using Error = VerificationFailed;

        static Result<const char*, Error> sanitize_value(const char* message)
        {
            return verified_by([](const char* ptr) { return is_in_shared_memory(ptr); })(message);
        }
    };

    template<>
    struct SanitizeValue<std::size_t, std::size_t>
    {
        using Error = Infallible;

        static Result<std::size_t, Error> sanitize_value(std::size_t length)
        {
            return infallible(truncate_to_max_text_length)(length);
        }
    };

    template<>
    struct SanitizeValue<api::Status*, api::Status*>
    {
        using Error = VerificationFailed;

        static Result<api::Status*, Error> sanitize_value(api::Status* status)
        {
            return verified_by([](api::Status* ptr) { return ptr != nullptr && is_in_shared_memory(ptr); })(status);
        }
    };
}    // namespace untrusted_value

namespace
{
    using namespace api;

    // Friendly Billboard Firmware
    void process_message_command(Untrusted<std::string> message, Status& status)
    {
        auto verified = std::move(message).sanitize_with(verified_by(is_friendly));
        status        = verified.has_value() ? Status::accepted : Status::rejected;
        update_statistics(status);
        if (status == Status::accepted)
        {
            show_on_billboard(verified.value());
        }
    }

    void receiver()
    {
        auto received = to_untrusted_variant(shared_memory::deserialize<ShowMessageCommand>());
        auto command  = std::move(received).sanitize_value();
        if (!command)
        {
            fmt::print("  Command dropped: {}\n", command.error());
            return;
        }

        // The text is copied out of the shared memory before it is checked.
        std::string_view text{command.value().message};
        Untrusted<std::string> message{std::in_place, text.substr(0, command.value().length)};
        process_message_command(std::move(message), *command.value().status);
    }

    void try_to_exploit()
    {
#define GOOD_MESSAGE (GREEN "C++ rocks!" COLOR_RESET)
#define BAD_MESSAGE (RED "C++ sucks!" COLOR_RESET)
        timed_exploit = {};
        fmt::print("Sending good message:\n");
        {
            Status status = Status::waiting;
            ShowMessageCommand command{GOOD_MESSAGE, std::strlen(GOOD_MESSAGE), &status};
            shared_memory::send(&command);
            receiver();
        }
        fmt::print("\n");
        fmt::print("Sending unfriendly message:\n");
        {
            Status status = Status::waiting;
            ShowMessageCommand command{BAD_MESSAGE, std::strlen(BAD_MESSAGE), &status};
            shared_memory::send(&command);
            receiver();
        }
        fmt::print("\n");
        fmt::print("Exploit: manipulated message pointer\n");
        {
            Status status = Status::waiting;
            ShowMessageCommand command{wifi_password, 1000, &status};
            shared_memory::send(&command);
            receiver();
            fmt::print("  Status: {}\n", status);
        }
        fmt::print("\n");
        fmt::print("Exploit: message TOCTOU\n");
        {
            char message[] = GOOD_MESSAGE;
            Status status  = Status::waiting;
            ShowMessageCommand command{message, std::strlen(message), &status};
            timed_exploit = [&]() { std::memcpy(message, BAD_MESSAGE, sizeof(BAD_MESSAGE)); };
            shared_memory::send(&command);
            receiver();
        }
        fmt::print("\n");
        timed_exploit = {};
#undef GOOD_MESSAGE
#undef BAD_MESSAGE
    }
}    // namespace

void billboard_example()
{
    fmt::print("######################\n{}\n\n", __func__);
    try_to_exploit();
}
