#pragma once

#include <type_traits>

namespace untrusted_value
{
    // Capabilities a tainted value may be granted. None is granted implicitly:
    // an untrusted value is neither copyable nor comparable unless asked for.

    // Allows duplicating the tainted value. The copy stays tainted.
    struct Copy
    {
    };

    // Allows comparing two tainted values of the same type with each other.
    struct Equality
    {
    };

    template<typename Capability, typename... Capabilities>
    inline constexpr bool has_capability_v = (std::is_same_v<Capability, Capabilities> || ...);

    template<typename... Capabilities>
    struct CapabilityList
    {
    };

    template<typename Required, typename... Capabilities>
    inline constexpr bool has_capabilities_v = false;

    // True if every capability in Required is among Capabilities.
    template<typename... Required, typename... Capabilities>
    inline constexpr bool has_capabilities_v<CapabilityList<Required...>, Capabilities...> =
        (has_capability_v<Required, Capabilities...> && ...);
}    // namespace untrusted_value
