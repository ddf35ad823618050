#pragma once

#include <tokenpp/rtc_service.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ChannelKey::Token
{
    /**
     * Closed set of capability domains an AccessToken2 can carry.
     * A new domain is a new alternative providing serviceType, serviceName,
     * getServiceType() and pack(); the token builder does not change.
     */
    using Service = std::variant<RtcService>;

    std::uint16_t serviceTypeOf(Service const& service);
    std::string packService(Service const& service);

    /// Registry lookup over the alternatives of Service, keyed by the encoded type code.
    std::optional<std::string_view> serviceTypeName(std::uint16_t serviceType);
}
