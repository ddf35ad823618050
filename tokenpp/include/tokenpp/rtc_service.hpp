#pragma once

#include <tokenpp/privileges.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace ChannelKey::Token
{
    /**
     * Real-time audio/video capability of an AccessToken2.
     * Packs as serviceType:u16, channelName, account, privileges.
     */
    class RtcService
    {
      public:
        constexpr static std::uint16_t serviceType = 1;
        constexpr static std::string_view serviceName = "rtc";

        RtcService(std::string channelName, std::string account, PrivilegeGrantSet privileges = {});

        void addPrivilege(Privilege privilege, std::uint32_t expiry);

        std::uint16_t getServiceType() const;
        std::string const& channelName() const;
        std::string const& account() const;
        PrivilegeGrantSet const& privileges() const;

        std::string pack() const;

      private:
        std::string channelName_;
        std::string account_;
        PrivilegeGrantSet privileges_;
    };
}
