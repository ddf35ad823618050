#include <tokenpp/rtc_service.hpp>
#include <tokenpp/byte_writer.hpp>

#include <utility>

namespace ChannelKey::Token
{
    //#####################################################################################################################
    RtcService::RtcService(std::string channelName, std::string account, PrivilegeGrantSet privileges)
        : channelName_{std::move(channelName)}
        , account_{std::move(account)}
        , privileges_{std::move(privileges)}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    void RtcService::addPrivilege(Privilege privilege, std::uint32_t expiry)
    {
        privileges_.add(privilege, expiry);
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::uint16_t RtcService::getServiceType() const
    {
        return serviceType;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string const& RtcService::channelName() const
    {
        return channelName_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string const& RtcService::account() const
    {
        return account_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    PrivilegeGrantSet const& RtcService::privileges() const
    {
        return privileges_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string RtcService::pack() const
    {
        ByteWriter writer;
        writer.putUint16(serviceType).putString(channelName_).putString(account_);
        privileges_.encode(writer);
        return std::move(writer).finish();
    }
    //#####################################################################################################################
}
