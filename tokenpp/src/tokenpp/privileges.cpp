#include <tokenpp/privileges.hpp>
#include <tokenpp/byte_writer.hpp>

#include <algorithm>

namespace ChannelKey::Token
{
    //#####################################################################################################################
    std::string_view toString(Privilege privilege)
    {
        switch (privilege)
        {
            case Privilege::JoinChannel:
                return "joinChannel";
            case Privilege::PublishAudioStream:
                return "publishAudioStream";
            case Privilege::PublishVideoStream:
                return "publishVideoStream";
            case Privilege::PublishDataStream:
                return "publishDataStream";
        }
        return "unknown";
    }
    //#####################################################################################################################
    void PrivilegeGrantSet::add(Privilege privilege, std::uint32_t expiry)
    {
        auto iter = std::find_if(std::begin(grants_), std::end(grants_), [privilege](auto const& grant) {
            return grant.privilege == privilege;
        });
        if (iter != std::end(grants_))
            iter->expiry = expiry;
        else
            grants_.push_back(PrivilegeGrant{privilege, expiry});
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::optional<std::uint32_t> PrivilegeGrantSet::expiryOf(Privilege privilege) const
    {
        for (auto const& grant : grants_)
        {
            if (grant.privilege == privilege)
                return grant.expiry;
        }
        return std::nullopt;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::vector<PrivilegeGrant> const& PrivilegeGrantSet::grants() const
    {
        return grants_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::size_t PrivilegeGrantSet::size() const
    {
        return grants_.size();
    }
    //---------------------------------------------------------------------------------------------------------------------
    bool PrivilegeGrantSet::empty() const
    {
        return grants_.empty();
    }
    //---------------------------------------------------------------------------------------------------------------------
    void PrivilegeGrantSet::encode(ByteWriter& writer) const
    {
        writer.putCount(grants_.size());
        for (auto const& grant : grants_)
        {
            writer.putUint16(static_cast<std::uint16_t>(grant.privilege));
            writer.putUint32(grant.expiry);
        }
    }
    //#####################################################################################################################
}
