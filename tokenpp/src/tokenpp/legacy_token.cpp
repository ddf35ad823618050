#include <tokenpp/legacy_token.hpp>
#include <tokenpp/byte_writer.hpp>
#include <tokenpp/crc32.hpp>
#include <tokenpp/encoding.hpp>
#include <tokenpp/signing.hpp>

#include <utility>

namespace ChannelKey::Token
{
    //#####################################################################################################################
    LegacyAccessToken::LegacyAccessToken(
        Credentials credentials,
        std::string channelName,
        std::string account,
        std::uint32_t issuedAt,
        std::uint32_t salt,
        PrivilegeGrantSet privileges)
        : credentials_{std::move(credentials)}
        , channelName_{std::move(channelName)}
        , account_{std::move(account)}
        , issuedAt_{issuedAt}
        , salt_{salt}
        , privileges_{std::move(privileges)}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    void LegacyAccessToken::addPrivilege(Privilege privilege, std::uint32_t expiry)
    {
        privileges_.add(privilege, expiry);
    }
    //---------------------------------------------------------------------------------------------------------------------
    PrivilegeGrantSet const& LegacyAccessToken::privileges() const
    {
        return privileges_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string LegacyAccessToken::message() const
    {
        ByteWriter writer;
        writer.putUint32(salt_).putUint32(issuedAt_);
        privileges_.encode(writer);
        return std::move(writer).finish();
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string LegacyAccessToken::signingInput() const
    {
        ByteWriter writer;
        writer.putBytes(credentials_.appId).putBytes(channelName_).putBytes(account_).putBytes(message());
        return std::move(writer).finish();
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string LegacyAccessToken::signature() const
    {
        validateCredentials(credentials_);
        return hmacSha256(credentials_.appSecret, signingInput());
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string LegacyAccessToken::contentPayload() const
    {
        const auto digest = signature();

        ByteWriter writer;
        writer.putString(digest).putUint32(crc32(channelName_)).putUint32(crc32(account_)).putString(message());
        return std::move(writer).finish();
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string LegacyAccessToken::build() const
    {
        return armorToken(contentPayload());
    }
    //#####################################################################################################################
}
