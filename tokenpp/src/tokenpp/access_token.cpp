#include <tokenpp/access_token.hpp>
#include <tokenpp/byte_writer.hpp>
#include <tokenpp/encoding.hpp>
#include <tokenpp/signing.hpp>

#include <algorithm>
#include <utility>

namespace ChannelKey::Token
{
    //#####################################################################################################################
    AccessToken2::AccessToken2(Credentials credentials, std::uint32_t issuedAt, std::uint32_t salt, std::uint32_t ttl)
        : credentials_{std::move(credentials)}
        , issuedAt_{issuedAt}
        , salt_{salt}
        , ttl_{ttl}
        , services_{}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    void AccessToken2::addService(Service service)
    {
        const auto type = serviceTypeOf(service);
        auto iter = std::find_if(std::begin(services_), std::end(services_), [type](auto const& attached) {
            return serviceTypeOf(attached) == type;
        });
        if (iter != std::end(services_))
            *iter = std::move(service);
        else
            services_.push_back(std::move(service));
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::vector<Service> const& AccessToken2::services() const
    {
        return services_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::uint32_t AccessToken2::issuedAt() const
    {
        return issuedAt_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::uint32_t AccessToken2::salt() const
    {
        return salt_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::uint32_t AccessToken2::ttl() const
    {
        return ttl_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    void AccessToken2::packServices(ByteWriter& writer) const
    {
        writer.putCount(services_.size());
        for (auto const& service : services_)
            writer.putBytes(packService(service));
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string AccessToken2::signingPayload() const
    {
        ByteWriter writer;
        writer.putString(credentials_.appId).putUint32(issuedAt_).putUint32(ttl_).putUint32(salt_);
        packServices(writer);
        return std::move(writer).finish();
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string AccessToken2::signature() const
    {
        validateCredentials(credentials_);
        return hmacSha256(credentials_.appSecret, signingPayload());
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string AccessToken2::contentPayload() const
    {
        const auto digest = signature();

        ByteWriter writer;
        writer.putBytes(digest)
            .putUint32(salt_)
            .putUint32(issuedAt_)
            .putUint16(static_cast<std::uint16_t>(ttl_ & 0xFFFF));
        packServices(writer);
        return std::move(writer).finish();
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string AccessToken2::build() const
    {
        return armorToken(compressPayload(contentPayload()));
    }
    //#####################################################################################################################
}
