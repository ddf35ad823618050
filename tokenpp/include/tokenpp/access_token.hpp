#pragma once

#include <tokenpp/credentials.hpp>
#include <tokenpp/service.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace ChannelKey::Token
{
    class ByteWriter;

    /**
     * Builder for the service based (AccessToken2) token format.
     *
     * Signing payload:
     *     appId:string, issuedAt:u32, ttl:u32, salt:u32, serviceCount:u16, services...
     * Content payload:
     *     signature[32], salt:u32, issuedAt:u32, ttl:u16, serviceCount:u16, services...
     * Token:
     *     "007" + base64(zlib(content))
     *
     * The ttl is 32 bit in the signed bytes but only 16 bit in the content. The verifier
     * expects exactly this layout.
     */
    class AccessToken2
    {
      public:
        AccessToken2(Credentials credentials, std::uint32_t issuedAt, std::uint32_t salt, std::uint32_t ttl);

        /// Attaches a service. A service of an already attached type replaces it in place.
        void addService(Service service);
        std::vector<Service> const& services() const;

        std::uint32_t issuedAt() const;
        std::uint32_t salt() const;
        std::uint32_t ttl() const;

        std::string signingPayload() const;

        /// @throws InvalidCredentials
        std::string signature() const;

        /// @throws InvalidCredentials
        std::string contentPayload() const;

        /// @throws InvalidCredentials
        std::string build() const;

      private:
        void packServices(ByteWriter& writer) const;

      private:
        Credentials credentials_;
        std::uint32_t issuedAt_;
        std::uint32_t salt_;
        std::uint32_t ttl_;
        std::vector<Service> services_;
    };
}
