#pragma once

#include <tokenpp/credentials.hpp>
#include <tokenpp/privileges.hpp>

#include <cstdint>
#include <string>

namespace ChannelKey::Token
{
    /**
     * Builder for the CRC32 based legacy token format.
     *
     * message = salt:u32, issuedAt:u32, privileges
     * signature = HMAC-SHA256(appSecret, appId + channelName + account + message)
     * content = signature:string, crc32(channelName):u32, crc32(account):u32, message:string
     * token = "007" + base64(content)
     *
     * The signed concatenation has no delimiters, so ("ab", "c") and ("a", "bc") sign the same
     * bytes. Verifiers of this format depend on it; use AccessToken2 for new deployments.
     */
    class LegacyAccessToken
    {
      public:
        LegacyAccessToken(
            Credentials credentials,
            std::string channelName,
            std::string account,
            std::uint32_t issuedAt,
            std::uint32_t salt,
            PrivilegeGrantSet privileges = {});

        /// Expiry is absolute, in seconds since the UNIX epoch.
        void addPrivilege(Privilege privilege, std::uint32_t expiry);
        PrivilegeGrantSet const& privileges() const;

        std::string message() const;
        std::string signingInput() const;

        /// @throws InvalidCredentials
        std::string signature() const;

        /// @throws InvalidCredentials
        std::string contentPayload() const;

        /// @throws InvalidCredentials
        std::string build() const;

      private:
        Credentials credentials_;
        std::string channelName_;
        std::string account_;
        std::uint32_t issuedAt_;
        std::uint32_t salt_;
        PrivilegeGrantSet privileges_;
    };
}
