#pragma once

#include <cstddef>
#include <string>

namespace ChannelKey::Token
{
    constexpr static std::size_t CredentialLength = 32;

    struct Credentials
    {
        std::string appId;
        std::string appSecret;
    };

    /**
     * @throws InvalidCredentials unless both values are exactly CredentialLength characters.
     */
    void validateCredentials(Credentials const& credentials);
}
