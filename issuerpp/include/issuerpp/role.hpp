#pragma once

#include <tokenpp/privileges.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace ChannelKey::Issuer
{
    enum class Role : int
    {
        Publisher = 1,
        Subscriber = 2
    };

    std::string_view toString(Role role);
    std::optional<Role> parseRole(std::string_view text);

    /**
     * JoinChannel first, then for publishers PublishAudioStream, PublishVideoStream
     * and PublishDataStream, all with the same expiry.
     */
    Token::PrivilegeGrantSet privilegesFor(Role role, std::uint32_t expiry);
}
