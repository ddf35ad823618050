#include <issuerpp/role.hpp>

namespace ChannelKey::Issuer
{
    std::string_view toString(Role role)
    {
        switch (role)
        {
            case Role::Publisher:
                return "publisher";
            case Role::Subscriber:
                return "subscriber";
        }
        return "unknown";
    }

    std::optional<Role> parseRole(std::string_view text)
    {
        if (text == "publisher")
            return Role::Publisher;
        if (text == "subscriber")
            return Role::Subscriber;
        return std::nullopt;
    }

    Token::PrivilegeGrantSet privilegesFor(Role role, std::uint32_t expiry)
    {
        using Token::Privilege;

        Token::PrivilegeGrantSet privileges;
        privileges.add(Privilege::JoinChannel, expiry);
        if (role == Role::Publisher)
        {
            privileges.add(Privilege::PublishAudioStream, expiry);
            privileges.add(Privilege::PublishVideoStream, expiry);
            privileges.add(Privilege::PublishDataStream, expiry);
        }
        return privileges;
    }
}
