#include <tokenpp/credentials.hpp>
#include <tokenpp/errors.hpp>

using namespace std::string_literals;

namespace ChannelKey::Token
{
    namespace
    {
        void checkLength(std::string const& value, char const* name)
        {
            if (value.size() != CredentialLength)
                throw InvalidCredentials(
                    name + " must be "s + std::to_string(CredentialLength) + " characters long, got " +
                    std::to_string(value.size()) + ".");
        }
    }

    void validateCredentials(Credentials const& credentials)
    {
        checkLength(credentials.appId, "Application id");
        checkLength(credentials.appSecret, "Application secret");
    }
}
