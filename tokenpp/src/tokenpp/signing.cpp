#include <tokenpp/signing.hpp>
#include <tokenpp/errors.hpp>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace ChannelKey::Token
{
    std::string hmacSha256(std::string_view key, std::string_view message)
    {
        std::string digest(EVP_MAX_MD_SIZE, '\0');
        unsigned int digestLength = 0;

        const auto* result = HMAC(
            EVP_sha256(),
            key.data(),
            static_cast<int>(key.size()),
            reinterpret_cast<unsigned char const*>(message.data()),
            message.size(),
            reinterpret_cast<unsigned char*>(digest.data()),
            &digestLength);

        if (result == nullptr || digestLength != HmacSha256Length)
            throw TokenError("HMAC-SHA256 computation failed.");

        digest.resize(digestLength);
        return digest;
    }
}
