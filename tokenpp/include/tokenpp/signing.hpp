#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ChannelKey::Token
{
    constexpr static std::size_t HmacSha256Length = 32;

    /**
     * Raw (binary, not hex) HMAC-SHA256 digest of message under key.
     * @throws TokenError if the crypto backend fails.
     */
    std::string hmacSha256(std::string_view key, std::string_view message);
}
