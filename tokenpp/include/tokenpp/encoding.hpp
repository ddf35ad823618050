#pragma once

#include <string>
#include <string_view>

namespace ChannelKey::Token
{
    /// Shared by both token formats, even though their payloads differ.
    constexpr static std::string_view TokenVersion = "007";

    /**
     * zlib stream (RFC 1950) at the default compression level.
     * @throws TokenError if zlib fails.
     */
    std::string compressPayload(std::string_view data);

    /// Standard alphabet, padded.
    std::string toBase64(std::string_view data);

    /// TokenVersion followed by the base64 form of payload.
    std::string armorToken(std::string_view payload);
}
