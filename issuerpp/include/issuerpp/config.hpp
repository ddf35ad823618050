#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ChannelKey::Issuer
{
    /// Exactly one format per deployment. Both use the "007" prefix and are indistinguishable by it.
    enum class TokenFormat
    {
        AccessToken2,
        Legacy
    };

    std::string_view toString(TokenFormat format);
    std::optional<TokenFormat> parseTokenFormat(std::string_view text);

    struct Config
    {
        std::string appId;
        std::string appSecret;
        TokenFormat format = TokenFormat::AccessToken2;
        std::uint32_t defaultTtl = 3600;
    };

    using EnvironmentLookup = std::function<std::optional<std::string>(std::string const&)>;

    std::optional<std::string> processEnvironment(std::string const& name);

    /**
     * Parses a JSON config document. Every member is optional:
     * { "appId": "...", "appSecret": "...", "format": "accessToken2" | "legacy", "defaultTtl": 3600 }
     */
    Config parseConfig(std::string const& jsonText);

    /// Overrides with CHANNELKEY_APP_ID, CHANNELKEY_APP_SECRET, CHANNELKEY_TOKEN_FORMAT and CHANNELKEY_DEFAULT_TTL.
    Config applyEnvironment(Config config, EnvironmentLookup const& lookup);

    /// Defaults, then the home config file (if any), then the environment.
    Config loadConfig(EnvironmentLookup const& lookup = processEnvironment);

    /**
     * @throws Token::MissingConfiguration if id or secret is empty.
     * @throws Token::InvalidCredentials if either has the wrong length.
     */
    void requireCredentials(Config const& config);

    /// Keeps visiblePrefix leading and visibleSuffix trailing characters plus the length, for log output.
    std::string maskCredential(std::string const& credential, std::size_t visiblePrefix = 8, std::size_t visibleSuffix = 4);
}
