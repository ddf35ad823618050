#include <issuerpp/config.hpp>
#include <sharedpp/json.hpp>
#include <sharedpp/load_home_file.hpp>
#include <tokenpp/credentials.hpp>
#include <tokenpp/errors.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <utility>

using namespace std::string_literals;

namespace ChannelKey::Issuer
{
    namespace detail
    {
#ifdef NDEBUG
        constexpr static auto inDev = false;
#else
        constexpr static auto inDev = true;
#endif
    }

    namespace
    {
        TokenFormat requireTokenFormat(std::string const& text, char const* origin)
        {
            const auto format = parseTokenFormat(text);
            if (!format)
                throw std::runtime_error("Unknown token format '"s + text + "' in " + origin + ".");
            return *format;
        }

        std::uint32_t requireTtl(std::string const& text, char const* origin)
        {
            std::uint32_t ttl = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), ttl);
            if (ec != std::errc{} || end != text.data() + text.size())
                throw std::runtime_error("Invalid TTL '"s + text + "' in " + origin + ".");
            return ttl;
        }
    }
    //#####################################################################################################################
    std::string_view toString(TokenFormat format)
    {
        switch (format)
        {
            case TokenFormat::AccessToken2:
                return "accessToken2";
            case TokenFormat::Legacy:
                return "legacy";
        }
        return "unknown";
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::optional<TokenFormat> parseTokenFormat(std::string_view text)
    {
        if (text == "accessToken2")
            return TokenFormat::AccessToken2;
        if (text == "legacy")
            return TokenFormat::Legacy;
        return std::nullopt;
    }
    //#####################################################################################################################
    std::optional<std::string> processEnvironment(std::string const& name)
    {
        const auto* value = std::getenv(name.c_str());
        if (value == nullptr)
            return std::nullopt;
        return std::string{value};
    }
    //---------------------------------------------------------------------------------------------------------------------
    Config parseConfig(std::string const& jsonText)
    {
        const auto document = json::parse(jsonText);
        if (!document.is_object())
            throw std::runtime_error("Config document must be a JSON object.");

        Config config;

        std::optional<std::string> text;
        readOptionalMember(document, "appId", text);
        if (text)
            config.appId = *text;
        readOptionalMember(document, "appSecret", text);
        if (text)
            config.appSecret = *text;
        readOptionalMember(document, "format", text);
        if (text)
            config.format = requireTokenFormat(*text, "config file");

        std::optional<std::uint32_t> ttl;
        readOptionalMember(document, "defaultTtl", ttl);
        if (ttl)
            config.defaultTtl = *ttl;

        return config;
    }
    //---------------------------------------------------------------------------------------------------------------------
    Config applyEnvironment(Config config, EnvironmentLookup const& lookup)
    {
        if (auto appId = lookup("CHANNELKEY_APP_ID"))
            config.appId = std::move(*appId);
        if (auto appSecret = lookup("CHANNELKEY_APP_SECRET"))
            config.appSecret = std::move(*appSecret);
        if (auto format = lookup("CHANNELKEY_TOKEN_FORMAT"))
            config.format = requireTokenFormat(*format, "CHANNELKEY_TOKEN_FORMAT");
        if (auto ttl = lookup("CHANNELKEY_DEFAULT_TTL"))
            config.defaultTtl = requireTtl(*ttl, "CHANNELKEY_DEFAULT_TTL");
        return config;
    }
    //---------------------------------------------------------------------------------------------------------------------
    Config loadConfig(EnvironmentLookup const& lookup)
    {
        Config config;
        if (const auto configString = tryLoadHomeFile(detail::inDev ? "configDev.json" : "config.json"))
            config = parseConfig(*configString);
        else
            spdlog::debug("No config file in '{}', using defaults and environment.", getHomePath().string());

        config = applyEnvironment(std::move(config), lookup);

        spdlog::debug(
            "Loaded config: appId {}, appSecret {}, format {}, default TTL {}s.",
            maskCredential(config.appId),
            maskCredential(config.appSecret, 0, 0),
            toString(config.format),
            config.defaultTtl);
        return config;
    }
    //---------------------------------------------------------------------------------------------------------------------
    void requireCredentials(Config const& config)
    {
        if (config.appId.empty() || config.appSecret.empty())
            throw Token::MissingConfiguration("Application id or application secret is not configured.");
        Token::validateCredentials(Token::Credentials{config.appId, config.appSecret});
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string maskCredential(std::string const& credential, std::size_t visiblePrefix, std::size_t visibleSuffix)
    {
        if (credential.empty())
            return "NOT SET";
        const auto length = " ("s + std::to_string(credential.size()) + " chars)";
        if (credential.size() <= visiblePrefix + visibleSuffix)
            return "..." + length;
        return credential.substr(0, visiblePrefix) + "..." +
            credential.substr(credential.size() - visibleSuffix) + length;
    }
    //#####################################################################################################################
}
