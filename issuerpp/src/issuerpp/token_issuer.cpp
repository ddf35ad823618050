#include <issuerpp/token_issuer.hpp>
#include <sharedpp/printable_string.hpp>
#include <tokenpp/access_token.hpp>
#include <tokenpp/byte_writer.hpp>
#include <tokenpp/errors.hpp>
#include <tokenpp/legacy_token.hpp>
#include <tokenpp/rtc_service.hpp>

#include <spdlog/spdlog.h>

#include <limits>
#include <stdexcept>
#include <utility>

using namespace std::string_literals;

namespace ChannelKey::Issuer
{
    namespace
    {
        constexpr std::uint32_t MaxContentTtl = 0xFFFF;

        void checkFieldLength(std::string const& value, char const* name)
        {
            if (value.size() > Token::ByteWriter::MaxPrefixedLength)
                throw Token::EncodingOverflow(
                    name + " is "s + std::to_string(value.size()) + " bytes long, at most " +
                    std::to_string(Token::ByteWriter::MaxPrefixedLength) + " are allowed.");
        }
    }
    //#####################################################################################################################
    TokenIssuer::TokenIssuer(Config config)
        : TokenIssuer{
              std::move(config),
              std::make_shared<Token::RandomSaltProvider>(),
              std::make_shared<Token::SystemTimeProvider>()}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    TokenIssuer::TokenIssuer(
        Config config,
        std::shared_ptr<Token::SaltProvider> saltProvider,
        std::shared_ptr<Token::TimeProvider> timeProvider)
        : config_{std::move(config)}
        , saltProvider_{std::move(saltProvider)}
        , timeProvider_{std::move(timeProvider)}
    {
        if (!saltProvider_ || !timeProvider_)
            throw std::invalid_argument("TokenIssuer requires a salt provider and a time provider.");
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string TokenIssuer::issueRtcToken(
        std::string const& channel,
        std::string const& subjectId,
        Role role,
        std::uint32_t ttlSeconds) const
    {
        requireCredentials(config_);
        checkFieldLength(channel, "Channel name");
        checkFieldLength(subjectId, "Subject id");

        auto token = config_.format == TokenFormat::Legacy ? buildLegacy(channel, subjectId, role, ttlSeconds)
                                                           : buildAccessToken2(channel, subjectId, role, ttlSeconds);

        spdlog::info(
            "Issued {} token for channel '{}' as {} ({}s, {} characters).",
            toString(config_.format),
            makePrintableString(channel),
            toString(role),
            ttlSeconds,
            token.size());
        return token;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string TokenIssuer::issueRtcToken(
        std::string const& channel,
        std::uint32_t subjectId,
        Role role,
        std::uint32_t ttlSeconds) const
    {
        return issueRtcToken(channel, std::to_string(subjectId), role, ttlSeconds);
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string TokenIssuer::issueRtmToken(std::string const& userId, std::uint32_t ttlSeconds) const
    {
        return issueRtcToken(userId, userId, Role::Publisher, ttlSeconds);
    }
    //---------------------------------------------------------------------------------------------------------------------
    TokenFormat TokenIssuer::format() const
    {
        return config_.format;
    }
    //---------------------------------------------------------------------------------------------------------------------
    Token::Credentials TokenIssuer::credentials() const
    {
        return Token::Credentials{config_.appId, config_.appSecret};
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string TokenIssuer::buildAccessToken2(
        std::string const& channel,
        std::string const& subjectId,
        Role role,
        std::uint32_t ttlSeconds) const
    {
        const auto issuedAt = timeProvider_->currentTimestamp();
        const auto salt = saltProvider_->drawSalt();

        if (ttlSeconds > MaxContentTtl)
        {
            spdlog::warn(
                "TTL of {}s does not fit the 16 bit expiry of the token content, it is carried as {}s there. "
                "The signature covers the full TTL, so this token will fail verification.",
                ttlSeconds,
                ttlSeconds & MaxContentTtl);
        }

        // privilege expiries of this format are relative, like the token's own ttl
        Token::AccessToken2 token{credentials(), issuedAt, salt, ttlSeconds};
        token.addService(Token::RtcService{channel, subjectId, privilegesFor(role, ttlSeconds)});
        return token.build();
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string TokenIssuer::buildLegacy(
        std::string const& channel,
        std::string const& subjectId,
        Role role,
        std::uint32_t ttlSeconds) const
    {
        const auto issuedAt = timeProvider_->currentTimestamp();
        if (ttlSeconds > std::numeric_limits<std::uint32_t>::max() - issuedAt)
            throw Token::EncodingOverflow(
                "TTL of "s + std::to_string(ttlSeconds) + "s issued at " + std::to_string(issuedAt) +
                " does not fit the 32 bit absolute expiry of the legacy format.");
        const auto salt = saltProvider_->drawSalt();

        Token::LegacyAccessToken token{
            credentials(), channel, subjectId, issuedAt, salt, privilegesFor(role, issuedAt + ttlSeconds)};
        return token.build();
    }
    //#####################################################################################################################
}
