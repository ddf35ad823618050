#pragma once

#include <issuerpp/config.hpp>
#include <issuerpp/role.hpp>
#include <tokenpp/credentials.hpp>
#include <tokenpp/providers.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace ChannelKey::Issuer
{
    /**
     * The two token entry points offered to the rest of the application.
     *
     * Stateless apart from the immutable config and the injected providers: every call draws one salt and
     * reads the clock once, so calls may run concurrently provided the providers allow it
     * (the random and system providers do).
     */
    class TokenIssuer
    {
      public:
        constexpr static std::uint32_t DefaultTtl = 3600;

        /// Production wiring: OS entropy for salts and the system clock.
        explicit TokenIssuer(Config config);
        TokenIssuer(
            Config config,
            std::shared_ptr<Token::SaltProvider> saltProvider,
            std::shared_ptr<Token::TimeProvider> timeProvider);

        /**
         * @throws Token::MissingConfiguration, Token::InvalidCredentials, Token::EncodingOverflow
         */
        std::string issueRtcToken(
            std::string const& channel,
            std::string const& subjectId,
            Role role,
            std::uint32_t ttlSeconds = DefaultTtl) const;

        /// Numeric subject ids are rendered in decimal.
        std::string issueRtcToken(
            std::string const& channel,
            std::uint32_t subjectId,
            Role role,
            std::uint32_t ttlSeconds = DefaultTtl) const;

        /// A publisher grant on a channel named after the user, with the user as subject.
        std::string issueRtmToken(std::string const& userId, std::uint32_t ttlSeconds = DefaultTtl) const;

        TokenFormat format() const;

      private:
        std::string buildAccessToken2(
            std::string const& channel,
            std::string const& subjectId,
            Role role,
            std::uint32_t ttlSeconds) const;

        std::string buildLegacy(
            std::string const& channel,
            std::string const& subjectId,
            Role role,
            std::uint32_t ttlSeconds) const;

        Token::Credentials credentials() const;

      private:
        Config config_;
        std::shared_ptr<Token::SaltProvider> saltProvider_;
        std::shared_ptr<Token::TimeProvider> timeProvider_;
    };
}
