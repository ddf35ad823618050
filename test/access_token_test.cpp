#include "support/token_decoder.hpp"

#include <tokenpp/access_token.hpp>
#include <tokenpp/errors.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace ChannelKey;
using namespace ChannelKey::Testing;
using Token::Privilege;

namespace
{
    constexpr std::uint32_t Salt = 0x01020304;
    constexpr std::uint32_t IssuedAt = 1700000000;

    const std::string GoldenService = "0100"
                                      "0700726f6f6d2d3432"
                                      "0600757365722d37"
                                      "0400"
                                      "0100100e0000"
                                      "0200100e0000"
                                      "0300100e0000"
                                      "0400100e0000";

    const std::string GoldenSignature = "00bb6d6c3607e44a6452ff96ed69d20835ac62f1bc36374008dcf0319022dcba";

    Token::Credentials testCredentials()
    {
        return {std::string(32, 'A'), std::string(32, 'B')};
    }

    Token::RtcService publisherService(std::uint32_t expiry)
    {
        Token::RtcService service{"room-42", "user-7"};
        service.addPrivilege(Privilege::JoinChannel, expiry);
        service.addPrivilege(Privilege::PublishAudioStream, expiry);
        service.addPrivilege(Privilege::PublishVideoStream, expiry);
        service.addPrivilege(Privilege::PublishDataStream, expiry);
        return service;
    }

    Token::AccessToken2 goldenToken()
    {
        Token::AccessToken2 token{testCredentials(), IssuedAt, Salt, 3600};
        token.addService(publisherService(3600));
        return token;
    }

    bool isBase64(std::string const& text)
    {
        return text.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/=") ==
            std::string::npos;
    }
}

TEST(AccessToken2Test, SigningPayloadLayout)
{
    EXPECT_EQ(
        toHex(goldenToken().signingPayload()),
        "2000"
        "4141414141414141414141414141414141414141414141414141414141414141"
        "00f15365"
        "100e0000"
        "04030201"
        "0100" +
            GoldenService);
}

TEST(AccessToken2Test, SignatureIsHmacOfSigningPayload)
{
    EXPECT_EQ(toHex(goldenToken().signature()), GoldenSignature);
}

TEST(AccessToken2Test, ContentPayloadGolden)
{
    EXPECT_EQ(
        toHex(goldenToken().contentPayload()),
        GoldenSignature +
            "04030201"
            "00f15365"
            "100e"
            "0100" +
            GoldenService);
}

TEST(AccessToken2Test, BuildIsVersionedBase64OfCompressedContent)
{
    const auto token = goldenToken();
    const auto built = token.build();

    ASSERT_EQ(built.substr(0, 3), "007");
    EXPECT_TRUE(isBase64(built.substr(3)));
    EXPECT_EQ(inflatePayload(fromBase64(built.substr(3))), token.contentPayload());
}

TEST(AccessToken2Test, DecodedFieldsMatch)
{
    const auto decoded = decodeAccessToken2(goldenToken().build());

    EXPECT_EQ(toHex(decoded.signature), GoldenSignature);
    EXPECT_EQ(decoded.salt, Salt);
    EXPECT_EQ(decoded.issuedAt, IssuedAt);
    EXPECT_EQ(decoded.ttl, 3600u);
    ASSERT_EQ(decoded.services.size(), 1u);
    EXPECT_EQ(decoded.services[0].channelName, "room-42");
    EXPECT_EQ(decoded.services[0].account, "user-7");
    EXPECT_EQ(privilegeIds(decoded.services[0].privileges), (std::set<std::uint16_t>{1, 2, 3, 4}));
}

TEST(AccessToken2Test, TtlIsSixteenBitInContentButFullInSignature)
{
    Token::AccessToken2 token{testCredentials(), IssuedAt, Salt, 70000};
    token.addService(publisherService(70000));

    const auto decoded = decodeAccessToken2Content(token.contentPayload());
    EXPECT_EQ(decoded.ttl, 4464u);

    ByteReader reader{token.signingPayload()};
    reader.readString();
    reader.readUint32();
    EXPECT_EQ(reader.readUint32(), 70000u);
}

TEST(AccessToken2Test, SameTypeServiceReplacesInPlace)
{
    Token::AccessToken2 token{testCredentials(), IssuedAt, Salt, 3600};
    token.addService(Token::RtcService{"first", "u"});
    token.addService(Token::RtcService{"second", "u"});

    ASSERT_EQ(token.services().size(), 1u);
    EXPECT_EQ(std::get<Token::RtcService>(token.services()[0]).channelName(), "second");
}

TEST(AccessToken2Test, NoServicesIsStillSignable)
{
    const Token::AccessToken2 token{testCredentials(), IssuedAt, Salt, 3600};
    const auto decoded = decodeAccessToken2Content(token.contentPayload());
    EXPECT_TRUE(decoded.services.empty());
}

TEST(AccessToken2Test, ChangedExpiryChangesSignature)
{
    Token::AccessToken2 token{testCredentials(), IssuedAt, Salt, 3600};
    token.addService(publisherService(3599));
    EXPECT_NE(toHex(token.signature()), GoldenSignature);
}

TEST(AccessToken2Test, WrongLengthCredentialsAreRejected)
{
    Token::AccessToken2 shortId{{std::string(31, 'A'), std::string(32, 'B')}, IssuedAt, Salt, 3600};
    EXPECT_THROW((void)shortId.build(), Token::InvalidCredentials);

    Token::AccessToken2 longSecret{{std::string(32, 'A'), std::string(33, 'B')}, IssuedAt, Salt, 3600};
    EXPECT_THROW((void)longSecret.build(), Token::InvalidCredentials);
}
