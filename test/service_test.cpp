#include "support/token_decoder.hpp"

#include <tokenpp/rtc_service.hpp>
#include <tokenpp/service.hpp>

#include <gtest/gtest.h>

using namespace ChannelKey;
using namespace ChannelKey::Testing;
using Token::Privilege;

namespace
{
    Token::RtcService publisherService()
    {
        Token::RtcService service{"room-42", "user-7"};
        service.addPrivilege(Privilege::JoinChannel, 3600);
        service.addPrivilege(Privilege::PublishAudioStream, 3600);
        service.addPrivilege(Privilege::PublishVideoStream, 3600);
        service.addPrivilege(Privilege::PublishDataStream, 3600);
        return service;
    }
}

TEST(RtcServiceTest, PacksTypeChannelAccountAndPrivileges)
{
    EXPECT_EQ(
        toHex(publisherService().pack()),
        "0100"
        "0700726f6f6d2d3432"
        "0600757365722d37"
        "0400"
        "0100100e0000"
        "0200100e0000"
        "0300100e0000"
        "0400100e0000");
}

TEST(RtcServiceTest, ServiceTypeIsOne)
{
    const Token::RtcService service{"c", "u"};
    EXPECT_EQ(service.getServiceType(), 1u);
    EXPECT_EQ(Token::serviceTypeOf(Token::Service{service}), 1u);
}

TEST(ServiceTest, VariantPacksLikeTheAlternative)
{
    const auto service = publisherService();
    EXPECT_EQ(Token::packService(Token::Service{service}), service.pack());
}

TEST(ServiceTest, RegistryKnowsRtcOnly)
{
    EXPECT_EQ(Token::serviceTypeName(1), "rtc");
    EXPECT_EQ(Token::serviceTypeName(0), std::nullopt);
    EXPECT_EQ(Token::serviceTypeName(2), std::nullopt);
}
