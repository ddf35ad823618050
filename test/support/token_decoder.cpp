#include "token_decoder.hpp"

#include <tokenpp/encoding.hpp>
#include <tokenpp/rtc_service.hpp>
#include <tokenpp/service.hpp>
#include <tokenpp/signing.hpp>

#include <jwt-cpp/base.h>
#include <zlib.h>

#include <stdexcept>

using namespace std::string_literals;

namespace ChannelKey::Testing
{
    namespace
    {
        std::string stripVersion(std::string const& token)
        {
            if (token.compare(0, Token::TokenVersion.size(), Token::TokenVersion) != 0)
                throw std::invalid_argument("Token does not start with the version prefix.");
            return token.substr(Token::TokenVersion.size());
        }

        std::vector<DecodedGrant> readGrants(ByteReader& reader)
        {
            std::vector<DecodedGrant> grants;
            const auto count = reader.readUint16();
            for (std::uint16_t i = 0; i != count; ++i)
            {
                DecodedGrant grant{};
                grant.privilege = reader.readUint16();
                grant.expiry = reader.readUint32();
                grants.push_back(grant);
            }
            return grants;
        }

        DecodedRtcService readService(ByteReader& reader)
        {
            DecodedRtcService service{};
            service.serviceType = reader.readUint16();
            if (!Token::serviceTypeName(service.serviceType) || service.serviceType != Token::RtcService::serviceType)
                throw std::invalid_argument("Unsupported service type "s + std::to_string(service.serviceType));
            service.channelName = reader.readString();
            service.account = reader.readString();
            service.privileges = readGrants(reader);
            return service;
        }
    }
    //#####################################################################################################################
    ByteReader::ByteReader(std::string_view data)
        : data_{data}
        , offset_{0}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    std::uint16_t ByteReader::readUint16()
    {
        const auto bytes = readBytes(2);
        return static_cast<std::uint16_t>(
            static_cast<unsigned char>(bytes[0]) | (static_cast<unsigned char>(bytes[1]) << 8));
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::uint32_t ByteReader::readUint32()
    {
        const auto bytes = readBytes(4);
        std::uint32_t value = 0;
        for (int i = 3; i >= 0; --i)
            value = (value << 8) | static_cast<unsigned char>(bytes[static_cast<std::size_t>(i)]);
        return value;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string ByteReader::readString()
    {
        return readBytes(readUint16());
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string ByteReader::readBytes(std::size_t count)
    {
        if (data_.size() - offset_ < count)
            throw std::out_of_range("Token buffer is truncated.");
        std::string result{data_.substr(offset_, count)};
        offset_ += count;
        return result;
    }
    //---------------------------------------------------------------------------------------------------------------------
    bool ByteReader::atEnd() const
    {
        return offset_ == data_.size();
    }
    //#####################################################################################################################
    std::string fromHex(std::string_view hex)
    {
        std::string bytes;
        bytes.reserve(hex.size() / 2);
        for (std::size_t i = 0; i + 1 < hex.size(); i += 2)
            bytes.push_back(static_cast<char>(std::stoi(std::string{hex.substr(i, 2)}, nullptr, 16)));
        return bytes;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string toHex(std::string_view bytes)
    {
        constexpr auto hexDigits = "0123456789abcdef";
        std::string hex;
        hex.reserve(bytes.size() * 2);
        for (auto c : bytes)
        {
            const auto byte = static_cast<unsigned char>(c);
            hex.push_back(hexDigits[byte >> 4]);
            hex.push_back(hexDigits[byte & 0xF]);
        }
        return hex;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string fromBase64(std::string const& text)
    {
        return jwt::base::decode<jwt::alphabet::base64>(text);
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string inflatePayload(std::string const& compressed)
    {
        uLongf capacity = static_cast<uLongf>(compressed.size()) * 4 + 64;
        for (;;)
        {
            std::string output(capacity, '\0');
            auto length = capacity;
            const auto result = uncompress(
                reinterpret_cast<Bytef*>(output.data()),
                &length,
                reinterpret_cast<Bytef const*>(compressed.data()),
                static_cast<uLong>(compressed.size()));
            if (result == Z_OK)
            {
                output.resize(length);
                return output;
            }
            if (result != Z_BUF_ERROR)
                throw std::runtime_error("Inflating token content failed with zlib error "s + std::to_string(result));
            capacity *= 2;
        }
    }
    //#####################################################################################################################
    DecodedAccessToken2 decodeAccessToken2Content(std::string const& content)
    {
        DecodedAccessToken2 decoded{};
        decoded.content = content;

        ByteReader reader{content};
        decoded.signature = reader.readBytes(Token::HmacSha256Length);
        decoded.salt = reader.readUint32();
        decoded.issuedAt = reader.readUint32();
        decoded.ttl = reader.readUint16();
        const auto serviceCount = reader.readUint16();
        for (std::uint16_t i = 0; i != serviceCount; ++i)
            decoded.services.push_back(readService(reader));
        if (!reader.atEnd())
            throw std::invalid_argument("Trailing bytes after the last service.");
        return decoded;
    }
    //---------------------------------------------------------------------------------------------------------------------
    DecodedAccessToken2 decodeAccessToken2(std::string const& token)
    {
        return decodeAccessToken2Content(inflatePayload(fromBase64(stripVersion(token))));
    }
    //---------------------------------------------------------------------------------------------------------------------
    DecodedLegacyToken decodeLegacyToken(std::string const& token)
    {
        DecodedLegacyToken decoded{};
        decoded.content = fromBase64(stripVersion(token));

        ByteReader reader{decoded.content};
        decoded.signature = reader.readString();
        decoded.channelCrc = reader.readUint32();
        decoded.accountCrc = reader.readUint32();
        decoded.message = reader.readString();
        if (!reader.atEnd())
            throw std::invalid_argument("Trailing bytes after the message.");

        ByteReader messageReader{decoded.message};
        decoded.salt = messageReader.readUint32();
        decoded.issuedAt = messageReader.readUint32();
        decoded.privileges = readGrants(messageReader);
        if (!messageReader.atEnd())
            throw std::invalid_argument("Trailing bytes after the privileges.");
        return decoded;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::set<std::uint16_t> privilegeIds(std::vector<DecodedGrant> const& grants)
    {
        std::set<std::uint16_t> ids;
        for (auto const& grant : grants)
            ids.insert(grant.privilege);
        return ids;
    }
    //#####################################################################################################################
}
