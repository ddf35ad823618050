#include <tokenpp/encoding.hpp>
#include <tokenpp/errors.hpp>

#include <jwt-cpp/base.h>
#include <zlib.h>

using namespace std::string_literals;

namespace ChannelKey::Token
{
    //#####################################################################################################################
    std::string compressPayload(std::string_view data)
    {
        auto compressedLength = compressBound(static_cast<uLong>(data.size()));
        std::string compressed(compressedLength, '\0');

        const auto result = compress2(
            reinterpret_cast<Bytef*>(compressed.data()),
            &compressedLength,
            reinterpret_cast<Bytef const*>(data.data()),
            static_cast<uLong>(data.size()),
            Z_DEFAULT_COMPRESSION);

        if (result != Z_OK)
            throw TokenError("Compressing token content failed with zlib error "s + std::to_string(result) + ".");

        compressed.resize(compressedLength);
        return compressed;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string toBase64(std::string_view data)
    {
        return jwt::base::encode<jwt::alphabet::base64>(std::string{data});
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string armorToken(std::string_view payload)
    {
        return std::string{TokenVersion} + toBase64(payload);
    }
    //#####################################################################################################################
}
