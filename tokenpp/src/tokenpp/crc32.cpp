#include <tokenpp/crc32.hpp>

#include <array>

namespace ChannelKey::Token
{
    namespace
    {
        constexpr std::uint32_t ReflectedPolynomial = 0xEDB88320u;

        std::array<std::uint32_t, 256> makeCrcTable()
        {
            std::array<std::uint32_t, 256> table{};
            for (std::uint32_t i = 0; i != table.size(); ++i)
            {
                std::uint32_t c = i;
                for (int bit = 0; bit != 8; ++bit)
                    c = (c & 1) ? ReflectedPolynomial ^ (c >> 1) : c >> 1;
                table[i] = c;
            }
            return table;
        }

        std::array<std::uint32_t, 256> const& crcTable()
        {
            static const auto table = makeCrcTable();
            return table;
        }
    }

    std::uint32_t crc32(std::string_view data)
    {
        auto const& table = crcTable();
        std::uint32_t crc = 0xFFFFFFFFu;
        for (auto c : data)
            crc = table[(crc ^ static_cast<unsigned char>(c)) & 0xFF] ^ (crc >> 8);
        return crc ^ 0xFFFFFFFFu;
    }
}
