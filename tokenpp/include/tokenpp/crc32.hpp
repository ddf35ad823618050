#pragma once

#include <cstdint>
#include <string_view>

namespace ChannelKey::Token
{
    /**
     * Reflected CRC-32 (polynomial 0xEDB88320, init and final xor 0xFFFFFFFF).
     * The lookup table is built on first use and shared read-only afterwards.
     */
    std::uint32_t crc32(std::string_view data);
}
