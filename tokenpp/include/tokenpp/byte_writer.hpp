#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ChannelKey::Token
{
    /**
     * Accumulates the canonical little endian encoding used by both token formats.
     *
     * Strings are written as a u16 byte length followed by the raw UTF-8 bytes, without terminator.
     * Anything that would need more than 16 bits of length throws EncodingOverflow instead of being truncated.
     * finish() hands out the buffer and may only be called on an rvalue, which ends the writer's life.
     */
    class ByteWriter
    {
      public:
        constexpr static std::size_t MaxPrefixedLength = 0xFFFF;

        ByteWriter& putUint16(std::uint16_t value);
        ByteWriter& putUint32(std::uint32_t value);
        ByteWriter& putString(std::string_view value);
        ByteWriter& putBytes(std::string_view bytes);

        /**
         * Writes an element count as u16.
         * @throws EncodingOverflow if count > MaxPrefixedLength.
         */
        ByteWriter& putCount(std::size_t count);

        std::size_t size() const;
        [[nodiscard]] std::string finish() &&;

      private:
        std::string buffer_;
    };
}
