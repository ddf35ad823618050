#include <tokenpp/byte_writer.hpp>
#include <tokenpp/errors.hpp>

#include <string>
#include <utility>

using namespace std::string_literals;

namespace ChannelKey::Token
{
    namespace
    {
        void checkPrefixedLength(std::size_t length, char const* what)
        {
            if (length > ByteWriter::MaxPrefixedLength)
                throw EncodingOverflow(
                    what + " of "s + std::to_string(length) + " exceeds the 16 bit limit of " +
                    std::to_string(ByteWriter::MaxPrefixedLength) + ".");
        }
    }
    //#####################################################################################################################
    ByteWriter& ByteWriter::putUint16(std::uint16_t value)
    {
        buffer_.push_back(static_cast<char>(value & 0xFF));
        buffer_.push_back(static_cast<char>((value >> 8) & 0xFF));
        return *this;
    }
    //---------------------------------------------------------------------------------------------------------------------
    ByteWriter& ByteWriter::putUint32(std::uint32_t value)
    {
        buffer_.push_back(static_cast<char>(value & 0xFF));
        buffer_.push_back(static_cast<char>((value >> 8) & 0xFF));
        buffer_.push_back(static_cast<char>((value >> 16) & 0xFF));
        buffer_.push_back(static_cast<char>((value >> 24) & 0xFF));
        return *this;
    }
    //---------------------------------------------------------------------------------------------------------------------
    ByteWriter& ByteWriter::putString(std::string_view value)
    {
        checkPrefixedLength(value.size(), "String length");
        putUint16(static_cast<std::uint16_t>(value.size()));
        return putBytes(value);
    }
    //---------------------------------------------------------------------------------------------------------------------
    ByteWriter& ByteWriter::putBytes(std::string_view bytes)
    {
        buffer_.append(bytes.data(), bytes.size());
        return *this;
    }
    //---------------------------------------------------------------------------------------------------------------------
    ByteWriter& ByteWriter::putCount(std::size_t count)
    {
        checkPrefixedLength(count, "Element count");
        return putUint16(static_cast<std::uint16_t>(count));
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::size_t ByteWriter::size() const
    {
        return buffer_.size();
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string ByteWriter::finish() &&
    {
        return std::move(buffer_);
    }
    //#####################################################################################################################
}
