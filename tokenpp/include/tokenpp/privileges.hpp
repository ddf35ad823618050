#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace ChannelKey::Token
{
    class ByteWriter;

    enum class Privilege : std::uint16_t
    {
        JoinChannel = 1,
        PublishAudioStream = 2,
        PublishVideoStream = 3,
        PublishDataStream = 4
    };

    std::string_view toString(Privilege privilege);

    struct PrivilegeGrant
    {
        Privilege privilege;
        std::uint32_t expiry;
    };

    /**
     * Privileges with their expiry, kept in insertion order.
     * The signature covers the encoded order, so grants are never sorted.
     */
    class PrivilegeGrantSet
    {
      public:
        /// Inserts a grant, or overwrites the expiry of an existing one in place.
        void add(Privilege privilege, std::uint32_t expiry);

        std::optional<std::uint32_t> expiryOf(Privilege privilege) const;
        std::vector<PrivilegeGrant> const& grants() const;
        std::size_t size() const;
        bool empty() const;

        /// count:u16 followed by (id:u16, expiry:u32) per grant.
        void encode(ByteWriter& writer) const;

      private:
        std::vector<PrivilegeGrant> grants_;
    };
}
