#include <tokenpp/providers.hpp>

#include <boost/random/random_device.hpp>

#include <chrono>

namespace ChannelKey::Token
{
    //#####################################################################################################################
    std::uint32_t RandomSaltProvider::drawSalt()
    {
        boost::random::random_device device;
        return static_cast<std::uint32_t>(device());
    }
    //#####################################################################################################################
    std::uint32_t SystemTimeProvider::currentTimestamp()
    {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<std::uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }
    //#####################################################################################################################
    FixedSaltProvider::FixedSaltProvider(std::uint32_t salt)
        : salt_{salt}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    std::uint32_t FixedSaltProvider::drawSalt()
    {
        return salt_;
    }
    //#####################################################################################################################
    FixedTimeProvider::FixedTimeProvider(std::uint32_t timestamp)
        : timestamp_{timestamp}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    std::uint32_t FixedTimeProvider::currentTimestamp()
    {
        return timestamp_;
    }
    //#####################################################################################################################
}
