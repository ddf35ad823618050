#pragma once

#include <cstdint>

namespace ChannelKey::Token
{
    class SaltProvider
    {
      public:
        virtual ~SaltProvider() = default;
        virtual std::uint32_t drawSalt() = 0;
    };

    class TimeProvider
    {
      public:
        virtual ~TimeProvider() = default;

        /// Seconds since the UNIX epoch.
        virtual std::uint32_t currentTimestamp() = 0;
    };

    /// Draws from the operating system entropy source on every call.
    class RandomSaltProvider : public SaltProvider
    {
      public:
        std::uint32_t drawSalt() override;
    };

    class SystemTimeProvider : public TimeProvider
    {
      public:
        std::uint32_t currentTimestamp() override;
    };

    class FixedSaltProvider : public SaltProvider
    {
      public:
        explicit FixedSaltProvider(std::uint32_t salt);
        std::uint32_t drawSalt() override;

      private:
        std::uint32_t salt_;
    };

    class FixedTimeProvider : public TimeProvider
    {
      public:
        explicit FixedTimeProvider(std::uint32_t timestamp);
        std::uint32_t currentTimestamp() override;

      private:
        std::uint32_t timestamp_;
    };
}
