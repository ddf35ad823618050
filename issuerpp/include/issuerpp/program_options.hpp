#pragma once

#include <issuerpp/config.hpp>
#include <issuerpp/role.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace ChannelKey::Issuer
{
    struct ProgramOptions
    {
        bool showHelp = false;
        std::string helpText;

        bool rtm = false;
        std::string channel;
        std::string subject;
        std::string user;
        Role role = Role::Publisher;
        std::optional<std::uint32_t> ttl;
        std::optional<TokenFormat> format;
        std::optional<std::uint32_t> salt;
        std::optional<std::uint32_t> timestamp;
        bool verbose = false;
    };

    /**
     * @throws std::invalid_argument on missing or malformed values, cxxopts exceptions on syntax errors.
     */
    ProgramOptions parseProgramOptions(int argc, char const* const* argv);
}
