#include <issuerpp/program_options.hpp>

#include <cxxopts.hpp>

#include <stdexcept>

using namespace std::string_literals;

namespace ChannelKey::Issuer
{
    ProgramOptions parseProgramOptions(int argc, char const* const* argv)
    {
        cxxopts::Options options("channelkey-issue", "Issues access tokens for real-time audio, video and messaging channels.");

        // clang-format off
        options.add_options()
            ("c,channel", "Channel to authorize.", cxxopts::value<std::string>())
            ("s,subject", "Subject (user) id the token is bound to.", cxxopts::value<std::string>())
            ("r,role", "publisher or subscriber.", cxxopts::value<std::string>()->default_value("publisher"))
            ("rtm", "Issue a messaging token for --user instead.")
            ("u,user", "User id of a messaging token.", cxxopts::value<std::string>())
            ("t,ttl", "Lifetime in seconds. Defaults to the configured TTL.", cxxopts::value<std::uint32_t>())
            ("f,format", "accessToken2 or legacy. Overrides the configuration.", cxxopts::value<std::string>())
            ("salt", "Fixed salt, for reproducible tokens.", cxxopts::value<std::uint32_t>())
            ("timestamp", "Fixed issue time in seconds since the epoch, for reproducible tokens.", cxxopts::value<std::uint32_t>())
            ("v,verbose", "Log debug output.")
            ("h,help", "Print usage.");
        // clang-format on

        const auto result = options.parse(argc, argv);

        ProgramOptions programOptions;
        if (result.count("help"))
        {
            programOptions.showHelp = true;
            programOptions.helpText = options.help();
            return programOptions;
        }

        programOptions.rtm = result.count("rtm") > 0;
        programOptions.verbose = result.count("verbose") > 0;

        if (programOptions.rtm)
        {
            if (!result.count("user"))
                throw std::invalid_argument("--rtm requires --user.");
            programOptions.user = result["user"].as<std::string>();
        }
        else
        {
            if (!result.count("channel") || !result.count("subject"))
                throw std::invalid_argument("--channel and --subject are required.");
            programOptions.channel = result["channel"].as<std::string>();
            programOptions.subject = result["subject"].as<std::string>();

            const auto roleText = result["role"].as<std::string>();
            const auto role = parseRole(roleText);
            if (!role)
                throw std::invalid_argument("Unknown role '"s + roleText + "', expected publisher or subscriber.");
            programOptions.role = *role;
        }

        if (result.count("ttl"))
            programOptions.ttl = result["ttl"].as<std::uint32_t>();
        if (result.count("format"))
        {
            const auto formatText = result["format"].as<std::string>();
            programOptions.format = parseTokenFormat(formatText);
            if (!programOptions.format)
                throw std::invalid_argument("Unknown format '"s + formatText + "', expected accessToken2 or legacy.");
        }
        if (result.count("salt"))
            programOptions.salt = result["salt"].as<std::uint32_t>();
        if (result.count("timestamp"))
            programOptions.timestamp = result["timestamp"].as<std::uint32_t>();

        return programOptions;
    }
}
