#include <issuerpp/config.hpp>
#include <issuerpp/program_options.hpp>
#include <issuerpp/token_issuer.hpp>
#include <sharedpp/load_home_file.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <exception>
#include <iostream>
#include <memory>
#include <vector>

namespace
{
    void setupLogging(bool verbose)
    {
        using namespace ChannelKey;

        setupHome();

        // stdout carries the token
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_st>());
        sinks.push_back(
            std::make_shared<spdlog::sinks::daily_file_sink_st>((getHomePath() / "logs/log").string(), 23, 59));
        auto combined_logger = std::make_shared<spdlog::logger>("channelkey", begin(sinks), end(sinks));
        combined_logger->flush_on(spdlog::level::warn);
        combined_logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        spdlog::set_default_logger(combined_logger);
    }
}

int main(int argc, char** argv)
{
    using namespace ChannelKey;
    using namespace ChannelKey::Issuer;

    int exitCode = 0;
    try
    {
        const auto programOptions = parseProgramOptions(argc, argv);
        if (programOptions.showHelp)
        {
            std::cout << programOptions.helpText << std::endl;
            return 0;
        }

        setupLogging(programOptions.verbose);

        auto config = loadConfig();
        if (programOptions.format)
            config.format = *programOptions.format;

        std::shared_ptr<Token::SaltProvider> saltProvider;
        if (programOptions.salt)
            saltProvider = std::make_shared<Token::FixedSaltProvider>(*programOptions.salt);
        else
            saltProvider = std::make_shared<Token::RandomSaltProvider>();

        std::shared_ptr<Token::TimeProvider> timeProvider;
        if (programOptions.timestamp)
            timeProvider = std::make_shared<Token::FixedTimeProvider>(*programOptions.timestamp);
        else
            timeProvider = std::make_shared<Token::SystemTimeProvider>();

        if (programOptions.salt || programOptions.timestamp)
            spdlog::warn("Salt or timestamp is pinned! This is only for testing purposes!");

        const TokenIssuer issuer{config, saltProvider, timeProvider};
        const auto ttl = programOptions.ttl.value_or(config.defaultTtl);

        const auto token = programOptions.rtm
            ? issuer.issueRtmToken(programOptions.user, ttl)
            : issuer.issueRtcToken(programOptions.channel, programOptions.subject, programOptions.role, ttl);

        std::cout << token << std::endl;
    }
    catch (std::exception const& exc)
    {
        spdlog::error("{}", exc.what());
        exitCode = 1;
    }
    spdlog::shutdown();
    return exitCode;
}
