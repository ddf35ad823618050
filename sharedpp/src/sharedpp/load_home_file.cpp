#include <sharedpp/load_home_file.hpp>

#include <roar/filesystem/special_paths.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std::literals;

namespace ChannelKey
{
    std::string loadHomeFile(std::filesystem::path const& subpath)
    {
        const auto path = getHomePath() / subpath;
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
            throw std::runtime_error("Cannot load home file "s + path.string());
        std::stringstream sstr;
        sstr << reader.rdbuf();
        return sstr.str();
    }
    std::optional<std::string> tryLoadHomeFile(std::filesystem::path const& subpath)
    {
        std::error_code ec;
        if (!std::filesystem::exists(getHomePath() / subpath, ec))
            return std::nullopt;
        return loadHomeFile(subpath);
    }
    std::filesystem::path getHomePath()
    {
        return Roar::resolvePath("~/.channelkey");
    }
    void setupHome()
    {
        const auto logPath = getHomePath() / "logs";
        if (!std::filesystem::exists(logPath))
            std::filesystem::create_directories(logPath);
    }
} // namespace ChannelKey
