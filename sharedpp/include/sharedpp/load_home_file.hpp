#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ChannelKey
{
    void setupHome();
    std::string loadHomeFile(std::filesystem::path const& subpath);
    std::optional<std::string> tryLoadHomeFile(std::filesystem::path const& subpath);
    std::filesystem::path getHomePath();
} // namespace ChannelKey
