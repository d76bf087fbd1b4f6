#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace ArcticLink {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.emplace_back(explicitConfigDir_.value());
    }

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / "config");
    }

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "arcticlink");
    }

    paths.emplace_back("/etc/arcticlink");
    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;

    for (const auto& dir : getSearchPaths()) {
        for (const auto& candidate : { dir / (filename + ".local"), dir / filename }) {
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }

    SLOG_DEBUG("ConfigLoader: {} not found in any search path", filename);
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::readJson(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0) {
        std::string error = "Empty or unreadable config file: " + path.string();
        SLOG_WARN("ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        std::string error = "Cannot open config file: " + path.string();
        SLOG_WARN("ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    auto json = nlohmann::json::parse(file, nullptr, false);
    if (json.is_discarded()) {
        std::string error = "Parse error in " + path.string();
        SLOG_ERROR("ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    SLOG_INFO("ConfigLoader: Loaded config from {}", path.string());
    return Result<nlohmann::json, std::string>::okay(std::move(json));
}

} // namespace ArcticLink
