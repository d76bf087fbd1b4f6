#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ArcticLink {

/**
 * @brief Finds and parses JSON config files across a fixed list of directories.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. ./config/
 * 3. ~/.config/arcticlink/
 * 4. /etc/arcticlink/
 *
 * In each directory a "<name>.local" file shadows "<name>" entirely.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    // Fails when the file is missing, empty, or does not parse into T.
    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // Like load(), but a missing file yields a default-constructed T.
    template <typename T>
    static Result<T, std::string> loadOrDefault(const std::string& filename);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> readJson(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> convert(const nlohmann::json& json, const std::string& origin);
};

template <typename T>
Result<T, std::string> ConfigLoader::convert(const nlohmann::json& json, const std::string& origin)
{
    try {
        T config;
        // Unqualified so ADL picks up the config type's from_json.
        from_json(json, config);
        return Result<T, std::string>::okay(std::move(config));
    }
    catch (const nlohmann::json::exception& e) {
        return Result<T, std::string>::error("Invalid values in " + origin + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        return Result<T, std::string>::error("Config file not found: " + filename);
    }

    auto json = readJson(path.value());
    if (json.isError()) {
        return Result<T, std::string>::error(json.errorValue());
    }
    return convert<T>(json.value(), path->string());
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOrDefault(const std::string& filename)
{
    if (!findConfigFile(filename).has_value()) {
        return Result<T, std::string>::okay(T{});
    }
    return load<T>(filename);
}

} // namespace ArcticLink
