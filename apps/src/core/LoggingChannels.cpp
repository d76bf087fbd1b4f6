#include "LoggingChannels.h"
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

namespace ArcticLink {

namespace {

constexpr const char* kDefaultPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";
constexpr const char* kDefaultLogFile = "arcticlink.log";

// Guards lazy initialization; worker threads may log before main() configures anything.
std::recursive_mutex& initMutex()
{
    static std::recursive_mutex mutex;
    return mutex;
}

std::string patternFor(const std::string& basePattern, const std::string& componentName)
{
    if (componentName == "default") {
        return basePattern;
    }

    // Inject component name after the timestamp.
    size_t pos = basePattern.find("] ");
    if (pos != std::string::npos) {
        return basePattern.substr(0, pos + 2) + "[" + componentName + "] "
            + basePattern.substr(pos + 2);
    }
    return "[" + componentName + "] " + basePattern;
}

} // namespace

std::atomic<bool> LoggingChannels::initialized_{ false };
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    std::lock_guard<std::recursive_mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    spdlog::sink_ptr consoleSink;
    if (consoleToStderr) {
        consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    consoleSink->set_level(consoleLevel);

    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kDefaultLogFile, true);
    fileSink->set_level(fileLevel);

    sharedSinks_ = { consoleSink, fileSink };

    const std::string pattern = patternFor(kDefaultPattern, componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createLogger("discovery", sharedSinks_, spdlog::level::info);
    createLogger("network", sharedSinks_, spdlog::level::info);
    createLogger("pairing", sharedSinks_, spdlog::level::info);
    createLogger("session", sharedSinks_, spdlog::level::info);
    createLogger("state", sharedSinks_, spdlog::level::debug);
    createLogger("storage", sharedSinks_, spdlog::level::info);

    // Default logger gets its own sinks so its pattern (no channel name) doesn't leak.
    spdlog::sink_ptr defaultConsoleSink;
    if (consoleToStderr) {
        defaultConsoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        defaultConsoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    defaultConsoleSink->set_level(consoleLevel);
    defaultConsoleSink->set_pattern(patternFor("[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v", componentName));

    std::string loggerName = componentName.empty() ? "default" : componentName;
    auto defaultLogger = std::make_shared<spdlog::logger>(loggerName, defaultConsoleSink);
    defaultLogger->sinks().push_back(fileSink);
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        std::lock_guard<std::recursive_mutex> lock(initMutex());
        if (!initialized_) {
            initialize();
        }
    }

    auto logger = spdlog::get(toString(channel));
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    // Parse format: "channel:level,channel2:level2"
    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);

        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        std::string channel = item.substr(0, colonPos);
        std::string levelStr = item.substr(colonPos + 1);

        channel.erase(0, channel.find_first_not_of(" \t"));
        channel.erase(channel.find_last_not_of(" \t") + 1);
        levelStr.erase(0, levelStr.find_first_not_of(" \t"));
        levelStr.erase(levelStr.find_last_not_of(" \t") + 1);

        auto level = parseLevelString(levelStr);

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::info("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

std::string LoggingChannels::redact(const std::string& secret)
{
    if (secret.empty()) {
        return "<none>";
    }
    if (secret.size() <= 8) {
        return "****";
    }
    return secret.substr(0, 4) + "****";
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    if (spdlog::get(name)) {
        spdlog::drop(name);
    }
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    std::lock_guard<std::recursive_mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    bool loaded = true;
    nlohmann::json config = loadConfigFile(configPath);
    if (config.is_null()) {
        config = defaultConfig();
        loaded = false;
    }

    applyConfig(config, componentName);

    initialized_ = true;
    return loaded;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kDefaultPattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" }, { "stderr", false } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kDefaultLogFile },
                { "truncate", true },
                { "max_size_mb", 0 },
                { "max_files", 3 } } } } },
        { "channels",
          { { "discovery", "info" },
            { "network", "info" },
            { "pairing", "info" },
            { "session", "info" },
            { "state", "debug" },
            { "storage", "info" } } },
    };
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local logging config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::debug("Logging config {} not found, using built-in defaults", configPath);
        return nullptr;
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("Cannot open logging config file: {}", pathToUse);
            return nullptr;
        }
        return nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse logging config {}: {}", pathToUse, e.what());
        return nullptr;
    }
    catch (const std::exception& e) {
        spdlog::error("Error reading logging config {}: {}", pathToUse, e.what());
        return nullptr;
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string pattern = patternFor(kDefaultPattern, componentName);
    int flushIntervalMs = 1000;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            if (defaults.contains("console_level")) {
                consoleLevel = parseLevelString(defaults["console_level"].get<std::string>());
            }
            if (defaults.contains("file_level")) {
                fileLevel = parseLevelString(defaults["file_level"].get<std::string>());
            }
            if (defaults.contains("pattern")) {
                pattern = patternFor(defaults["pattern"].get<std::string>(), componentName);
            }
            if (defaults.contains("flush_interval_ms")) {
                flushIntervalMs = defaults["flush_interval_ms"].get<int>();
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading defaults from config: {}, using built-in defaults", e.what());
    }

    std::vector<spdlog::sink_ptr> sinks;

    try {
        const auto sinksConfig = config.value("sinks", nlohmann::json::object());

        const auto consoleCfg = sinksConfig.value("console", nlohmann::json::object());
        if (consoleCfg.value("enabled", true)) {
            spdlog::sink_ptr consoleSink;
            if (consoleCfg.value("stderr", false)) {
                consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            }
            else {
                consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            }
            consoleSink->set_level(
                consoleCfg.contains("level")
                    ? parseLevelString(consoleCfg["level"].get<std::string>())
                    : consoleLevel);
            sinks.push_back(consoleSink);
        }

        const auto fileCfg = sinksConfig.value("file", nlohmann::json::object());
        if (fileCfg.value("enabled", true)) {
            const std::string path = fileCfg.value("path", std::string(kDefaultLogFile));
            const int maxSizeMb = fileCfg.value("max_size_mb", 0);
            spdlog::sink_ptr fileSink;
            if (maxSizeMb > 0) {
                fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path,
                    static_cast<size_t>(maxSizeMb) * 1024 * 1024,
                    static_cast<size_t>(fileCfg.value("max_files", 3)));
            }
            else {
                fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    path, fileCfg.value("truncate", true));
            }
            fileSink->set_level(
                fileCfg.contains("level") ? parseLevelString(fileCfg["level"].get<std::string>())
                                          : fileLevel);
            sinks.push_back(fileSink);
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error creating sinks from config: {}, using console only", e.what());
        sinks.clear();
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    for (auto& sink : sinks) {
        sink->set_pattern(pattern);
    }
    sharedSinks_ = sinks;

    const auto channels = config.value("channels", defaultConfig()["channels"]);
    for (const char* name : { "discovery", "network", "pairing", "session", "state", "storage" }) {
        auto level = spdlog::level::info;
        if (channels.contains(name) && channels[name].is_string()) {
            level = parseLevelString(channels[name].get<std::string>());
        }
        createLogger(name, sharedSinks_, level);
    }

    std::string loggerName = componentName.empty() ? "default" : componentName;
    auto defaultLogger =
        std::make_shared<spdlog::logger>(loggerName, sharedSinks_.begin(), sharedSinks_.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    spdlog::flush_every(std::chrono::seconds(std::max(1, flushIntervalMs / 1000)));
}

} // namespace ArcticLink
