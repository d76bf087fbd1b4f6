#pragma once

// Compile every level in; channels filter at runtime.
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <atomic>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace ArcticLink {

// One logger per subsystem.
enum class LogChannel { Discovery, Network, Pairing, Session, State, Storage };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Discovery:
            return "discovery";
        case LogChannel::Network:
            return "network";
        case LogChannel::Pairing:
            return "pairing";
        case LogChannel::Session:
            return "session";
        case LogChannel::State:
            return "state";
        case LogChannel::Storage:
            return "storage";
    }
    return "";
}

/**
 * @brief Per-subsystem spdlog loggers sharing one console sink and one file sink.
 *
 * Lets probe traffic be traced at trace level while session and storage stay
 * at info. Loggers are created lazily, so LOG_* is safe before initialize().
 */
class LoggingChannels {
public:
    // componentName tags the console pattern; consoleToStderr keeps stdout clean
    // for command output.
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Reads sinks and channel levels from JSON. "<path>.local" wins over
     * "<path>". Returns false when neither exists and built-in defaults were used.
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    // "network:trace,pairing:debug" or "*:off,session:info". Later entries win.
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    // Never log a full credential; pass it through this first.
    static std::string redact(const std::string& secret);

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    // Missing or unparseable files yield defaultConfig().
    static nlohmann::json loadConfigFile(const std::string& configPath);
    static nlohmann::json defaultConfig();
    static void applyConfig(const nlohmann::json& config, const std::string& componentName);

    static std::atomic<bool> initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// Other libraries define LOG_* too.
#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

// clang-format off
#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::ArcticLink::LoggingChannels::get(::ArcticLink::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::ArcticLink::LoggingChannels::get(::ArcticLink::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::ArcticLink::LoggingChannels::get(::ArcticLink::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::ArcticLink::LoggingChannels::get(::ArcticLink::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::ArcticLink::LoggingChannels::get(::ArcticLink::LogChannel::channel), __VA_ARGS__)

// Channel-less variants on the default logger.
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)
// clang-format on

} // namespace ArcticLink
