#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include "Result.h"

#include <cassert>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace GenePool {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Cli, Config, Evolution, Persistence, Pool, Selection };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Cli:
            return "cli";
        case LogChannel::Config:
            return "config";
        case LogChannel::Evolution:
            return "evolution";
        case LogChannel::Persistence:
            return "persistence";
        case LogChannel::Pool:
            return "pool";
        case LogChannel::Selection:
            return "selection";
    }
    assert(false && "Unhandled LogChannel in switch");
    return "";
}

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Provides named loggers for the engine's subsystems so a long training run
 * can be debugged one area at a time.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for the log pattern (e.g., "cli", "tests")
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default");

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>.
     * A missing file is created with defaults; an unreadable one is an error.
     * @return error message if the config could not be applied
     */
    static Result<std::monostate, std::string> initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    /**
     * @brief Get a specific channel logger.
     */
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "evolution:debug,pool:trace"
     *   "*:off,selection:trace"
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);
    static void createChannelLoggers();

    static nlohmann::json defaultConfig();
    static Result<nlohmann::json, std::string> loadConfigFile(const std::string& configPath);
    static bool createDefaultConfigFile(const std::string& path);
    static void applyConfig(const nlohmann::json& config, const std::string& componentName);
    static void installDefaultLogger(
        const std::string& componentName,
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& filePath);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// clang-format off
#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::GenePool::LoggingChannels::get(::GenePool::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::GenePool::LoggingChannels::get(::GenePool::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::GenePool::LoggingChannels::get(::GenePool::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::GenePool::LoggingChannels::get(::GenePool::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::GenePool::LoggingChannels::get(::GenePool::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)
// clang-format on

} // namespace GenePool
