#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace EvoScope {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Config, Frontier, Layout, Lineage, Surface };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Config:
            return "config";
        case LogChannel::Frontier:
            return "frontier";
        case LogChannel::Layout:
            return "layout";
        case LogChannel::Lineage:
            return "lineage";
        case LogChannel::Surface:
            return "surface";
    }
    return "";
}

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Each algorithm logs to its own named spdlog logger so a caller can turn up
 * layout tracing without drowning in frontier output.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for log pattern (e.g., "cli", "tests")
     * @param consoleToStderr Send console output to stderr instead of stdout
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>.
     * @return true if a config file was applied, false if built-in defaults were used
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Get a specific channel logger.
     */
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "layout:trace,frontier:debug"
     *   "*:off,lineage:warn"
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

    static void createChannelLoggers(spdlog::level::level_enum level);

    static void installDefaultLogger(
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& componentName,
        bool consoleToStderr);

    static void applyConfig(
        const nlohmann::json& config, const std::string& componentName, bool consoleToStderr);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// clang-format off
#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::EvoScope::LoggingChannels::get(::EvoScope::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::EvoScope::LoggingChannels::get(::EvoScope::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::EvoScope::LoggingChannels::get(::EvoScope::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::EvoScope::LoggingChannels::get(::EvoScope::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::EvoScope::LoggingChannels::get(::EvoScope::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)
// clang-format on

} // namespace EvoScope
