#include "LoggingChannels.h"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

namespace EvoScope {

namespace {
constexpr const char* kLogFile = "evoscope.log";

constexpr std::array<LogChannel, 5> kAllChannels = {
    LogChannel::Config, LogChannel::Frontier, LogChannel::Layout,
    LogChannel::Lineage, LogChannel::Surface,
};

// Guards initialized_ so concurrent first calls to get() initialize once.
std::recursive_mutex& initMutex()
{
    static std::recursive_mutex mutex;
    return mutex;
}

spdlog::sink_ptr makeConsoleSink(bool toStderr)
{
    if (toStderr) {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
}

std::string componentPattern(const std::string& componentName, bool includeChannel)
{
    const std::string channel = includeChannel ? "[%n] " : "";
    if (componentName == "default") {
        return "[%H:%M:%S.%e] " + channel + "[%^%l%$] [%s:%#] %v";
    }
    return "[%H:%M:%S.%e] [" + componentName + "] " + channel + "[%^%l%$] [%s:%#] %v";
}
} // namespace

bool LoggingChannels::initialized_ = false;
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

    auto consoleSink = makeConsoleSink(consoleToStderr);
    consoleSink->set_level(consoleLevel);

    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
    fileSink->set_level(fileLevel);

    sharedSinks_ = { consoleSink, fileSink };

    const std::string pattern = componentPattern(componentName, true);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::info);
    installDefaultLogger(consoleLevel, fileLevel, componentName, consoleToStderr);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized");
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName, bool consoleToStderr)
{
    namespace fs = std::filesystem;

    std::lock_guard<std::recursive_mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    const std::string localPath = configPath + ".local";
    std::string pathToUse;
    if (fs::exists(localPath)) {
        pathToUse = localPath;
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        initialize(spdlog::level::info, spdlog::level::debug, componentName, consoleToStderr);
        return false;
    }

    nlohmann::json config;
    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            initialize(spdlog::level::info, spdlog::level::debug, componentName, consoleToStderr);
            SLOG_WARN("Cannot open logging config {}, using defaults", pathToUse);
            return false;
        }
        config = nlohmann::json::parse(configFile);
    }
    catch (const std::exception& e) {
        initialize(spdlog::level::info, spdlog::level::debug, componentName, consoleToStderr);
        SLOG_WARN("Failed to parse logging config {}: {}", pathToUse, e.what());
        return false;
    }

    applyConfig(config, componentName, consoleToStderr);
    initialized_ = true;
    SLOG_DEBUG("Loaded logging config from {}", pathToUse);
    return true;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    {
        std::lock_guard<std::recursive_mutex> lock(initMutex());
        if (!initialized_) {
            initialize();
        }
    }

    auto logger = spdlog::get(toString(channel));
    if (!logger) {
        // Someone dropped the registry (spdlog::drop_all); fall back rather than crash.
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);

        const size_t colonPos = item.find(':');
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

        const auto level = parseLevelString(levelStr);

        if (channel == "*") {
            for (const LogChannel each : kAllChannels) {
                setChannelLevel(each, level);
            }
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    get(channel)->set_level(level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

void LoggingChannels::createChannelLoggers(spdlog::level::level_enum level)
{
    for (const LogChannel channel : kAllChannels) {
        createLogger(toString(channel), sharedSinks_, level);
    }
}

void LoggingChannels::installDefaultLogger(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    // Separate sinks so the default logger's pattern can omit the channel name.
    auto consoleSink = makeConsoleSink(consoleToStderr);
    consoleSink->set_level(consoleLevel);
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, false);
    fileSink->set_level(fileLevel);

    const std::string pattern = componentPattern(componentName, false);
    consoleSink->set_pattern(pattern);
    fileSink->set_pattern(pattern);

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    std::vector<spdlog::sink_ptr> sinks = { consoleSink, fileSink };
    auto defaultLogger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
    defaultLogger->set_level(spdlog::level::info);

    spdlog::set_default_logger(defaultLogger);
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
    spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
    return spdlog::level::info;
}

void LoggingChannels::applyConfig(
    const nlohmann::json& config, const std::string& componentName, bool consoleToStderr)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string pattern = componentPattern(componentName, true);
    std::string filePath = kLogFile;
    bool consoleEnabled = true;
    bool fileEnabled = true;
    bool truncate = true;
    int flushIntervalMs = 1000;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config.at("defaults");
            consoleLevel = parseLevelString(defaults.value("console_level", "info"));
            fileLevel = parseLevelString(defaults.value("file_level", "debug"));
            flushIntervalMs = defaults.value("flush_interval_ms", 1000);
            if (defaults.contains("pattern") && componentName == "default") {
                pattern = defaults.at("pattern").get<std::string>();
            }
        }
        if (config.contains("sinks")) {
            const auto& sinks = config.at("sinks");
            if (sinks.contains("console")) {
                consoleEnabled = sinks.at("console").value("enabled", true);
                consoleLevel =
                    parseLevelString(sinks.at("console").value("level", std::string("info")));
            }
            if (sinks.contains("file")) {
                const auto& fileCfg = sinks.at("file");
                fileEnabled = fileCfg.value("enabled", true);
                fileLevel = parseLevelString(fileCfg.value("level", std::string("debug")));
                filePath = fileCfg.value("path", std::string(kLogFile));
                truncate = fileCfg.value("truncate", true);
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading logging config: {}, using built-in defaults", e.what());
    }

    sharedSinks_.clear();
    if (consoleEnabled) {
        auto consoleSink = makeConsoleSink(consoleToStderr);
        consoleSink->set_level(consoleLevel);
        sharedSinks_.push_back(consoleSink);
    }
    if (fileEnabled) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, truncate);
        fileSink->set_level(fileLevel);
        sharedSinks_.push_back(fileSink);
    }
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::trace);

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config.at("channels").items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    installDefaultLogger(consoleLevel, fileLevel, componentName, consoleToStderr);
    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
}

} // namespace EvoScope
