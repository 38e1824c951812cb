#include "LoggingChannels.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace GenePool {

namespace {
constexpr const char* kDefaultLogFile = "genepool.log";
constexpr const char* kBasePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";

std::string patternForComponent(const std::string& basePattern, const std::string& componentName)
{
    if (componentName == "default") {
        return basePattern;
    }

    // Inject component name after the timestamp.
    const size_t pos = basePattern.find("] ");
    if (pos == std::string::npos) {
        return "[" + componentName + "] " + basePattern;
    }
    return basePattern.substr(0, pos + 2) + "[" + componentName + "] " + basePattern.substr(pos + 2);
}

std::string trim(std::string value)
{
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);
    return value;
}
} // namespace

// Static member initialization.
bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(consoleLevel);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kDefaultLogFile, true);
    file_sink->set_level(fileLevel);

    sharedSinks_ = { console_sink, file_sink };

    const std::string pattern = patternForComponent(kBasePattern, componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers();
    installDefaultLogger(componentName, consoleLevel, fileLevel, kDefaultLogFile);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_INFO("LoggingChannels initialized successfully");
}

Result<std::monostate, std::string> LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    using LoadResult = Result<std::monostate, std::string>;

    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return LoadResult::okay(std::monostate{});
    }

    auto config = loadConfigFile(configPath);
    if (config.isError()) {
        return LoadResult::error(config.errorValue());
    }

    applyConfig(config.value(), componentName);

    initialized_ = true;
    return LoadResult::okay(std::monostate{});
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    assert(logger && "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    if (!initialized_) {
        initialize();
    }

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);

        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

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

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

void LoggingChannels::createChannelLoggers()
{
    createLogger("cli", sharedSinks_, spdlog::level::info);
    createLogger("config", sharedSinks_, spdlog::level::info);
    createLogger("evolution", sharedSinks_, spdlog::level::info);
    createLogger("persistence", sharedSinks_, spdlog::level::info);
    createLogger("pool", sharedSinks_, spdlog::level::info);
    createLogger("selection", sharedSinks_, spdlog::level::warn);
}

void LoggingChannels::installDefaultLogger(
    const std::string& componentName,
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& filePath)
{
    // Separate sinks for the default logger so its pattern doesn't affect channel loggers.
    auto default_console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    default_console_sink->set_level(consoleLevel);
    auto default_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, false);
    default_file_sink->set_level(fileLevel);

    const std::string defaultPattern =
        patternForComponent("[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v", componentName);
    default_console_sink->set_pattern(defaultPattern);
    default_file_sink->set_pattern(defaultPattern);

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    std::vector<spdlog::sink_ptr> defaultSinks = { default_console_sink, default_file_sink };
    auto default_logger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    default_logger->set_level(spdlog::level::info);

    spdlog::set_default_logger(default_logger);
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

nlohmann::json LoggingChannels::defaultConfig()
{
    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kBasePattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kDefaultLogFile },
                { "truncate", true } } } } },
        { "channels",
          { { "cli", "info" },
            { "config", "info" },
            { "evolution", "info" },
            { "persistence", "info" },
            { "pool", "info" },
            { "selection", "warn" } } }
    };
}

bool LoggingChannels::createDefaultConfigFile(const std::string& path)
{
    try {
        std::ofstream configFile(path);
        if (!configFile.is_open()) {
            spdlog::error("Failed to create config file: {}", path);
            return false;
        }
        configFile << defaultConfig().dump(2) << std::endl;
        spdlog::info("Created default logging config file: {}", path);
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to write default config file {}: {}", path, e.what());
        return false;
    }
}

Result<nlohmann::json, std::string> LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;
    using LoadResult = Result<nlohmann::json, std::string>;

    // Try .local version first.
    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
        spdlog::info("Using default config: {}", configPath);
    }
    else {
        spdlog::info("Config file not found, creating default: {}", configPath);
        if (!createDefaultConfigFile(configPath)) {
            spdlog::warn("Could not create config file, using built-in defaults");
        }
        return LoadResult::okay(defaultConfig());
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            return LoadResult::error("Cannot open logging config file: " + pathToUse);
        }

        nlohmann::json config = nlohmann::json::parse(configFile);
        spdlog::info("Loaded logging config from {}", pathToUse);
        return LoadResult::okay(config);
    }
    catch (const nlohmann::json::parse_error& e) {
        return LoadResult::error(
            "Failed to parse logging config " + pathToUse + ": " + std::string(e.what()));
    }
    catch (const std::exception& e) {
        return LoadResult::error(
            "Error reading logging config " + pathToUse + ": " + std::string(e.what()));
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string pattern = patternForComponent(kBasePattern, componentName);
    int flushIntervalMs = 1000;
    std::string filePath = kDefaultLogFile;

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
                pattern =
                    patternForComponent(defaults["pattern"].get<std::string>(), componentName);
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
        if (config.contains("sinks")) {
            const auto& sinksConfig = config["sinks"];

            if (sinksConfig.contains("console")) {
                const auto& consoleCfg = sinksConfig["console"];
                if (consoleCfg.value("enabled", true)) {
                    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                    console_sink->set_level(parseLevelString(consoleCfg.value("level", "info")));
                    sinks.push_back(console_sink);
                }
            }

            if (sinksConfig.contains("file")) {
                const auto& fileCfg = sinksConfig["file"];
                if (fileCfg.value("enabled", true)) {
                    filePath = fileCfg.value("path", std::string(kDefaultLogFile));
                    const auto level = parseLevelString(fileCfg.value("level", "debug"));

                    // Use rotating sink if max_size_mb is specified, otherwise basic sink.
                    std::shared_ptr<spdlog::sinks::sink> file_sink;
                    if (fileCfg.contains("max_size_mb")) {
                        const size_t maxSizeMB = fileCfg.value("max_size_mb", 100);
                        const size_t maxFiles = fileCfg.value("max_files", 3);
                        file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                            filePath, maxSizeMB * 1024 * 1024, maxFiles);
                    }
                    else {
                        file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                            filePath, fileCfg.value("truncate", true));
                    }

                    file_sink->set_level(level);
                    sinks.push_back(file_sink);
                }
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(consoleLevel);
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kDefaultLogFile, true);
        file_sink->set_level(fileLevel);
        sinks = { console_sink, file_sink };
    }

    sharedSinks_ = sinks;
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers();

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    installDefaultLogger(componentName, consoleLevel, fileLevel, filePath);

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
}

} // namespace GenePool
