#include "LoggingChannels.h"
#include "Assert.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace GeneticCars {

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::consoleSinks_;

namespace {

constexpr const char* LogFileName = "geneticcars.log";

spdlog::sink_ptr makeConsoleSink(bool toStderr, spdlog::level::level_enum level)
{
    spdlog::sink_ptr sink;
    if (toStderr) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    sink->set_level(level);
    return sink;
}

std::string linePattern(const std::string& componentName, bool withChannel)
{
    std::string pattern = "[%H:%M:%S.%e] ";
    if (componentName != "default") {
        pattern += "[" + componentName + "] ";
    }
    if (withChannel) {
        pattern += "[%n] ";
    }
    return pattern + "[%^%l%$] [%s:%#] %v";
}

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

const char* toString(LogChannel channel)
{
    for (const auto& info : LogChannelTable) {
        if (info.channel == channel) {
            return info.name;
        }
    }
    return "";
}

std::optional<LogChannel> logChannelFromName(std::string_view name)
{
    for (const auto& info : LogChannelTable) {
        if (name == info.name) {
            return info.channel;
        }
    }
    return std::nullopt;
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    // Channel loggers and the default logger differ only in whether [%n] is printed,
    // so each gets its own sink pair over the same console stream and log file.
    auto channelConsole = makeConsoleSink(consoleToStderr, consoleLevel);
    auto channelFile = std::make_shared<spdlog::sinks::basic_file_sink_mt>(LogFileName, true);
    channelFile->set_level(fileLevel);
    const std::vector<spdlog::sink_ptr> channelSinks = { channelConsole, channelFile };
    for (const auto& sink : channelSinks) {
        sink->set_pattern(linePattern(componentName, true));
    }

    for (const auto& info : LogChannelTable) {
        auto logger =
            std::make_shared<spdlog::logger>(info.name, channelSinks.begin(), channelSinks.end());
        logger->set_level(info.defaultLevel);
        spdlog::register_logger(logger);
    }

    auto defaultConsole = makeConsoleSink(consoleToStderr, consoleLevel);
    auto defaultFile = std::make_shared<spdlog::sinks::basic_file_sink_mt>(LogFileName, false);
    defaultFile->set_level(fileLevel);
    const std::vector<spdlog::sink_ptr> defaultSinks = { defaultConsole, defaultFile };
    for (const auto& sink : defaultSinks) {
        sink->set_pattern(linePattern(componentName, false));
    }

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    auto defaultLogger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    consoleSinks_ = { channelConsole, defaultConsole };
    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Unit tests linked against gtest_main reach here without an explicit initialize().
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    GENETICCARS_ASSERT(logger != nullptr, "LogChannel not found after initialization");
    return logger;
}

Result<std::monostate, std::string> LoggingChannels::configureFromString(const std::string& spec)
{
    using R = Result<std::monostate, std::string>;

    if (!initialized_) {
        initialize();
    }

    std::vector<std::string> rejected;
    std::stringstream ss(spec);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }

        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            rejected.push_back("'" + item + "' (expected channel:level)");
            continue;
        }

        const std::string channelName = trim(item.substr(0, colonPos));
        const std::string levelName = trim(item.substr(colonPos + 1));
        const auto level = parseLevelString(levelName);
        if (!level.has_value()) {
            rejected.push_back("'" + item + "' (unknown level '" + levelName + "')");
            continue;
        }

        if (channelName == "*") {
            spdlog::apply_all(
                [&level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(*level); });
            continue;
        }

        const auto channel = logChannelFromName(channelName);
        if (!channel.has_value()) {
            rejected.push_back("'" + item + "' (unknown channel '" + channelName + "')");
            continue;
        }
        setChannelLevel(*channel, *level);
    }

    if (rejected.empty()) {
        return R::okay(std::monostate{});
    }

    std::string error = "Invalid log channel spec:";
    for (const auto& entry : rejected) {
        error += " " + entry;
    }
    return R::error(error);
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    get(channel)->set_level(level);
}

void LoggingChannels::setConsoleLevel(spdlog::level::level_enum level)
{
    if (!initialized_) {
        initialize();
    }
    for (auto& sink : consoleSinks_) {
        sink->set_level(level);
    }
}

void LoggingChannels::resetChannelLevels()
{
    for (const auto& info : LogChannelTable) {
        setChannelLevel(info.channel, info.defaultLevel);
    }
}

std::optional<spdlog::level::level_enum> LoggingChannels::parseLevelString(
    const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    if (lower == "err" || lower == "error") {
        return spdlog::level::err;
    }

    // The remaining spdlog level names: trace, debug, info, critical, off.
    for (int i = spdlog::level::trace; i < spdlog::level::n_levels; ++i) {
        const auto level = static_cast<spdlog::level::level_enum>(i);
        const auto name = spdlog::level::to_string_view(level);
        if (std::string_view(name.data(), name.size()) == lower) {
            return level;
        }
    }
    return std::nullopt;
}

} // namespace GeneticCars
