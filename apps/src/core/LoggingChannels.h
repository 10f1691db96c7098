#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include "Result.h"

#include <array>
#include <memory>
#include <optional>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace GeneticCars {

enum class LogChannel {
    Cli,
    Config,
    Evolution,
    Operators,
    Phenotype,
};

// One row per LogChannel. Phenotype decoding runs once per individual per generation,
// so it starts quieter than the rest.
struct LogChannelInfo {
    LogChannel channel;
    const char* name;
    spdlog::level::level_enum defaultLevel;
};

inline constexpr std::array<LogChannelInfo, 5> LogChannelTable{ {
    { LogChannel::Cli, "cli", spdlog::level::info },
    { LogChannel::Config, "config", spdlog::level::info },
    { LogChannel::Evolution, "evolution", spdlog::level::info },
    { LogChannel::Operators, "operators", spdlog::level::info },
    { LogChannel::Phenotype, "phenotype", spdlog::level::warn },
} };

const char* toString(LogChannel channel);
std::optional<LogChannel> logChannelFromName(std::string_view name);

/**
 * Named loggers sharing one console sink and the geneticcars.log file sink.
 *
 * A long training run can be traced per concern (e.g. operator fallbacks at debug)
 * without flooding the console with phenotype decoding.
 */
class LoggingChannels {
public:
    /**
     * @param consoleLevel Sink level for console output
     * @param fileLevel Sink level for geneticcars.log
     * @param componentName Prefix shown in every line (e.g. "cli")
     * @param consoleToStderr Send console output to stderr so stdout stays JSON only
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    // Initializes with defaults on first use.
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * Applies "channel:level" items separated by commas; "*" addresses every channel.
     *   "operators:trace,evolution:debug"
     *   "*:warn,cli:info"
     * Valid items are applied even when others are rejected. The error lists every
     * rejected item.
     */
    static Result<std::monostate, std::string> configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);

    // Lowers or raises the console sinks; loggers keep their own levels.
    static void setConsoleLevel(spdlog::level::level_enum level);

    // Every channel back to its LogChannelTable default.
    static void resetChannelLevels();

    static std::optional<spdlog::level::level_enum> parseLevelString(const std::string& levelStr);

private:
    static bool initialized_;
    static std::vector<spdlog::sink_ptr> consoleSinks_;
};

// clang-format off
#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(LoggingChannels::get(::GeneticCars::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(LoggingChannels::get(::GeneticCars::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(LoggingChannels::get(::GeneticCars::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(LoggingChannels::get(::GeneticCars::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(LoggingChannels::get(::GeneticCars::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)
// clang-format on

} // namespace GeneticCars
