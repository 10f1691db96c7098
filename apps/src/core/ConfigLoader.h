#pragma once

#include "LoggingChannels.h"
#include "Result.h"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace GeneticCars {

/**
 * Finds and parses JSON config files such as evolution.json.
 *
 * Directories are searched in order, first match wins:
 *   1. the directory given to setConfigDir() (the CLI's --config-dir)
 *   2. $GENETICCARS_CONFIG_DIR
 *   3. ./config/
 *   4. ~/.config/geneticcars/
 *   5. /etc/geneticcars/
 *
 * In each directory `<name>.local` is preferred over `<name>`. A .local file replaces the
 * base file entirely; the two are never merged.
 */
class ConfigLoader {
public:
    static constexpr const char* ConfigDirEnv = "GENETICCARS_CONFIG_DIR";

    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    // Missing file, unreadable file, bad JSON, and from_json failures are all errors.
    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // Like load(), but a file missing from every search directory yields T{}.
    template <typename T>
    static Result<T, std::string> loadOrDefault(const std::string& filename);

    // Parse a JSON file at an exact path, bypassing the search order.
    static Result<nlohmann::json, std::string> loadJsonFile(const std::filesystem::path& path);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    template <typename T>
    static Result<T, std::string> parse(const std::filesystem::path& path);

    static std::optional<std::string> explicitConfigDir_;
};

template <typename T>
Result<T, std::string> ConfigLoader::parse(const std::filesystem::path& path)
{
    auto json = loadJsonFile(path);
    if (json.isError()) {
        return Result<T, std::string>::error(json.errorValue());
    }

    try {
        T config{};
        // Unqualified so ADL finds the config type's from_json.
        from_json(json.value(), config);
        return Result<T, std::string>::okay(std::move(config));
    }
    catch (const std::exception& e) {
        const std::string error =
            "Failed to parse " + path.filename().string() + " (" + path.string() + "): " + e.what();
        LOG_ERROR(Config, "ConfigLoader: {}", error);
        return Result<T, std::string>::error(error);
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path.has_value()) {
        const std::string error = "Config file not found: " + filename;
        LOG_DEBUG(Config, "ConfigLoader: {}", error);
        return Result<T, std::string>::error(error);
    }

    LOG_INFO(Config, "ConfigLoader: Loading {} from {}", filename, path->string());
    return parse<T>(*path);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOrDefault(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path.has_value()) {
        LOG_INFO(Config, "ConfigLoader: No {} found, using defaults", filename);
        return Result<T, std::string>::okay(T{});
    }

    LOG_INFO(Config, "ConfigLoader: Loading {} from {}", filename, path->string());
    return parse<T>(*path);
}

} // namespace GeneticCars
