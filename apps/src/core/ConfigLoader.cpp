#include "ConfigLoader.h"

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace GeneticCars {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

namespace {

bool isRegularFile(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.emplace_back(*explicitConfigDir_);
    }

    if (const char* envDir = std::getenv(ConfigDirEnv); envDir && *envDir) {
        paths.emplace_back(envDir);
    }

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / "config");
    }

    if (const char* home = std::getenv("HOME"); home && *home) {
        paths.push_back(fs::path(home) / ".config" / "geneticcars");
    }

    paths.emplace_back("/etc/geneticcars");
    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    for (const auto& dir : getSearchPaths()) {
        for (const auto& candidate : { dir / (filename + ".local"), dir / filename }) {
            if (isRegularFile(candidate)) {
                LOG_DEBUG(Config, "ConfigLoader: {} resolved to {}", filename, candidate.string());
                return candidate;
            }
        }
    }
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::loadJsonFile(const std::filesystem::path& path)
{
    using R = Result<nlohmann::json, std::string>;

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        const std::string error = "Cannot read config file " + path.string() + ": " + ec.message();
        LOG_WARN(Config, "ConfigLoader: {}", error);
        return R::error(error);
    }
    if (size == 0) {
        const std::string error = "Empty config file: " + path.string();
        LOG_WARN(Config, "ConfigLoader: {}", error);
        return R::error(error);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        const std::string error = "Cannot open config file: " + path.string();
        LOG_WARN(Config, "ConfigLoader: {}", error);
        return R::error(error);
    }

    try {
        return R::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        const std::string error = "Parse error in " + path.string() + ": " + e.what();
        LOG_ERROR(Config, "ConfigLoader: {}", error);
        return R::error(error);
    }
}

} // namespace GeneticCars
