#include "ConfigLoader.h"
#include "LoggingChannels.h"

#include <cstdlib>
#include <fstream>

namespace EvoScope {

namespace fs = std::filesystem;

std::optional<std::string> ConfigLoader::configDir_;

void ConfigLoader::setConfigDir(const std::string& path)
{
    configDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    configDir_.reset();
}

std::vector<fs::path> ConfigLoader::getSearchPaths()
{
    std::vector<fs::path> dirs;
    if (configDir_) {
        dirs.emplace_back(*configDir_);
    }
    dirs.push_back(fs::current_path() / "config");
    if (const char* home = std::getenv("HOME")) {
        dirs.push_back(fs::path(home) / ".config" / "evoscope");
    }
    dirs.emplace_back("/etc/evoscope");
    return dirs;
}

std::optional<fs::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    for (const fs::path& dir : getSearchPaths()) {
        for (const fs::path& candidate : { dir / (filename + ".local"), dir / filename }) {
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::readJson(const std::string& filename)
{
    using JsonResult = Result<nlohmann::json, std::string>;

    const auto path = findConfigFile(filename);
    if (!path) {
        LOG_DEBUG(Config, "{} not found in any config directory.", filename);
        return JsonResult::error("Config file not found: " + filename);
    }

    std::ifstream file(*path);
    if (!file.is_open()) {
        LOG_WARN(Config, "Cannot open {}", path->string());
        return JsonResult::error("Cannot open config file: " + path->string());
    }
    if (file.peek() == std::ifstream::traits_type::eof()) {
        LOG_WARN(Config, "{} is empty.", path->string());
        return JsonResult::error("Empty config file: " + path->string());
    }

    try {
        nlohmann::json json = nlohmann::json::parse(file);
        LOG_INFO(Config, "Using config {}", path->string());
        return JsonResult::okay(std::move(json));
    }
    catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR(Config, "{}: {}", path->string(), e.what());
        return JsonResult::error("Parse error in " + path->string() + ": " + e.what());
    }
}

} // namespace EvoScope
