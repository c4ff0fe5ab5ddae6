#pragma once

#include "Result.h"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace EvoScope {

/**
 * Maps layout.json and surface.json onto their config structs.
 *
 * Directories are tried in order: the --config-dir override, ./config,
 * ~/.config/evoscope, /etc/evoscope. Within a directory "<name>.local" shadows
 * "<name>" entirely.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    static std::vector<std::filesystem::path> getSearchPaths();
    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);

    // Parsed JSON of the first file found for this name.
    static Result<nlohmann::json, std::string> readJson(const std::string& filename);

    // T is filled through an ADL from_json(const nlohmann::json&, T&).
    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // A missing file yields T{}; an unreadable or invalid one is still an error.
    template <typename T>
    static Result<T, std::string> loadOrDefault(const std::string& filename);

private:
    static std::optional<std::string> configDir_;
};

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto json = readJson(filename);
    if (json.isError()) {
        return Result<T, std::string>::error(json.errorValue());
    }

    try {
        T config{};
        from_json(json.value(), config);
        return Result<T, std::string>::okay(std::move(config));
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + filename + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOrDefault(const std::string& filename)
{
    if (!findConfigFile(filename)) {
        return Result<T, std::string>::okay(T{});
    }
    return load<T>(filename);
}

} // namespace EvoScope
