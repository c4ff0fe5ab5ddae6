#pragma once

#include "core/Result.h"
#include "core/RunData.h"
#include "core/frontier/SurfaceConfig.h"
#include "core/lineage/LayoutConfig.h"

#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace EvoScope {
namespace Client {

struct CommandOptions {
    int maxDepth = std::numeric_limits<int>::max();
    std::optional<int> gridResolution; // Falls back to SurfaceConfig::gridResolution.
    std::optional<RecordId> target;
    LayoutConfig layout;
    SurfaceConfig surface;
};

struct CliCommandInfo {
    std::string name;
    std::string description;
};

const std::vector<CliCommandInfo>& getCliCommands();

/**
 * Run a named analysis command over a loaded run and return its JSON output.
 * Errors carry a message suitable for printing to the user.
 */
Result<nlohmann::json, std::string> runCommand(
    const std::string& name, const RunData& run, const CommandOptions& options);

Result<nlohmann::json, std::string> runLayoutCommand(
    const RunData& run, const CommandOptions& options);
Result<nlohmann::json, std::string> runParetoCommand(
    const RunData& run, const CommandOptions& options);
Result<nlohmann::json, std::string> runSurfaceCommand(
    const RunData& run, const CommandOptions& options);
Result<nlohmann::json, std::string> runPathCommand(
    const RunData& run, const CommandOptions& options);

} // namespace Client
} // namespace EvoScope
