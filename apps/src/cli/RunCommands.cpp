#include "RunCommands.h"
#include "core/frontier/Dominance.h"
#include "core/frontier/SurfaceReconstructor.h"
#include "core/lineage/AncestorPath.h"
#include "core/lineage/LineageLayout.h"

namespace EvoScope {
namespace Client {

namespace {

using CommandResult = Result<nlohmann::json, std::string>;

std::string describe(const LineageError& error)
{
    return toString(error.kind) + " '" + error.recordId + "': " + error.message;
}

} // namespace

const std::vector<CliCommandInfo>& getCliCommands()
{
    static const std::vector<CliCommandInfo> commands = {
        { "layout", "Lineage tree layout (nodes, edges, bands, anomalies)" },
        { "pareto", "Pareto optimal set, front ranks and frontier line" },
        { "path", "Ancestor path from --target to its root" },
        { "surface", "IDW fitness surface over the quality/speed plane" },
    };
    return commands;
}

CommandResult runCommand(const std::string& name, const RunData& run, const CommandOptions& options)
{
    if (name == "layout") {
        return runLayoutCommand(run, options);
    }
    if (name == "pareto") {
        return runParetoCommand(run, options);
    }
    if (name == "path") {
        return runPathCommand(run, options);
    }
    if (name == "surface") {
        return runSurfaceCommand(run, options);
    }
    return CommandResult::error("Unknown command: " + name);
}

CommandResult runLayoutCommand(const RunData& run, const CommandOptions& options)
{
    LineageLayout layout = layoutLineage(run.mutationHistory, options.maxDepth, options.layout);

    if (options.target.has_value()) {
        auto path = resolveAncestorPath(run.mutationHistory, options.target.value());
        if (path.isError()) {
            return CommandResult::error(describe(path.errorValue()));
        }
        highlightAncestorPath(layout.edges, path.value());
    }

    nlohmann::json output = layout;
    nlohmann::json svgPaths = nlohmann::json::array();
    for (const ConnectiveEdge& edge : layout.edges) {
        svgPaths.push_back(edge.curve.toSvgPath());
    }
    output["svgPaths"] = std::move(svgPaths);
    return CommandResult::okay(std::move(output));
}

CommandResult runParetoCommand(const RunData& run, const CommandOptions& /*options*/)
{
    const std::vector<ScoredPoint> marked = markParetoOptimal(run.paretoPoints);
    const std::vector<int> ranks = computeParetoRanks(run.paretoPoints);

    nlohmann::json frontier = nlohmann::json::array();
    for (const ScoredPoint& point : frontierPolyline(run.paretoPoints)) {
        frontier.push_back(point.id);
    }

    nlohmann::json output;
    output["points"] = marked;
    output["ranks"] = ranks;
    output["optimal"] = computeParetoOptimal(run.paretoPoints);
    output["frontier"] = std::move(frontier);
    return CommandResult::okay(std::move(output));
}

CommandResult runSurfaceCommand(const RunData& run, const CommandOptions& options)
{
    const int resolution = options.gridResolution.value_or(options.surface.gridResolution);

    nlohmann::json output;
    output["resolution"] = resolution;
    output["samples"] = reconstructSurface(run.paretoPoints, resolution, options.surface);
    return CommandResult::okay(std::move(output));
}

CommandResult runPathCommand(const RunData& run, const CommandOptions& options)
{
    if (!options.target.has_value()) {
        return CommandResult::error("path requires --target");
    }

    auto path = resolveAncestorPath(run.mutationHistory, options.target.value());
    if (path.isError()) {
        return CommandResult::error(describe(path.errorValue()));
    }

    nlohmann::json output;
    output["target"] = options.target.value();
    output["path"] = path.value();
    return CommandResult::okay(std::move(output));
}

} // namespace Client
} // namespace EvoScope
