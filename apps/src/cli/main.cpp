#include "RunCommands.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/RunData.h"

#include <args.hxx>
#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>

using namespace EvoScope;
using namespace EvoScope::Client;

std::string getCommandListHelp()
{
    std::string help = "Commands:\n";
    for (const auto& cmd : getCliCommands()) {
        help += "  " + cmd.name + " - " + cmd.description + "\n";
    }
    return help;
}

int main(int argc, char** argv)
{
    // Initialize logging channels (logging-config.json if present, else stderr defaults).
    if (!LoggingChannels::initializeFromConfig("logging-config.json", "cli", true)) {
        SLOG_DEBUG("No logging-config.json applied; using built-in logging defaults.");
    }

    args::ArgumentParser parser(
        "EvoScope CLI: lineage layout and Pareto frontier analysis for recorded runs",
        "Output is JSON on stdout; diagnostics go to stderr and evoscope.log.");

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<int> maxDepth(
        parser, "depth", "Layout: highest generation to place (default: all)", { "max-depth" });
    args::ValueFlag<int> resolution(
        parser, "resolution", "Surface: grid resolution (default: from surface.json, 32)", { "resolution" });
    args::ValueFlag<std::string> target(
        parser, "id", "Path/layout: record to resolve or highlight", { "target" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for layout.json and surface.json", { "config-dir" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "spec",
        "Per-channel log levels, e.g. 'layout:debug,*:warn'",
        { "log-channels" });

    args::Positional<std::string> command(parser, "command", getCommandListHelp());
    args::Positional<std::string> runFile(parser, "run", "Run file (JSON with mutationHistory and paretoPoints)");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Configure logging.
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    else {
        spdlog::set_level(spdlog::level::warn);
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    if (!command || !runFile) {
        std::cerr << "Error: command and run file are required\n\n";
        std::cerr << parser;
        return 1;
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    CommandOptions options;
    auto layoutConfig = ConfigLoader::loadOrDefault<LayoutConfig>("layout.json");
    if (layoutConfig.isError()) {
        std::cerr << "Error: " << layoutConfig.errorValue() << std::endl;
        return 1;
    }
    options.layout = layoutConfig.value();

    auto surfaceConfig = ConfigLoader::loadOrDefault<SurfaceConfig>("surface.json");
    if (surfaceConfig.isError()) {
        std::cerr << "Error: " << surfaceConfig.errorValue() << std::endl;
        return 1;
    }
    options.surface = surfaceConfig.value();
    SLOG_DEBUG(
        "Effective config: layout {} surface {}",
        nlohmann::json(options.layout).dump(),
        nlohmann::json(options.surface).dump());

    if (maxDepth) {
        options.maxDepth = args::get(maxDepth);
    }
    if (resolution) {
        options.gridResolution = args::get(resolution);
    }
    if (target) {
        options.target = args::get(target);
    }

    auto run = loadRunData(args::get(runFile));
    if (run.isError()) {
        std::cerr << "Error: " << run.errorValue() << std::endl;
        return 1;
    }

    auto output = runCommand(args::get(command), run.value(), options);
    if (output.isError()) {
        std::cerr << "Error: " << output.errorValue() << std::endl;
        return 1;
    }

    std::cout << output.value().dump(2) << std::endl;
    return 0;
}
