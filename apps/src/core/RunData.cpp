#include "RunData.h"
#include "LoggingChannels.h"
#include "ReflectSerializer.h"

#include <fstream>
#include <stdexcept>
#include <sstream>

namespace EvoScope {

void to_json(nlohmann::json& j, const RunData& run)
{
    j = ReflectSerializer::to_json(run);
}

void from_json(const nlohmann::json& j, RunData& run)
{
    if (!j.is_object()) {
        throw std::runtime_error("Run data must be a JSON object.");
    }
    run = ReflectSerializer::from_json<RunData>(j);
}

Result<RunData, std::string> parseRunData(const std::string& text)
{
    try {
        RunData run = nlohmann::json::parse(text).get<RunData>();
        LOG_DEBUG(
            Config,
            "Parsed run data: {} records, {} scored points.",
            run.mutationHistory.size(),
            run.paretoPoints.size());
        return Result<RunData, std::string>::okay(std::move(run));
    }
    catch (const nlohmann::json::parse_error& e) {
        return Result<RunData, std::string>::error(std::string("Parse error: ") + e.what());
    }
    catch (const std::exception& e) {
        return Result<RunData, std::string>::error(std::string("Invalid run data: ") + e.what());
    }
}

Result<RunData, std::string> loadRunData(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        std::string error = "Cannot open run file: " + path.string();
        LOG_ERROR(Config, "{}", error);
        return Result<RunData, std::string>::error(error);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parseRunData(buffer.str());
    if (result.isError()) {
        std::string error = path.string() + ": " + result.errorValue();
        LOG_ERROR(Config, "{}", error);
        return Result<RunData, std::string>::error(error);
    }

    LOG_INFO(Config, "Loaded run file {}", path.string());
    return result;
}

} // namespace EvoScope
