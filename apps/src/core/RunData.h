#pragma once

#include "Result.h"
#include "frontier/ScoredPoint.h"
#include "lineage/MutationRecord.h"

#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace EvoScope {

/**
 * Snapshot of one recorded search run: the lineage and the scored candidates.
 * JSON shape: { "mutationHistory": [...], "paretoPoints": [...] }. Either key may be
 * absent, which reads as an empty collection.
 */
struct RunData {
    std::vector<MutationRecord> mutationHistory;
    std::vector<ScoredPoint> paretoPoints;
};

void to_json(nlohmann::json& j, const RunData& run);
void from_json(const nlohmann::json& j, RunData& run);

Result<RunData, std::string> parseRunData(const std::string& text);
Result<RunData, std::string> loadRunData(const std::filesystem::path& path);

} // namespace EvoScope
