#pragma once

#include "core/lineage/MutationRecord.h"

#include <nlohmann/json_fwd.hpp>

namespace EvoScope {

/**
 * A candidate scored on three competing objectives.
 * quality and speed are maximized; complexity is a cost and is minimized.
 */
struct ScoredPoint {
    RecordId id;
    double quality = 0.0;
    double speed = 0.0;
    double complexity = 0.0;
    double combinedFitness = 0.0; // Supplied upstream, never recomputed here.
    bool isOptimal = false;       // Input value is ignored; see markParetoOptimal().
    int generation = 0;
};

// True when all three objectives are finite numbers.
bool hasFiniteObjectives(const ScoredPoint& point);

void to_json(nlohmann::json& j, const ScoredPoint& point);
void from_json(const nlohmann::json& j, ScoredPoint& point);

} // namespace EvoScope
