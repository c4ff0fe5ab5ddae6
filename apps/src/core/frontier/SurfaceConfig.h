#pragma once

#include <nlohmann/json_fwd.hpp>

namespace EvoScope {

/**
 * Inverse-distance weighting parameters, loaded from surface.json.
 */
struct SurfaceConfig {
    // Added to the squared distance before inverting; keeps weights finite at samples.
    double epsilon = 0.1;
    int gridResolution = 32;
};

void to_json(nlohmann::json& j, const SurfaceConfig& config);
void from_json(const nlohmann::json& j, SurfaceConfig& config);

} // namespace EvoScope
