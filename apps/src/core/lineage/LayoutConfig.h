#pragma once

#include <nlohmann/json_fwd.hpp>

namespace EvoScope {

/**
 * Canvas geometry and curve shaping for the lineage layout.
 * Loaded from layout.json; keys missing from the file keep these defaults.
 */
struct LayoutConfig {
    double canvasWidth = 400.0;
    double canvasHeight = 280.0;
    double marginX = 40.0;
    double marginY = 30.0;
    double parentPull = 0.4;     // Fraction of the parent's X blended into a child's X.
    double wobbleScale = 20.0;   // Control point offset per unit of (fitness - 0.5).
    double controlOffsetY = 10.0;
};

void to_json(nlohmann::json& j, const LayoutConfig& config);
void from_json(const nlohmann::json& j, LayoutConfig& config);

} // namespace EvoScope
