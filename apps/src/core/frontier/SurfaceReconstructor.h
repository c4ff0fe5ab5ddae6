#pragma once

#include "ScoredPoint.h"
#include "SurfaceConfig.h"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <vector>

namespace EvoScope {

struct SurfaceSample {
    int gridX = 0;
    int gridZ = 0;
    double x = 0.0; // Cell centre, normalized to [0, 1].
    double z = 0.0;
    double height = 0.0;              // Interpolated complexity.
    double interpolatedFitness = 0.0; // Interpolated combinedFitness.
};

struct SurfaceValue {
    double height = 0.0;
    double interpolatedFitness = 0.0;
};

/**
 * Height field over the (quality, speed) plane by inverse-distance weighting.
 *
 * Returns gridResolution^2 samples, gridZ outer and gridX inner, at cell centres
 * ((gridX + 0.5) / res, (gridZ + 0.5) / res). Each sample point weighs
 * 1 / (d^2 + epsilon). Points with a non-finite value are skipped. An empty point
 * set or a non-positive resolution yields no samples.
 */
std::vector<SurfaceSample> reconstructSurface(
    const std::vector<ScoredPoint>& points, int gridResolution, const SurfaceConfig& config = {});

// Interpolated values at one (x, z) location; nullopt when no usable points exist.
std::optional<SurfaceValue> sampleSurfaceAt(
    const std::vector<ScoredPoint>& points, double x, double z, const SurfaceConfig& config = {});

void to_json(nlohmann::json& j, const SurfaceSample& sample);

} // namespace EvoScope
