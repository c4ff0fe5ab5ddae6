#include "SurfaceReconstructor.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace EvoScope {

namespace {

bool isUsable(const ScoredPoint& point)
{
    return hasFiniteObjectives(point) && std::isfinite(point.combinedFitness);
}

std::vector<ScoredPoint> usablePoints(const std::vector<ScoredPoint>& points)
{
    std::vector<ScoredPoint> usable;
    usable.reserve(points.size());
    for (const ScoredPoint& point : points) {
        if (isUsable(point)) {
            usable.push_back(point);
        }
        else {
            LOG_WARN(Surface, "Skipping point '{}' with a non-finite value.", point.id);
        }
    }
    return usable;
}

double effectiveEpsilon(const SurfaceConfig& config)
{
    if (config.epsilon > 0.0 && std::isfinite(config.epsilon)) {
        return config.epsilon;
    }
    const double fallback = SurfaceConfig{}.epsilon;
    LOG_WARN(Surface, "Invalid epsilon {}, using {}.", config.epsilon, fallback);
    return fallback;
}

// Caller guarantees points is non-empty and epsilon > 0.
SurfaceValue interpolate(const std::vector<ScoredPoint>& points, double x, double z, double epsilon)
{
    // Weights are 1 / (d^2 + epsilon) scaled by epsilon, which keeps each one in (0, 1].
    std::vector<double> weights(points.size());
    double weightSum = 0.0;
    for (size_t i = 0; i < points.size(); i++) {
        const double dx = points[i].quality - x;
        const double dz = points[i].speed - z;
        weights[i] = epsilon / (dx * dx + dz * dz + epsilon);
        weightSum += weights[i];
    }

    // Every weight underflowed. Epsilon is negligible at that range, so weigh
    // by (nearest / distance)^2, computed on halved offsets to keep hypot finite.
    if (weightSum == 0.0) {
        std::vector<double> distances(points.size());
        double nearest = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < points.size(); i++) {
            distances[i] = std::hypot(0.5 * (points[i].quality - x), 0.5 * (points[i].speed - z));
            nearest = std::min(nearest, distances[i]);
        }
        for (size_t i = 0; i < points.size(); i++) {
            const double ratio = nearest / distances[i];
            weights[i] = ratio * ratio;
            weightSum += weights[i];
        }
    }

    // Normalize before scaling so large finite values cannot overflow the sums.
    SurfaceValue value;
    for (size_t i = 0; i < points.size(); i++) {
        const double share = weights[i] / weightSum;
        value.height += share * points[i].complexity;
        value.interpolatedFitness += share * points[i].combinedFitness;
    }
    return value;
}

} // namespace

std::vector<SurfaceSample> reconstructSurface(
    const std::vector<ScoredPoint>& points, int gridResolution, const SurfaceConfig& config)
{
    std::vector<SurfaceSample> samples;
    if (gridResolution <= 0) {
        LOG_DEBUG(Surface, "Grid resolution {} yields an empty surface.", gridResolution);
        return samples;
    }

    const std::vector<ScoredPoint> usable = usablePoints(points);
    if (usable.empty()) {
        LOG_DEBUG(Surface, "No usable points; empty surface.");
        return samples;
    }

    const double epsilon = effectiveEpsilon(config);
    const double res = static_cast<double>(gridResolution);
    samples.reserve(static_cast<size_t>(gridResolution) * static_cast<size_t>(gridResolution));

    for (int gridZ = 0; gridZ < gridResolution; gridZ++) {
        const double z = (gridZ + 0.5) / res;
        for (int gridX = 0; gridX < gridResolution; gridX++) {
            const double x = (gridX + 0.5) / res;
            const SurfaceValue value = interpolate(usable, x, z, epsilon);
            samples.push_back(SurfaceSample{
                .gridX = gridX,
                .gridZ = gridZ,
                .x = x,
                .z = z,
                .height = value.height,
                .interpolatedFitness = value.interpolatedFitness,
            });
        }
    }

    LOG_DEBUG(
        Surface,
        "Reconstructed {}x{} surface from {} points.",
        gridResolution,
        gridResolution,
        usable.size());
    return samples;
}

std::optional<SurfaceValue> sampleSurfaceAt(
    const std::vector<ScoredPoint>& points, double x, double z, const SurfaceConfig& config)
{
    const std::vector<ScoredPoint> usable = usablePoints(points);
    if (usable.empty()) {
        return std::nullopt;
    }
    return interpolate(usable, x, z, effectiveEpsilon(config));
}

void to_json(nlohmann::json& j, const SurfaceSample& sample)
{
    j = ReflectSerializer::to_json(sample);
}

} // namespace EvoScope
