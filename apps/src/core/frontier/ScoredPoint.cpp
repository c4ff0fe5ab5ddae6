#include "ScoredPoint.h"
#include "core/ReflectSerializer.h"

#include <cmath>

namespace EvoScope {

bool hasFiniteObjectives(const ScoredPoint& point)
{
    return std::isfinite(point.quality) && std::isfinite(point.speed)
        && std::isfinite(point.complexity);
}

void to_json(nlohmann::json& j, const ScoredPoint& point)
{
    j = ReflectSerializer::to_json(point);
}

void from_json(const nlohmann::json& j, ScoredPoint& point)
{
    point = ReflectSerializer::from_json<ScoredPoint>(j);
}

} // namespace EvoScope
