#include "SurfaceConfig.h"
#include "core/ReflectSerializer.h"

namespace EvoScope {

void to_json(nlohmann::json& j, const SurfaceConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, SurfaceConfig& config)
{
    config = ReflectSerializer::from_json<SurfaceConfig>(j);
}

} // namespace EvoScope
