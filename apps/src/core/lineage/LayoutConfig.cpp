#include "LayoutConfig.h"
#include "core/ReflectSerializer.h"

namespace EvoScope {

void to_json(nlohmann::json& j, const LayoutConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, LayoutConfig& config)
{
    config = ReflectSerializer::from_json<LayoutConfig>(j);
}

} // namespace EvoScope
