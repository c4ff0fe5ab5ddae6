#include "LineageError.h"
#include "core/ReflectSerializer.h"

#include <stdexcept>

namespace EvoScope {

std::string toString(LineageErrorKind kind)
{
    return std::string(reflect::enum_name(kind));
}

void to_json(nlohmann::json& j, const LineageErrorKind& kind)
{
    j = toString(kind);
}

void from_json(const nlohmann::json& j, LineageErrorKind& kind)
{
    const auto str = j.get<std::string>();
    for (const auto& [value, name] : reflect::enumerators<LineageErrorKind>) {
        if (name == str) {
            kind = static_cast<LineageErrorKind>(value);
            return;
        }
    }
    throw std::runtime_error("Invalid lineage error kind: " + str);
}

void to_json(nlohmann::json& j, const LineageError& error)
{
    j = ReflectSerializer::to_json(error);
}

void from_json(const nlohmann::json& j, LineageError& error)
{
    error = ReflectSerializer::from_json<LineageError>(j);
}

} // namespace EvoScope
