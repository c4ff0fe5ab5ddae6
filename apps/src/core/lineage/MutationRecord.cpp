#include "MutationRecord.h"
#include "core/ReflectSerializer.h"

#include <stdexcept>

namespace EvoScope {

std::string toString(OriginKind kind)
{
    switch (kind) {
        case OriginKind::Initial:
            return "initial";
        case OriginKind::Mutation:
            return "mutation";
        case OriginKind::Crossover:
            return "crossover";
        case OriginKind::Selection:
            return "selection";
    }
    return "unknown";
}

std::optional<OriginKind> originKindFromString(const std::string& str)
{
    for (const auto& [value, name] : reflect::enumerators<OriginKind>) {
        const auto kind = static_cast<OriginKind>(value);
        if (toString(kind) == str) {
            return kind;
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const OriginKind& kind)
{
    j = toString(kind);
}

void from_json(const nlohmann::json& j, OriginKind& kind)
{
    if (!j.is_string()) {
        throw std::runtime_error("Origin kind must be a string.");
    }

    const auto parsed = originKindFromString(j.get<std::string>());
    if (!parsed.has_value()) {
        throw std::runtime_error("Invalid origin kind: " + j.get<std::string>());
    }
    kind = parsed.value();
}

void to_json(nlohmann::json& j, const MutationRecord& record)
{
    j = ReflectSerializer::to_json(record);
}

void from_json(const nlohmann::json& j, MutationRecord& record)
{
    record = ReflectSerializer::from_json<MutationRecord>(j);
}

} // namespace EvoScope
