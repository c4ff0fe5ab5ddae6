#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace EvoScope {

using RecordId = std::string;

/**
 * How a candidate was produced. Descriptive only; the layout math ignores it.
 */
enum class OriginKind : uint8_t {
    Initial = 0,
    Mutation = 1,
    Crossover = 2,
    Selection = 3,
};

std::string toString(OriginKind kind);
std::optional<OriginKind> originKindFromString(const std::string& str);

void to_json(nlohmann::json& j, const OriginKind& kind);
void from_json(const nlohmann::json& j, OriginKind& kind);

/**
 * One evaluated candidate in the search lineage.
 * Records reference their parent by id; generation 0 records are roots.
 */
struct MutationRecord {
    RecordId id;
    int generationIndex = 0;
    std::optional<RecordId> parentId; // Absent only for roots.
    OriginKind originKind = OriginKind::Initial;
    double fitnessValue = 0.0; // Higher is better, conventionally [0, 1].
    double fitnessDelta = 0.0; // Change relative to the parent.
};

void to_json(nlohmann::json& j, const MutationRecord& record);
void from_json(const nlohmann::json& j, MutationRecord& record);

} // namespace EvoScope
