#pragma once

#include "MutationRecord.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace EvoScope {

enum class LineageErrorKind : uint8_t {
    MalformedLineage = 0, // Cycle, or parent generation >= child generation.
    DanglingParent = 1,   // parentId names no record.
    DuplicateId = 2,      // Two records share an id; the first one wins.
    UnknownRecord = 3,    // Lookup target is not in the record set.
};

std::string toString(LineageErrorKind kind);

/**
 * Structural problem found in a lineage record set.
 * Returned as an error value by path resolution and attached as an annotation
 * to layout results so the presentation layer can flag it.
 */
struct LineageError {
    LineageErrorKind kind = LineageErrorKind::MalformedLineage;
    RecordId recordId;
    std::string message;
};

void to_json(nlohmann::json& j, const LineageErrorKind& kind);
void from_json(const nlohmann::json& j, LineageErrorKind& kind);
void to_json(nlohmann::json& j, const LineageError& error);
void from_json(const nlohmann::json& j, LineageError& error);

} // namespace EvoScope
