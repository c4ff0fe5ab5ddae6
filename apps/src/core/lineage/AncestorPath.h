#pragma once

#include "LineageError.h"
#include "LineageIndex.h"
#include "MutationRecord.h"
#include "core/Result.h"

#include <vector>

namespace EvoScope {

using AncestorPath = std::vector<RecordId>;

/**
 * Ids from targetId up to its root, target first, root last.
 *
 * The walk stops at a record without a parent or at a parent id that names no
 * record; the partial path is still a valid result. A cycle yields
 * MalformedLineage and an unknown target yields UnknownRecord.
 */
Result<AncestorPath, LineageError> resolveAncestorPath(
    const std::vector<MutationRecord>& records, const RecordId& targetId);

Result<AncestorPath, LineageError> resolveAncestorPath(
    const LineageIndex& index, const RecordId& targetId);

} // namespace EvoScope
