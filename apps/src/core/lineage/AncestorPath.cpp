#include "AncestorPath.h"
#include "core/LoggingChannels.h"

#include <spdlog/fmt/fmt.h>

namespace EvoScope {

Result<AncestorPath, LineageError> resolveAncestorPath(
    const std::vector<MutationRecord>& records, const RecordId& targetId)
{
    const LineageIndex index(records);
    return resolveAncestorPath(index, targetId);
}

Result<AncestorPath, LineageError> resolveAncestorPath(
    const LineageIndex& index, const RecordId& targetId)
{
    using PathResult = Result<AncestorPath, LineageError>;

    std::optional<size_t> current = index.find(targetId);
    if (!current.has_value()) {
        LOG_DEBUG(Lineage, "Ancestor path target '{}' not found.", targetId);
        return PathResult::error(LineageError{
            .kind = LineageErrorKind::UnknownRecord,
            .recordId = targetId,
            .message = "no record with this id",
        });
    }

    AncestorPath path;
    std::vector<bool> visited(index.size(), false);

    // Each record can be visited at most once, so size() steps bound any walk.
    for (size_t steps = 0; steps <= index.size() && current.has_value(); steps++) {
        const size_t node = current.value();
        if (visited[node]) {
            LOG_WARN(
                Lineage,
                "Cycle at '{}' while resolving ancestors of '{}'.",
                index.at(node).id,
                targetId);
            return PathResult::error(LineageError{
                .kind = LineageErrorKind::MalformedLineage,
                .recordId = index.at(node).id,
                .message = fmt::format("parent cycle reached from '{}'", targetId),
            });
        }
        visited[node] = true;
        path.push_back(index.at(node).id);

        if (index.hasDanglingParent(node)) {
            LOG_DEBUG(
                Lineage,
                "Ancestor walk from '{}' stops at '{}': parent '{}' missing.",
                targetId,
                index.at(node).id,
                index.at(node).parentId.value());
        }
        current = index.parentOf(node);
    }

    return PathResult::okay(std::move(path));
}

} // namespace EvoScope
