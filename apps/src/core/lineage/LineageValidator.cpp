#include "LineageValidator.h"
#include "core/LoggingChannels.h"

#include <cstdint>
#include <spdlog/fmt/fmt.h>

namespace EvoScope {

namespace {

enum class VisitState : uint8_t { Unvisited, OnPath, Resolved };

LineageError makeError(LineageErrorKind kind, const RecordId& id, std::string message)
{
    LOG_WARN(Lineage, "{} at '{}': {}", toString(kind), id, message);
    return LineageError{ .kind = kind, .recordId = id, .message = std::move(message) };
}

bool violatesGenerationOrder(const LineageIndex& index, size_t child)
{
    const auto parent = index.parentOf(child);
    if (!parent.has_value()) {
        return false;
    }
    return index.at(parent.value()).generationIndex >= index.at(child).generationIndex;
}

} // namespace

LineageValidation validateLineage(const LineageIndex& index)
{
    LineageValidation result;
    result.malformed.assign(index.size(), false);

    for (const size_t dup : index.duplicates()) {
        result.errors.push_back(makeError(
            LineageErrorKind::DuplicateId, index.at(dup).id, "id repeats an earlier record"));
    }

    for (size_t i = 0; i < index.size(); i++) {
        const MutationRecord& record = index.at(i);
        if (record.generationIndex < 0) {
            result.errors.push_back(makeError(
                LineageErrorKind::MalformedLineage,
                record.id,
                fmt::format("negative generation {}", record.generationIndex)));
        }
        if (index.hasDanglingParent(i)) {
            result.errors.push_back(makeError(
                LineageErrorKind::DanglingParent,
                record.id,
                fmt::format("parent '{}' not found", record.parentId.value())));
        }
    }

    std::vector<VisitState> state(index.size(), VisitState::Unvisited);
    std::vector<bool> onCycle(index.size(), false);
    std::vector<size_t> path;

    for (size_t start = 0; start < index.size(); start++) {
        if (state[start] == VisitState::Resolved) {
            continue;
        }

        // Walk up until a root, a resolved record, or a record already on this walk.
        path.clear();
        bool inheritedMalformed = false;
        std::optional<size_t> current = start;
        while (current.has_value()) {
            const size_t node = current.value();
            if (state[node] == VisitState::Resolved) {
                inheritedMalformed = result.malformed[node];
                break;
            }
            if (state[node] == VisitState::OnPath) {
                std::string members;
                size_t pos = path.size();
                while (pos > 0) {
                    pos--;
                    onCycle[path[pos]] = true;
                    members = index.at(path[pos]).id + (members.empty() ? "" : " <- ") + members;
                    if (path[pos] == node) {
                        break;
                    }
                }
                result.errors.push_back(makeError(
                    LineageErrorKind::MalformedLineage,
                    index.at(node).id,
                    fmt::format("parent cycle: {}", members)));
                inheritedMalformed = true;
                break;
            }
            state[node] = VisitState::OnPath;
            path.push_back(node);
            current = index.parentOf(node);
        }

        // Resolve from the topmost record back down to the start.
        bool malformed = inheritedMalformed;
        for (auto it = path.rbegin(); it != path.rend(); ++it) {
            const size_t node = *it;
            if (!onCycle[node] && violatesGenerationOrder(index, node)) {
                const MutationRecord& record = index.at(node);
                const MutationRecord& parent = index.at(index.parentOf(node).value());
                result.errors.push_back(makeError(
                    LineageErrorKind::MalformedLineage,
                    record.id,
                    fmt::format(
                        "parent '{}' has generation {} >= {}",
                        parent.id,
                        parent.generationIndex,
                        record.generationIndex)));
                malformed = true;
            }
            result.malformed[node] = malformed || onCycle[node];
            state[node] = VisitState::Resolved;
        }
    }

    return result;
}

LineageValidation validateLineage(const std::vector<MutationRecord>& records)
{
    const LineageIndex index(records);
    return validateLineage(index);
}

} // namespace EvoScope
