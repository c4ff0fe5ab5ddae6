#include "LineageIndex.h"

namespace EvoScope {

LineageIndex::LineageIndex(const std::vector<MutationRecord>& records)
    : records_(records), parents_(records.size()), children_(records.size())
{
    indexById_.reserve(records.size());
    for (size_t i = 0; i < records.size(); i++) {
        const auto [it, inserted] = indexById_.emplace(records[i].id, i);
        if (!inserted) {
            duplicates_.push_back(i);
        }
    }

    for (size_t i = 0; i < records.size(); i++) {
        if (!records[i].parentId.has_value()) {
            continue;
        }
        const auto parent = find(records[i].parentId.value());
        if (!parent.has_value()) {
            continue;
        }
        parents_[i] = parent;
        // A record naming itself is a cycle, not a child.
        if (parent.value() != i) {
            children_[parent.value()].push_back(i);
        }
    }
}

std::optional<size_t> LineageIndex::find(const RecordId& id) const
{
    const auto it = indexById_.find(id);
    if (it == indexById_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LineageIndex::hasDanglingParent(size_t index) const
{
    return records_[index].parentId.has_value() && !parents_[index].has_value();
}

} // namespace EvoScope
