#pragma once

#include "MutationRecord.h"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace EvoScope {

/**
 * Arena view over a flat record collection.
 *
 * Parent links are resolved once to indices into the caller's vector, so the
 * algorithms never chase object references. The index borrows the records and
 * must not outlive them.
 */
class LineageIndex {
public:
    explicit LineageIndex(const std::vector<MutationRecord>& records);

    size_t size() const { return records_.size(); }
    const MutationRecord& at(size_t index) const { return records_[index]; }

    // First record with this id, if any.
    std::optional<size_t> find(const RecordId& id) const;

    // Index of the record's parent; nullopt for roots and dangling links.
    std::optional<size_t> parentOf(size_t index) const { return parents_[index]; }

    bool hasDanglingParent(size_t index) const;

    // Records (by index, input order) naming this record as parent.
    const std::vector<size_t>& childrenOf(size_t index) const { return children_[index]; }

    // Records whose id repeats an earlier one; they are shadowed in find().
    const std::vector<size_t>& duplicates() const { return duplicates_; }

private:
    const std::vector<MutationRecord>& records_;
    std::unordered_map<RecordId, size_t> indexById_;
    std::vector<std::optional<size_t>> parents_;
    std::vector<std::vector<size_t>> children_;
    std::vector<size_t> duplicates_;
};

} // namespace EvoScope
