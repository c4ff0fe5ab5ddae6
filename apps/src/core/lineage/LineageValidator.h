#pragma once

#include "LineageError.h"
#include "LineageIndex.h"

#include <vector>

namespace EvoScope {

struct LineageValidation {
    std::vector<LineageError> errors;

    // Per record index: true when the record's ancestor chain contains a cycle or a
    // generation-order violation. Such records keep band-only layout positions.
    std::vector<bool> malformed;

    bool isValid() const { return errors.empty(); }
};

/**
 * Check the forest invariant without recursion.
 * Reports cycles and generation-order violations as MalformedLineage, plus dangling
 * parents and duplicate ids. Every problem is logged once on the lineage channel.
 */
LineageValidation validateLineage(const LineageIndex& index);

LineageValidation validateLineage(const std::vector<MutationRecord>& records);

} // namespace EvoScope
