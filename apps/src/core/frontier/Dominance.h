#pragma once

#include "ScoredPoint.h"

#include <set>
#include <vector>

namespace EvoScope {

/**
 * True when q is at least as good as p on every objective and strictly better on
 * one. Higher quality and speed are better, lower complexity is better. Identical
 * points do not dominate each other. Points with a non-finite objective never
 * dominate and are never dominated.
 */
bool dominates(const ScoredPoint& q, const ScoredPoint& p);

// Ids of points no other point dominates. Upstream isOptimal flags are ignored.
std::set<RecordId> computeParetoOptimal(const std::vector<ScoredPoint>& points);

// Copy of points with isOptimal recomputed.
std::vector<ScoredPoint> markParetoOptimal(const std::vector<ScoredPoint>& points);

inline constexpr int kUnranked = -1;

/**
 * Non-dominated front index per point, in input order: 0 for the optimal set, 1 for
 * the set that is optimal once front 0 is removed, and so on. Points with a
 * non-finite objective get kUnranked.
 */
std::vector<int> computeParetoRanks(const std::vector<ScoredPoint>& points);

// Optimal points ordered by quality, then speed, then id; the frontier line.
std::vector<ScoredPoint> frontierPolyline(const std::vector<ScoredPoint>& points);

} // namespace EvoScope
