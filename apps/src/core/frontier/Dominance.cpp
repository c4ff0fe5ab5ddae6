#include "Dominance.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <tuple>

namespace EvoScope {

namespace {

void warnNonFinite(const std::vector<ScoredPoint>& points)
{
    for (const ScoredPoint& point : points) {
        if (!hasFiniteObjectives(point)) {
            LOG_WARN(Frontier, "Point '{}' has a non-finite objective; excluded.", point.id);
        }
    }
}

} // namespace

bool dominates(const ScoredPoint& q, const ScoredPoint& p)
{
    if (!hasFiniteObjectives(q) || !hasFiniteObjectives(p)) {
        return false;
    }

    const bool noWorse =
        q.quality >= p.quality && q.speed >= p.speed && q.complexity <= p.complexity;
    const bool strictlyBetter =
        q.quality > p.quality || q.speed > p.speed || q.complexity < p.complexity;
    return noWorse && strictlyBetter;
}

std::set<RecordId> computeParetoOptimal(const std::vector<ScoredPoint>& points)
{
    const std::vector<int> ranks = computeParetoRanks(points);

    std::set<RecordId> optimal;
    for (size_t i = 0; i < points.size(); i++) {
        if (ranks[i] == 0) {
            optimal.insert(points[i].id);
        }
    }

    LOG_DEBUG(Frontier, "{} of {} points are Pareto optimal.", optimal.size(), points.size());
    return optimal;
}

std::vector<ScoredPoint> markParetoOptimal(const std::vector<ScoredPoint>& points)
{
    const std::vector<int> ranks = computeParetoRanks(points);

    std::vector<ScoredPoint> marked = points;
    for (size_t i = 0; i < marked.size(); i++) {
        if (marked[i].isOptimal != (ranks[i] == 0)) {
            LOG_TRACE(
                Frontier,
                "Point '{}' isOptimal {} -> {}.",
                marked[i].id,
                marked[i].isOptimal,
                ranks[i] == 0);
        }
        marked[i].isOptimal = ranks[i] == 0;
    }
    return marked;
}

std::vector<int> computeParetoRanks(const std::vector<ScoredPoint>& points)
{
    const size_t n = points.size();
    std::vector<int> ranks(n, kUnranked);
    if (n == 0) {
        return ranks;
    }

    warnNonFinite(points);

    // Fast non-dominated sort: count dominators per point, then peel fronts.
    std::vector<int> dominatorCount(n, 0);
    std::vector<std::vector<size_t>> dominatedBy(n);
    for (size_t p = 0; p < n; p++) {
        for (size_t q = p + 1; q < n; q++) {
            if (dominates(points[p], points[q])) {
                dominatedBy[p].push_back(q);
                dominatorCount[q]++;
            }
            else if (dominates(points[q], points[p])) {
                dominatedBy[q].push_back(p);
                dominatorCount[p]++;
            }
        }
    }

    std::vector<size_t> front;
    for (size_t i = 0; i < n; i++) {
        if (hasFiniteObjectives(points[i]) && dominatorCount[i] == 0) {
            front.push_back(i);
        }
    }

    int rank = 0;
    while (!front.empty()) {
        std::vector<size_t> next;
        for (const size_t p : front) {
            ranks[p] = rank;
            for (const size_t q : dominatedBy[p]) {
                if (--dominatorCount[q] == 0) {
                    next.push_back(q);
                }
            }
        }
        front = std::move(next);
        rank++;
    }

    LOG_TRACE(Frontier, "Ranked {} points into {} fronts.", n, rank);
    return ranks;
}

std::vector<ScoredPoint> frontierPolyline(const std::vector<ScoredPoint>& points)
{
    const std::vector<int> ranks = computeParetoRanks(points);

    std::vector<ScoredPoint> line;
    for (size_t i = 0; i < points.size(); i++) {
        if (ranks[i] == 0) {
            line.push_back(points[i]);
            line.back().isOptimal = true;
        }
    }

    std::sort(line.begin(), line.end(), [](const ScoredPoint& a, const ScoredPoint& b) {
        return std::tie(a.quality, a.speed, a.id) < std::tie(b.quality, b.speed, b.id);
    });
    return line;
}

} // namespace EvoScope
