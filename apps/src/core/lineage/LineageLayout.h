#pragma once

#include "LayoutConfig.h"
#include "LineageError.h"
#include "MutationRecord.h"
#include "core/Vector2.h"

#include <map>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace EvoScope {

struct LayoutNode {
    MutationRecord record;
    double positionX = 0.0;
    double positionY = 0.0;
    int depthIndex = 0; // Contiguous band index; 0 is the earliest generation shown.
    int childCount = 0;
};

struct CubicCurve {
    Vector2d start;
    Vector2d control1;
    Vector2d control2;
    Vector2d end;

    // SVG path descriptor: "M x y C c1x c1y, c2x c2y, ex ey".
    std::string toSvgPath() const;
};

struct ConnectiveEdge {
    RecordId sourceId; // Parent.
    RecordId targetId; // Child.
    CubicCurve curve;
    double wobble = 0.0;
    OriginKind originKind = OriginKind::Initial;
    double fitness = 0.0;
    bool highlighted = false;
};

struct LineageLayout {
    std::map<RecordId, LayoutNode> nodes;
    std::vector<ConnectiveEdge> edges;
    std::vector<std::vector<RecordId>> bands; // Ids per band, left to right.
    std::vector<LineageError> anomalies;
};

/**
 * Place every record with generationIndex <= maxDepth on a band grid and connect
 * each placed child to its placed parent with a cubic curve.
 *
 * Bands are the distinct generations in ascending order, spread top to bottom.
 * Within a band nodes are ordered by their parent's X, spread evenly, then pulled
 * toward the parent. Malformed lineage is reported in anomalies and never aborts the
 * layout. Output is a pure function of the inputs.
 */
LineageLayout layoutLineage(
    const std::vector<MutationRecord>& records, int maxDepth, const LayoutConfig& config = {});

/**
 * Edges for an already positioned node map. Edges follow the input order of their
 * child record; records without a positioned parent produce no edge.
 */
std::vector<ConnectiveEdge> buildConnectiveEdges(
    const std::vector<MutationRecord>& records,
    const std::map<RecordId, LayoutNode>& nodes,
    const LayoutConfig& config = {});

// Set highlighted on edges whose endpoints both appear in path; clears all others.
void highlightAncestorPath(std::vector<ConnectiveEdge>& edges, const std::vector<RecordId>& path);

void to_json(nlohmann::json& j, const LayoutNode& node);
void to_json(nlohmann::json& j, const CubicCurve& curve);
void to_json(nlohmann::json& j, const ConnectiveEdge& edge);

// Nodes are written as an array in band order, left to right.
void to_json(nlohmann::json& j, const LineageLayout& layout);

} // namespace EvoScope
