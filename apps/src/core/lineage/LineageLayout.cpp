#include "LineageLayout.h"
#include "LineageIndex.h"
#include "LineageValidator.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"

#include <algorithm>
#include <optional>
#include <set>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace EvoScope {

std::string CubicCurve::toSvgPath() const
{
    return fmt::format(
        "M {} {} C {} {}, {} {}, {} {}",
        start.x,
        start.y,
        control1.x,
        control1.y,
        control2.x,
        control2.y,
        end.x,
        end.y);
}

LineageLayout layoutLineage(
    const std::vector<MutationRecord>& records, int maxDepth, const LayoutConfig& config)
{
    LineageLayout layout;
    if (records.empty()) {
        LOG_DEBUG(Layout, "No records to lay out.");
        return layout;
    }

    const LineageIndex index(records);
    LineageValidation validation = validateLineage(index);
    layout.anomalies = std::move(validation.errors);

    // Bands keyed by generation; shadowed duplicates are not placed.
    std::map<int, std::vector<size_t>> generations;
    for (size_t i = 0; i < index.size(); i++) {
        const MutationRecord& record = index.at(i);
        if (record.generationIndex > maxDepth) {
            continue;
        }
        if (index.find(record.id) != i) {
            continue;
        }
        generations[record.generationIndex].push_back(i);
    }

    if (generations.empty()) {
        LOG_DEBUG(Layout, "No records within max depth {}.", maxDepth);
        return layout;
    }

    const int lastBand = static_cast<int>(generations.size()) - 1;
    const double usableWidth = config.canvasWidth - 2.0 * config.marginX;
    const double usableHeight = config.canvasHeight - 2.0 * config.marginY;

    // X of every record placed in an earlier band.
    std::vector<std::optional<double>> placedX(index.size());
    const auto placedParentX = [&](size_t i) -> std::optional<double> {
        const auto parent = index.parentOf(i);
        if (!parent.has_value()) {
            return std::nullopt;
        }
        return placedX[parent.value()];
    };

    int depth = 0;
    for (const auto& [generation, members] : generations) {
        const double y =
            config.marginY + static_cast<double>(depth) / std::max(1, lastBand) * usableHeight;

        std::vector<std::pair<double, size_t>> ordered;
        ordered.reserve(members.size());
        for (const size_t i : members) {
            ordered.emplace_back(placedParentX(i).value_or(0.0), i);
        }
        std::stable_sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
            return a.first < b.first;
        });

        std::vector<RecordId> band;
        band.reserve(ordered.size());
        std::vector<std::pair<size_t, double>> bandX;
        for (size_t k = 0; k < ordered.size(); k++) {
            const size_t i = ordered[k].second;
            const MutationRecord& record = index.at(i);

            double x = config.canvasWidth / 2.0;
            if (ordered.size() > 1) {
                x = config.marginX
                    + static_cast<double>(k) / static_cast<double>(ordered.size() - 1)
                        * usableWidth;
            }

            const auto parentX = placedParentX(i);
            if (parentX.has_value() && !validation.malformed[i]) {
                x = x * (1.0 - config.parentPull) + parentX.value() * config.parentPull;
            }

            layout.nodes[record.id] = LayoutNode{
                .record = record,
                .positionX = x,
                .positionY = y,
                .depthIndex = depth,
                .childCount = static_cast<int>(index.childrenOf(i).size()),
            };
            band.push_back(record.id);
            bandX.emplace_back(i, x);
        }

        // Publish only after the whole band is placed so siblings never nudge each other.
        for (const auto& [i, x] : bandX) {
            placedX[i] = x;
        }

        LOG_TRACE(Layout, "Band {} (generation {}): {} nodes at y={}", depth, generation, band.size(), y);
        layout.bands.push_back(std::move(band));
        depth++;
    }

    layout.edges = buildConnectiveEdges(records, layout.nodes, config);

    LOG_DEBUG(
        Layout,
        "Laid out {} nodes in {} bands with {} edges ({} anomalies).",
        layout.nodes.size(),
        layout.bands.size(),
        layout.edges.size(),
        layout.anomalies.size());

    return layout;
}

std::vector<ConnectiveEdge> buildConnectiveEdges(
    const std::vector<MutationRecord>& records,
    const std::map<RecordId, LayoutNode>& nodes,
    const LayoutConfig& config)
{
    std::vector<ConnectiveEdge> edges;
    std::set<RecordId> seen;

    for (const MutationRecord& record : records) {
        if (!seen.insert(record.id).second) {
            continue;
        }
        if (!record.parentId.has_value() || record.parentId.value() == record.id) {
            continue;
        }

        const auto child = nodes.find(record.id);
        const auto parent = nodes.find(record.parentId.value());
        if (child == nodes.end() || parent == nodes.end()) {
            continue;
        }

        const Vector2d start{ parent->second.positionX, parent->second.positionY };
        const Vector2d end{ child->second.positionX, child->second.positionY };
        const double midY = (start.y + end.y) / 2.0;
        const double wobble = (record.fitnessValue - 0.5) * config.wobbleScale;

        edges.push_back(ConnectiveEdge{
            .sourceId = parent->first,
            .targetId = child->first,
            .curve =
                CubicCurve{
                    .start = start,
                    .control1 = { start.x + wobble, midY - config.controlOffsetY },
                    .control2 = { end.x - wobble, midY + config.controlOffsetY },
                    .end = end,
                },
            .wobble = wobble,
            .originKind = record.originKind,
            .fitness = record.fitnessValue,
            .highlighted = false,
        });
    }

    return edges;
}

void highlightAncestorPath(std::vector<ConnectiveEdge>& edges, const std::vector<RecordId>& path)
{
    const std::set<RecordId> onPath(path.begin(), path.end());
    for (ConnectiveEdge& edge : edges) {
        edge.highlighted = onPath.contains(edge.sourceId) && onPath.contains(edge.targetId);
    }
}

void to_json(nlohmann::json& j, const LayoutNode& node)
{
    j = ReflectSerializer::to_json(node);
}

void to_json(nlohmann::json& j, const CubicCurve& curve)
{
    j = ReflectSerializer::to_json(curve);
}

void to_json(nlohmann::json& j, const ConnectiveEdge& edge)
{
    j = ReflectSerializer::to_json(edge);
}

void to_json(nlohmann::json& j, const LineageLayout& layout)
{
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& band : layout.bands) {
        for (const RecordId& id : band) {
            nodes.push_back(nlohmann::json(layout.nodes.at(id)));
        }
    }

    j = nlohmann::json{
        { "nodes", std::move(nodes) },
        { "edges", layout.edges },
        { "bands", layout.bands },
        { "anomalies", layout.anomalies },
    };
}

} // namespace EvoScope
