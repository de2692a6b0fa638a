#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace astar {

class WeightedGraph;

// ─── GraphNode ─────────────────────────────────────────────────
// Handle to one vertex of a WeightedGraph, implementing the node
// capability contract so a WeightedGraph can be searched directly.
// The handle does not own the graph; the graph must outlive it.

class GraphNode {
public:
    GraphNode() = default;
    GraphNode(const WeightedGraph* graph, uint64_t id) : graph_(graph), id_(id) {}

    uint64_t id() const { return id_; }
    const WeightedGraph* graph() const { return graph_; }

    /// Targets of the outgoing edges, ascending by id.
    std::vector<GraphNode> connectedNodes() const;

    /// Weight of the edge to `to`, +infinity when there is none.
    double cost(const GraphNode& to) const;

    /// Straight-line distance to `to`, scaled by the graph's heuristic weight.
    double estimatedCost(const GraphNode& to) const;

    bool operator==(const GraphNode& other) const {
        return graph_ == other.graph_ && id_ == other.id_;
    }
    bool operator!=(const GraphNode& other) const { return !(*this == other); }

    bool operator<(const GraphNode& other) const {
        if (graph_ != other.graph_) {
            return std::less<const WeightedGraph*>()(graph_, other.graph_);
        }
        return id_ < other.id_;
    }

private:
    const WeightedGraph* graph_ = nullptr;
    uint64_t id_ = 0;
};

} // namespace astar

namespace std {

template <>
struct hash<astar::GraphNode> {
    size_t operator()(const astar::GraphNode& node) const {
        size_t h = hash<const astar::WeightedGraph*>()(node.graph());
        return h ^ (hash<uint64_t>()(node.id()) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

} // namespace std
