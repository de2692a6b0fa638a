#pragma once

#include "graph/edge.hpp"
#include "graph/graph_node.hpp"
#include "graph/vertex.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace astar {

// ─── WeightedGraph ─────────────────────────────────────────────
// Directed graph with positioned vertices and non-negative edge
// weights. Built once, then searched through GraphNode handles.
// Adjacency is kept per source in an ordered map so neighbor order
// is deterministic.

class WeightedGraph {
public:
    WeightedGraph() = default;
    explicit WeightedGraph(double heuristic_weight);

    // ── Vertex operations ──
    uint64_t addNode(double x = 0.0, double y = 0.0);
    uint64_t addNodeWithId(uint64_t id, double x, double y);
    const Vertex* getNode(uint64_t id) const;
    bool hasNode(uint64_t id) const { return nodes_.count(id) > 0; }
    std::vector<uint64_t> getNodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──
    uint64_t addEdge(uint64_t source, uint64_t target, double weight = 1.0);
    const Edge* getEdge(uint64_t id) const;
    std::optional<double> edgeWeight(uint64_t source, uint64_t target) const;
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency queries ──
    std::vector<uint64_t> getOutgoing(uint64_t node_id) const;

    // ── Heuristic ──
    double distance(uint64_t a, uint64_t b) const;
    double heuristicWeight() const { return heuristic_weight_; }
    void setHeuristicWeight(double weight);

    // ── Search handles ──
    GraphNode node(uint64_t id) const;

private:
    uint64_t next_node_id_ = 1;
    uint64_t next_edge_id_ = 1;
    double heuristic_weight_ = 1.0;

    std::unordered_map<uint64_t, Vertex> nodes_;
    std::unordered_map<uint64_t, Edge> edges_;

    // source → (target → edge id)
    std::unordered_map<uint64_t, std::map<uint64_t, uint64_t>> outgoing_;
};

} // namespace astar
