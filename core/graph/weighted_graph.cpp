#include "graph/weighted_graph.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace astar {

WeightedGraph::WeightedGraph(double heuristic_weight) {
    setHeuristicWeight(heuristic_weight);
}

// ─── Vertex operations ─────────────────────────────────────────

uint64_t WeightedGraph::addNode(double x, double y) {
    uint64_t id = next_node_id_++;
    nodes_.emplace(id, Vertex(id, x, y));
    outgoing_[id];  // ensure entry exists
    return id;
}

uint64_t WeightedGraph::addNodeWithId(uint64_t id, double x, double y) {
    if (nodes_.count(id)) {
        throw std::runtime_error("Node ID already exists: " + std::to_string(id));
    }
    nodes_.emplace(id, Vertex(id, x, y));
    outgoing_[id];
    if (id >= next_node_id_) {
        next_node_id_ = id + 1;
    }
    return id;
}

const Vertex* WeightedGraph::getNode(uint64_t id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::vector<uint64_t> WeightedGraph::getNodeIds() const {
    std::vector<uint64_t> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ─── Edge operations ───────────────────────────────────────────

uint64_t WeightedGraph::addEdge(uint64_t source, uint64_t target, double weight) {
    if (!nodes_.count(source))
        throw std::runtime_error("Source node not found: " + std::to_string(source));
    if (!nodes_.count(target))
        throw std::runtime_error("Target node not found: " + std::to_string(target));
    if (!std::isfinite(weight) || weight < 0.0)
        throw std::invalid_argument("Edge weight must be finite and non-negative: " +
                                    std::to_string(weight));

    auto& targets = outgoing_[source];
    if (targets.count(target)) {
        throw std::invalid_argument("Edge already exists: " + std::to_string(source) +
                                    " -> " + std::to_string(target));
    }

    uint64_t id = next_edge_id_++;
    edges_.emplace(id, Edge(id, source, target, weight));
    targets.emplace(target, id);
    return id;
}

const Edge* WeightedGraph::getEdge(uint64_t id) const {
    auto it = edges_.find(id);
    return it != edges_.end() ? &it->second : nullptr;
}

std::optional<double> WeightedGraph::edgeWeight(uint64_t source, uint64_t target) const {
    auto it = outgoing_.find(source);
    if (it == outgoing_.end()) return std::nullopt;
    auto edge_it = it->second.find(target);
    if (edge_it == it->second.end()) return std::nullopt;
    return edges_.at(edge_it->second).weight;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<uint64_t> WeightedGraph::getOutgoing(uint64_t node_id) const {
    auto it = outgoing_.find(node_id);
    if (it == outgoing_.end()) return {};
    std::vector<uint64_t> targets;
    targets.reserve(it->second.size());
    for (const auto& [target, _] : it->second) {
        targets.push_back(target);
    }
    return targets;
}

// ─── Heuristic ─────────────────────────────────────────────────

double WeightedGraph::distance(uint64_t a, uint64_t b) const {
    const Vertex* va = getNode(a);
    const Vertex* vb = getNode(b);
    if (!va) throw std::runtime_error("Node not found: " + std::to_string(a));
    if (!vb) throw std::runtime_error("Node not found: " + std::to_string(b));
    return std::hypot(va->x - vb->x, va->y - vb->y);
}

void WeightedGraph::setHeuristicWeight(double weight) {
    if (!std::isfinite(weight) || weight < 0.0) {
        throw std::invalid_argument("Heuristic weight must be finite and non-negative: " +
                                    std::to_string(weight));
    }
    heuristic_weight_ = weight;
}

// ─── Search handles ────────────────────────────────────────────

GraphNode WeightedGraph::node(uint64_t id) const {
    if (!nodes_.count(id)) {
        throw std::runtime_error("Node not found: " + std::to_string(id));
    }
    return GraphNode(this, id);
}

} // namespace astar
