#include "graph/graph_node.hpp"
#include "graph/weighted_graph.hpp"

#include <limits>

namespace astar {

std::vector<GraphNode> GraphNode::connectedNodes() const {
    std::vector<GraphNode> nodes;
    if (!graph_) return nodes;
    for (uint64_t target : graph_->getOutgoing(id_)) {
        nodes.emplace_back(graph_, target);
    }
    return nodes;
}

double GraphNode::cost(const GraphNode& to) const {
    if (!graph_ || graph_ != to.graph_) {
        return std::numeric_limits<double>::infinity();
    }
    return graph_->edgeWeight(id_, to.id_).value_or(std::numeric_limits<double>::infinity());
}

double GraphNode::estimatedCost(const GraphNode& to) const {
    // Nodes of different graphs are never connected; 0 stays admissible.
    if (!graph_ || graph_ != to.graph_) return 0.0;
    double weight = graph_->heuristicWeight();
    if (weight == 0.0) return 0.0;
    return weight * graph_->distance(id_, to.id_);
}

} // namespace astar
