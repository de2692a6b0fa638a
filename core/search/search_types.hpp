#pragma once

#include "graph/node_traits.hpp"

#include <vector>

namespace astar {

/// Search configuration parameters.
struct SearchConfig {
    int max_expansions = 0;         // 0 = unlimited
    double budget_seconds = 0.0;    // 0 = unlimited
    bool log_expansions = false;    // trace every expansion/relaxation
};

/// Result of a search run.
template <typename Node, typename Cost = NodeCost<Node>>
struct SearchResult {
    std::vector<Node> path;         // start..goal inclusive, empty when not found
    Cost cost{};                    // sum of edge costs along path
    bool found = false;
    int total_expansions = 0;
    int steps_created = 0;
    int relaxations = 0;
    double elapsed_seconds = 0.0;
    bool budget_exhausted = false;
};

} // namespace astar
