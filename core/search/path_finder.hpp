#pragma once

#include "graph/node_traits.hpp"
#include "logging/log.hpp"
#include "search/budget_manager.hpp"
#include "search/frontier.hpp"
#include "search/search_types.hpp"
#include "search/step.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>
#include <vector>

namespace astar {

// ─── PathFinder ────────────────────────────────────────────────
// A* over any type satisfying the node capability contract
// (see graph/node_traits.hpp).
//
// The start node is closed up front and its neighbors seed the
// frontier. Each round pops the lowest (f, sequence) step: reaching
// the goal ends the search, anything else is closed and its open
// neighbors are either inserted or relaxed. Closed nodes are never
// reopened, so optimality needs a consistent heuristic.
//
// Results:
//   start == goal  -> [start], cost 0
//   unreachable    -> [], found == false
//   budget hit     -> [], found == false, budget_exhausted == true

template <typename Node>
class PathFinder {
    static_assert(isGraphNode<Node>,
                  "PathFinder requires ==, std::hash, connectedNodes(), cost() and estimatedCost()");

public:
    using Cost = NodeCost<Node>;
    using Result = SearchResult<Node, Cost>;

    PathFinder() = default;
    explicit PathFinder(const SearchConfig& config) : config_(config) {}

    const SearchConfig& config() const { return config_; }

    /// Run A* from `start` to `goal`, returning the path and statistics.
    Result search(const Node& start, const Node& goal) const;

    /// Path from `start` to `goal` inclusive; empty when none exists.
    std::vector<Node> findPath(const Node& start, const Node& goal) const {
        return search(start, goal).path;
    }

private:
    SearchConfig config_;

    static std::vector<Node> reconstructPath(const StepArena<Node, Cost>& arena,
                                             StepId goal_step, const Node& start);
};

template <typename Node>
typename PathFinder<Node>::Result
PathFinder<Node>::search(const Node& start, const Node& goal) const {
    auto log = logging::logger();
    BudgetManager budget(config_.budget_seconds, config_.max_expansions);
    budget.start();

    Result result;
    if (start == goal) {
        result.path.push_back(start);
        result.found = true;
        result.elapsed_seconds = budget.elapsedSeconds();
        return result;
    }

    StepArena<Node, Cost> arena(goal);
    Frontier<Node, Cost> frontier(arena);
    std::unordered_set<Node> closed{start};

    bool warned_negative = false;
    auto checkEdgeCost = [&](Cost edge_cost) {
        if (edge_cost < Cost{} && !warned_negative) {
            log->warn("negative edge cost {} seen; path optimality is not guaranteed", edge_cost);
            warned_negative = true;
        }
    };

    log->debug("search started");

    for (const Node& neighbor : orderedNeighbors(start)) {
        if (closed.count(neighbor)) continue;
        StepId id = arena.seed(start, neighbor);
        checkEdgeCost(arena[id].step_cost);
        frontier.push(id);
    }

    while (!frontier.empty()) {
        StepId current = frontier.popMin();
        // copied: extend() may grow the arena under a reference
        const Node node = arena[current].node;
        const Cost current_cost = arena[current].step_cost;

        if (node == goal) {
            result.path = reconstructPath(arena, current, start);
            result.cost = current_cost;
            result.found = true;
            break;
        }

        if (!budget.canContinue()) {
            result.budget_exhausted = true;
            log->warn("search budget exhausted after {} expansions ({:.3f}s)",
                      budget.expansions(), budget.elapsedSeconds());
            break;
        }
        budget.recordExpansion();
        closed.insert(node);

        if (config_.log_expansions) {
            log->trace("expand step {} g={} f={} open={}", current, current_cost,
                       arena[current].totalCost(), frontier.size());
        }

        for (const Node& neighbor : orderedNeighbors(node)) {
            if (closed.count(neighbor)) continue;

            Cost edge_cost = node.cost(neighbor);
            checkEdgeCost(edge_cost);

            std::optional<StepId> open = frontier.find(neighbor);
            if (!open) {
                frontier.push(arena.extend(current, neighbor, edge_cost));
                continue;
            }

            if (current_cost + edge_cost < arena[*open].step_cost) {
                if (config_.log_expansions) {
                    log->trace("relax step {} g={} -> {}", *open, arena[*open].step_cost,
                               current_cost + edge_cost);
                }
                arena.relax(*open, current, edge_cost);
                frontier.reposition(*open);
                result.relaxations++;
            }
        }
    }

    result.total_expansions = budget.expansions();
    result.steps_created = static_cast<int>(arena.size());
    result.elapsed_seconds = budget.elapsedSeconds();

    log->debug("search finished: found={} cost={} expansions={} steps={} relaxations={}",
               result.found, result.cost, result.total_expansions,
               result.steps_created, result.relaxations);
    return result;
}

template <typename Node>
std::vector<Node> PathFinder<Node>::reconstructPath(const StepArena<Node, Cost>& arena,
                                                    StepId goal_step, const Node& start) {
    std::vector<Node> path;
    for (StepId id = goal_step; id != kNoStep; id = arena[id].previous) {
        path.push_back(arena[id].node);
    }
    path.push_back(start);
    std::reverse(path.begin(), path.end());
    return path;
}

// ─── Entry points ──────────────────────────────────────────────

/// Path from `start` to `goal` (the start node asks for a route to the goal).
template <typename Node>
std::vector<Node> findPath(const Node& start, const Node& goal) {
    return PathFinder<Node>().findPath(start, goal);
}

/// Path from `start` to `goal`, asked from the goal's side.
template <typename Node>
std::vector<Node> findPathFrom(const Node& goal, const Node& start) {
    return findPath(start, goal);
}

} // namespace astar
