#pragma once

#include "graph/node_traits.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace astar {

using StepId = std::size_t;

/// Marks a step reached directly from the start node.
inline constexpr StepId kNoStep = std::numeric_limits<StepId>::max();

// ─── Step ──────────────────────────────────────────────────────
// One node as reached by a candidate path. Steps live in a StepArena
// and point backwards at their predecessor by index, so the
// predecessor chain is a tree rooted at the (implicit) start node.

template <typename Node, typename Cost = NodeCost<Node>>
struct Step {
    Node node;
    StepId previous = kNoStep;
    Cost step_cost{};           // g: actual cost from start
    Cost goal_cost{};           // h: estimate to goal, fixed at creation
    uint64_t sequence = 0;      // discovery order, breaks f ties

    Step(Node node, StepId previous, Cost step_cost, Cost goal_cost, uint64_t sequence)
        : node(std::move(node)), previous(previous),
          step_cost(step_cost), goal_cost(goal_cost), sequence(sequence) {}

    /// f = g + h
    Cost totalCost() const { return step_cost + goal_cost; }

    bool hasPrevious() const { return previous != kNoStep; }
};

// ─── StepArena ─────────────────────────────────────────────────
// Owns every step created during one search. Ids are indices and stay
// valid for the arena's lifetime; references do not (the vector grows).

template <typename Node, typename Cost = NodeCost<Node>>
class StepArena {
public:
    using StepType = Step<Node, Cost>;

    explicit StepArena(Node goal) : goal_(std::move(goal)) {}

    /// Create a first-layer step: g = start.cost(destination).
    StepId seed(const Node& start, const Node& destination) {
        Cost step_cost = start.cost(destination);
        return emplace(destination, kNoStep, step_cost);
    }

    /// Create a step one edge past `previous`: g = previous.g + edge_cost.
    StepId extend(StepId previous, const Node& destination, Cost edge_cost) {
        Cost step_cost = at(previous).step_cost + edge_cost;
        return emplace(destination, previous, step_cost);
    }

    /// Re-route `id` through `previous`. g is recomputed from the new
    /// predecessor; h is left untouched.
    void relax(StepId id, StepId previous, Cost edge_cost) {
        Cost step_cost = at(previous).step_cost + edge_cost;
        StepType& step = mutableAt(id);
        step.previous = previous;
        step.step_cost = step_cost;
    }

    const StepType& operator[](StepId id) const { return steps_[id]; }

    const StepType& at(StepId id) const {
        if (id >= steps_.size()) {
            throw std::out_of_range("Step not found: " + std::to_string(id));
        }
        return steps_[id];
    }

    size_t size() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }

private:
    Node goal_;
    std::vector<StepType> steps_;

    StepType& mutableAt(StepId id) {
        if (id >= steps_.size()) {
            throw std::out_of_range("Step not found: " + std::to_string(id));
        }
        return steps_[id];
    }

    StepId emplace(const Node& destination, StepId previous, Cost step_cost) {
        StepId id = steps_.size();
        Cost goal_cost = destination.estimatedCost(goal_);
        steps_.emplace_back(destination, previous, step_cost, goal_cost,
                            static_cast<uint64_t>(id));
        return id;
    }
};

} // namespace astar
