#pragma once

#include <cstdint>

namespace astar {

/// A positioned vertex of a WeightedGraph. The position feeds the
/// straight-line heuristic.
struct Vertex {
    uint64_t id = 0;
    double x = 0.0;
    double y = 0.0;

    Vertex() = default;
    Vertex(uint64_t id, double x, double y) : id(id), x(x), y(y) {}
};

} // namespace astar
