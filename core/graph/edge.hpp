#pragma once

#include <cstdint>

namespace astar {

/// A directed, weighted edge source → target.
struct Edge {
    uint64_t id = 0;
    uint64_t source = 0;
    uint64_t target = 0;
    double weight = 1.0;

    Edge() = default;
    Edge(uint64_t id, uint64_t source, uint64_t target, double weight = 1.0)
        : id(id), source(source), target(target), weight(weight) {}
};

} // namespace astar
