// PyBind11 bindings for the astar core.
// Exposes WeightedGraph, the search configuration and find_path to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "graph/graph_node.hpp"
#include "graph/weighted_graph.hpp"
#include "logging/log.hpp"
#include "search/path_finder.hpp"
#include "search/search_types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

using GraphSearchResult = astar::SearchResult<astar::GraphNode>;

PYBIND11_MODULE(astar_bindings, m) {
    m.doc() = "astar C++ core bindings";

    // ── Vertex ──
    py::class_<astar::Vertex>(m, "Vertex")
        .def(py::init<>())
        .def_readonly("id", &astar::Vertex::id)
        .def_readonly("x", &astar::Vertex::x)
        .def_readonly("y", &astar::Vertex::y);

    // ── Edge ──
    py::class_<astar::Edge>(m, "Edge")
        .def(py::init<>())
        .def_readonly("id", &astar::Edge::id)
        .def_readonly("source", &astar::Edge::source)
        .def_readonly("target", &astar::Edge::target)
        .def_readonly("weight", &astar::Edge::weight);

    // ── GraphNode ──
    py::class_<astar::GraphNode>(m, "GraphNode")
        .def_property_readonly("id", &astar::GraphNode::id)
        .def("cost", &astar::GraphNode::cost)
        .def("estimated_cost", &astar::GraphNode::estimatedCost)
        .def("connected_nodes", &astar::GraphNode::connectedNodes)
        .def("__eq__", &astar::GraphNode::operator==)
        .def("__hash__", [](const astar::GraphNode& n) {
            return std::hash<astar::GraphNode>()(n);
        });

    // ── WeightedGraph ──
    py::class_<astar::WeightedGraph>(m, "WeightedGraph")
        .def(py::init<>())
        .def(py::init<double>(), py::arg("heuristic_weight"))
        .def("add_node", &astar::WeightedGraph::addNode,
             py::arg("x") = 0.0, py::arg("y") = 0.0)
        .def("add_node_with_id", &astar::WeightedGraph::addNodeWithId,
             py::arg("id"), py::arg("x"), py::arg("y"))
        .def("get_node", &astar::WeightedGraph::getNode,
             py::return_value_policy::reference_internal)
        .def("has_node", &astar::WeightedGraph::hasNode)
        .def("get_node_ids", &astar::WeightedGraph::getNodeIds)
        .def("node_count", &astar::WeightedGraph::nodeCount)
        .def("add_edge", &astar::WeightedGraph::addEdge,
             py::arg("source"), py::arg("target"), py::arg("weight") = 1.0)
        .def("get_edge", &astar::WeightedGraph::getEdge,
             py::return_value_policy::reference_internal)
        .def("edge_weight", &astar::WeightedGraph::edgeWeight)
        .def("edge_count", &astar::WeightedGraph::edgeCount)
        .def("get_outgoing", &astar::WeightedGraph::getOutgoing)
        .def("distance", &astar::WeightedGraph::distance)
        .def_property("heuristic_weight",
                      &astar::WeightedGraph::heuristicWeight,
                      &astar::WeightedGraph::setHeuristicWeight)
        .def("node", &astar::WeightedGraph::node, py::keep_alive<0, 1>());

    // ── SearchConfig ──
    py::class_<astar::SearchConfig>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("max_expansions", &astar::SearchConfig::max_expansions)
        .def_readwrite("budget_seconds", &astar::SearchConfig::budget_seconds)
        .def_readwrite("log_expansions", &astar::SearchConfig::log_expansions);

    // ── SearchResult ──
    py::class_<GraphSearchResult>(m, "SearchResult")
        .def(py::init<>())
        .def_property_readonly("path", [](const GraphSearchResult& r) {
            std::vector<uint64_t> ids;
            ids.reserve(r.path.size());
            for (const auto& node : r.path) ids.push_back(node.id());
            return ids;
        })
        .def_readonly("cost", &GraphSearchResult::cost)
        .def_readonly("found", &GraphSearchResult::found)
        .def_readonly("total_expansions", &GraphSearchResult::total_expansions)
        .def_readonly("steps_created", &GraphSearchResult::steps_created)
        .def_readonly("relaxations", &GraphSearchResult::relaxations)
        .def_readonly("elapsed_seconds", &GraphSearchResult::elapsed_seconds)
        .def_readonly("budget_exhausted", &GraphSearchResult::budget_exhausted);

    m.def("find_path",
          [](const astar::WeightedGraph& graph, uint64_t start, uint64_t goal,
             const astar::SearchConfig& config) {
              astar::PathFinder<astar::GraphNode> finder(config);
              return finder.search(graph.node(start), graph.node(goal));
          },
          py::arg("graph"), py::arg("start"), py::arg("goal"),
          py::arg("config") = astar::SearchConfig());

    m.def("set_log_level", [](const std::string& name) {
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            throw std::invalid_argument("Unknown log level: " + name);
        }
        astar::logging::setLogLevel(level);
    }, py::arg("level"));
}
