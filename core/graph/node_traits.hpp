#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace astar {

// ─── Node Capability ───────────────────────────────────────────
// A type N can be searched when it provides:
//
//   bool operator==(const N&) const           identity
//   std::hash<N>                              hash consistent with ==
//   Range connectedNodes() const              nodes reachable over one edge
//   Number cost(const N& to) const            actual edge cost, >= 0
//   Number estimatedCost(const N& to) const   heuristic, must not overestimate
//
// Connectivity is only ever read. N is held by value, so it should be
// cheap to copy (an id, a coordinate, a handle into a graph).

namespace detail {

template <typename N, typename = void>
struct HasEquality : std::false_type {};

template <typename N>
struct HasEquality<N, std::void_t<decltype(std::declval<const N&>() == std::declval<const N&>())>>
    : std::is_convertible<decltype(std::declval<const N&>() == std::declval<const N&>()), bool> {};

template <typename N, typename = void>
struct HasLess : std::false_type {};

template <typename N>
struct HasLess<N, std::void_t<decltype(std::declval<const N&>() < std::declval<const N&>())>>
    : std::is_convertible<decltype(std::declval<const N&>() < std::declval<const N&>()), bool> {};

template <typename N, typename = void>
struct HasHash : std::false_type {};

template <typename N>
struct HasHash<N, std::void_t<decltype(std::hash<N>{}(std::declval<const N&>()))>>
    : std::is_convertible<decltype(std::hash<N>{}(std::declval<const N&>())), std::size_t> {};

template <typename N, typename = void>
struct HasConnectedNodes : std::false_type {};

template <typename N>
struct HasConnectedNodes<N, std::void_t<decltype(*std::begin(std::declval<const N&>().connectedNodes())),
                                        decltype(std::end(std::declval<const N&>().connectedNodes()))>>
    : std::is_convertible<decltype(*std::begin(std::declval<const N&>().connectedNodes())), N> {};

template <typename N, typename = void>
struct HasCost : std::false_type {};

template <typename N>
struct HasCost<N, std::void_t<decltype(std::declval<const N&>().cost(std::declval<const N&>()))>>
    : std::is_arithmetic<std::decay_t<decltype(std::declval<const N&>().cost(std::declval<const N&>()))>> {};

template <typename N, typename = void>
struct HasEstimatedCost : std::false_type {};

template <typename N>
struct HasEstimatedCost<N, std::void_t<decltype(std::declval<const N&>().estimatedCost(std::declval<const N&>()))>>
    : std::is_arithmetic<std::decay_t<decltype(std::declval<const N&>().estimatedCost(std::declval<const N&>()))>> {};

} // namespace detail

/// True when N satisfies the node capability contract above.
template <typename N>
inline constexpr bool isGraphNode =
    std::is_copy_constructible_v<N> &&
    detail::HasEquality<N>::value &&
    detail::HasHash<N>::value &&
    detail::HasConnectedNodes<N>::value &&
    detail::HasCost<N>::value &&
    detail::HasEstimatedCost<N>::value;

/// True when N also has operator<, which fixes the neighbor visiting order.
template <typename N>
inline constexpr bool isOrderedNode = detail::HasLess<N>::value;

/// Number type used for g/h/f of a node type: the common type of its
/// cost() and estimatedCost() results.
template <typename N>
using NodeCost = std::common_type_t<
    std::decay_t<decltype(std::declval<const N&>().cost(std::declval<const N&>()))>,
    std::decay_t<decltype(std::declval<const N&>().estimatedCost(std::declval<const N&>()))>>;

/// Neighbors of `node` in the order the search visits them.
/// Ordered node types are sorted ascending; otherwise the node's own
/// enumeration order is kept. Repeated neighbors are dropped.
template <typename N>
std::vector<N> orderedNeighbors(const N& node) {
    std::vector<N> neighbors;
    std::unordered_set<N> seen;
    for (const auto& connected : node.connectedNodes()) {
        N neighbor = connected;
        if (seen.insert(neighbor).second) {
            neighbors.push_back(std::move(neighbor));
        }
    }
    if constexpr (isOrderedNode<N>) {
        std::sort(neighbors.begin(), neighbors.end());
    }
    return neighbors;
}

} // namespace astar
