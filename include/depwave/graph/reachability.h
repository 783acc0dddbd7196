// graph/reachability.h - Transitive dependencies and dependents
// Part of the depwave deployment-wave library (C++20)
//
// ALGORITHM: Breadth-first search over forward (dependencies) or reverse
// (dependents) adjacency.
// Complexity: O(V + E) unbounded; a depth limit stops expansion early on
// very large graphs.
//
// The start node is never part of the result, even when a cycle leads
// back to it.

#ifndef DEPWAVE_GRAPH_REACHABILITY_H
#define DEPWAVE_GRAPH_REACHABILITY_H

#include "dependency_graph.h"
#include "graph_concepts.h"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

namespace depwave::graph {

namespace detail {

enum class direction { forward, reverse };

/// Indices reachable from start (excluded), in BFS discovery order.
template<node_key N>
[[nodiscard]] std::vector<typename dependency_graph<N>::index_type>
bfs_reach(dependency_graph<N> const& g,
          typename dependency_graph<N>::index_type start,
          direction dir,
          std::optional<std::size_t> max_depth) {
    using index_t = typename dependency_graph<N>::index_type;

    std::vector<index_t> reached;
    std::vector<bool> visited(g.node_count(), false);
    std::deque<std::pair<index_t, std::size_t>> queue;

    visited[start] = true;
    queue.emplace_back(start, 0);

    while (!queue.empty()) {
        auto const [current, depth] = queue.front();
        queue.pop_front();

        if (max_depth && depth >= *max_depth) {
            continue;
        }

        auto const& nbrs = dir == direction::forward
            ? g.out_indices(current)
            : g.in_indices(current);
        for (auto v : nbrs) {
            if (!visited[v]) {
                visited[v] = true;
                reached.push_back(v);
                queue.emplace_back(v, depth + 1);
            }
        }
    }
    return reached;
}

template<node_key N>
[[nodiscard]] std::vector<N>
reach_keys(dependency_graph<N> const& g, N const& node, direction dir,
           std::optional<std::size_t> max_depth) {
    auto const start = g.index_of(node);
    if (start == dependency_graph<N>::npos) {
        return {};
    }
    auto const idxs = bfs_reach(g, start, dir, max_depth);
    std::vector<N> result;
    result.reserve(idxs.size());
    for (auto i : idxs) result.push_back(g.key_of(i));
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace detail

/// Every node that `node` depends on, directly or indirectly.
///
/// With max_depth = d, only nodes within d hops are returned.
/// Result is sorted; empty for an absent node.
template<node_key N>
[[nodiscard]] std::vector<N>
transitive_dependencies(dependency_graph<N> const& g, N const& node,
                        std::optional<std::size_t> max_depth = std::nullopt) {
    return detail::reach_keys(g, node, detail::direction::forward, max_depth);
}

/// Every node that depends on `node`, directly or indirectly.
template<node_key N>
[[nodiscard]] std::vector<N>
transitive_dependents(dependency_graph<N> const& g, N const& node,
                      std::optional<std::size_t> max_depth = std::nullopt) {
    return detail::reach_keys(g, node, detail::direction::reverse, max_depth);
}

} // namespace depwave::graph

#endif // DEPWAVE_GRAPH_REACHABILITY_H
