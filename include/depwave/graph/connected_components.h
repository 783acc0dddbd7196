// graph/connected_components.h - Weakly connected components
// Part of the depwave deployment-wave library (C++20)
//
// ALGORITHM: Iterative depth-first search over both edge directions.
// Complexity: O(V + E) time, O(V) space.
//
// SEMANTICS: edge direction is ignored.  Nodes u and v share a component
// if an undirected path joins them.  Isolated nodes form singleton
// components.
//
// Determinism: start nodes in ascending key order, members sorted,
// components ordered by smallest member.

#ifndef DEPWAVE_GRAPH_CONNECTED_COMPONENTS_H
#define DEPWAVE_GRAPH_CONNECTED_COMPONENTS_H

#include "dependency_graph.h"
#include "graph_concepts.h"
#include "scc.h"

#include <cstddef>
#include <utility>
#include <vector>

namespace depwave::graph {

/// Weakly connected components.
///
/// Example:
/// ```cpp
/// dependency_graph<std::string> g;
/// g.add_edge("A", "B");
/// g.add_edge("C", "B");
/// g.add_edge("X", "Y");
/// auto wcc = weakly_connected_components(g);
/// // wcc == {{"A", "B", "C"}, {"X", "Y"}}
/// ```
template<node_key N>
[[nodiscard]] component_list<N>
weakly_connected_components(dependency_graph<N> const& g) {
    using index_t = typename dependency_graph<N>::index_type;

    component_list<N> result;
    auto const V = g.node_count();
    if (V == 0) {
        return result;
    }

    std::vector<bool> visited(V, false);
    std::vector<index_t> stack;

    for (auto const start : g.sorted_indices()) {
        if (visited[start]) {
            continue;
        }

        std::vector<N> comp;
        stack.push_back(start);

        while (!stack.empty()) {
            auto const u = stack.back();
            stack.pop_back();
            if (visited[u]) {
                continue;
            }
            visited[u] = true;
            comp.push_back(g.key_of(u));

            for (auto v : g.out_indices(u)) {
                if (!visited[v]) stack.push_back(v);
            }
            for (auto v : g.in_indices(u)) {
                if (!visited[v]) stack.push_back(v);
            }
        }
        result.push_back(std::move(comp));
    }

    detail::canonicalise(result);
    return result;
}

} // namespace depwave::graph

#endif // DEPWAVE_GRAPH_CONNECTED_COMPONENTS_H
