// graph/condensation.h - Collapse strongly connected components into units
// Part of the depwave deployment-wave library (C++20)
//
// ALGORITHM:
// Given a dependency graph G and its strongly connected components,
// produce the condensation C where:
// - Each component becomes one unit, numbered by its position in the
//   component list (ascending smallest member)
// - Edges between units are preserved (deduplicated)
// - Edges inside a unit are dropped
//
// COMPLEXITY: O(V + E)
//
// The unit graph is an ordinary dependency_graph<std::size_t> whose keys
// are the unit ids, added in ascending order, so index == unit id.  It is
// acyclic by construction, and it holds member keys by value: the source
// graph may be discarded once the condensation exists.

#ifndef DEPWAVE_GRAPH_CONDENSATION_H
#define DEPWAVE_GRAPH_CONDENSATION_H

#include "dependency_graph.h"
#include "graph_concepts.h"
#include "scc.h"

#include <cstddef>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace depwave::graph {

/// Result of condensation.
///
/// - units[u]: sorted member keys of unit u
/// - unit_of: member key -> unit id
/// - dag: unit-level dependency graph (unit u depends on unit v)
template<node_key N>
struct condensation {
    std::vector<std::vector<N>> units{};
    std::unordered_map<N, std::size_t> unit_of{};
    dependency_graph<std::size_t> dag{};

    [[nodiscard]] std::size_t unit_count() const noexcept { return units.size(); }

    /// Unit containing key.  Throws std::out_of_range for unknown keys.
    [[nodiscard]] std::size_t unit_for(N const& key) const {
        auto it = unit_of.find(key);
        if (it == unit_of.end()) {
            throw std::out_of_range("condensation::unit_for: key not in any unit");
        }
        return it->second;
    }

    /// Units that unit u depends on, ascending.
    [[nodiscard]] std::vector<std::size_t> unit_dependencies(std::size_t u) const {
        return dag.direct_dependencies(u);
    }

    /// Dependency lists for every unit, indexed by unit id.
    /// Throws std::out_of_range if the dag names a unit that does not exist.
    [[nodiscard]] std::vector<std::vector<std::size_t>> dependency_lists() const {
        std::vector<std::vector<std::size_t>> deps(units.size());
        for (std::size_t u = 0; u < units.size(); ++u) {
            deps[u] = dag.direct_dependencies(u);
            for (auto d : deps[u]) {
                if (d >= units.size()) {
                    throw std::out_of_range("condensation::dependency_lists: unknown unit id");
                }
            }
        }
        return deps;
    }
};

/// Build the condensation from precomputed components.
///
/// Preconditions: comps partitions the node set of g (as returned by
/// strongly_connected_components).
template<node_key N>
[[nodiscard]] condensation<N>
condense(dependency_graph<N> const& g, component_list<N> comps) {
    condensation<N> result;
    result.units = std::move(comps);
    result.unit_of.reserve(g.node_count());

    for (std::size_t u = 0; u < result.units.size(); ++u) {
        (void)result.dag.add_node(u);
        for (auto const& member : result.units[u]) {
            result.unit_of.emplace(member, u);
        }
    }

    // Cross-unit edges only.  Duplicates collapse in add_edge().
    using index_t = typename dependency_graph<N>::index_type;
    std::vector<std::size_t> unit_by_index(g.node_count());
    for (std::size_t i = 0; i < g.node_count(); ++i) {
        unit_by_index[i] = result.unit_for(g.key_of(static_cast<index_t>(i)));
    }
    for (std::size_t i = 0; i < g.node_count(); ++i) {
        auto const ui = unit_by_index[i];
        for (auto v : g.out_indices(static_cast<index_t>(i))) {
            auto const uv = unit_by_index[v];
            if (ui != uv) {
                result.dag.add_edge(ui, uv);
            }
        }
    }
    return result;
}

/// Convenience overload: compute the components, then condense.
///
/// Example:
/// ```cpp
/// // A -> B -> A, B -> C
/// auto c = condense(g);
/// // c.units == {{"A","B"}, {"C"}}; c.dag has the single edge 0 -> 1
/// ```
template<node_key N>
[[nodiscard]] condensation<N>
condense(dependency_graph<N> const& g) {
    return condense(g, strongly_connected_components(g));
}

} // namespace depwave::graph

#endif // DEPWAVE_GRAPH_CONDENSATION_H
