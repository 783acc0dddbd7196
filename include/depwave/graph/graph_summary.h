// graph/graph_summary.h - Per-object dependency profile and structure summary
// Part of the depwave deployment-wave library (C++20)
//
// Inventory-level statistics that sit beside the wave schedule: how
// entangled each object is, and how the whole graph decomposes.
//
// profile_dependencies() runs one forward and one reverse BFS per node,
// O(V * (V + E)) in the worst case.  Callers with very large inventories
// profile a subset or bound the depth through reachability.h directly.

#ifndef DEPWAVE_GRAPH_SUMMARY_H
#define DEPWAVE_GRAPH_SUMMARY_H

#include "connected_components.h"
#include "dependency_graph.h"
#include "graph_concepts.h"
#include "node_info.h"
#include "reachability.h"
#include "scc.h"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace depwave::graph {

/// Dependency counts for one object.
///
/// transitive_only_* exclude the direct neighbours; total_* include them.
template<node_key N>
struct dependency_profile {
    N node{};
    std::string category{};
    std::size_t direct_dependencies = 0;
    std::size_t direct_dependents = 0;
    std::size_t transitive_only_dependencies = 0;
    std::size_t transitive_only_dependents = 0;
    std::size_t total_dependencies = 0;
    std::size_t total_dependents = 0;
};

/// Profile every node, in ascending key order.  Nodes without metadata,
/// or with an empty category, report category "N/A".
template<node_key N>
[[nodiscard]] std::vector<dependency_profile<N>>
profile_dependencies(dependency_graph<N> const& g) {
    std::vector<dependency_profile<N>> result;
    result.reserve(g.node_count());

    for (auto const& node : g.nodes()) {
        dependency_profile<N> p;
        p.node = node;
        auto const cat = g.category(node);
        p.category = cat.empty() ? std::string("N/A") : std::string(cat);

        auto const idx = g.index_of(node);
        p.direct_dependencies = g.out_degree(idx);
        p.direct_dependents = g.in_degree(idx);
        p.total_dependencies = transitive_dependencies(g, node).size();
        p.total_dependents = transitive_dependents(g, node).size();
        p.transitive_only_dependencies = p.total_dependencies - p.direct_dependencies;
        p.transitive_only_dependents = p.total_dependents - p.direct_dependents;

        result.push_back(std::move(p));
    }
    return result;
}

/// Whole-graph decomposition.
template<node_key N>
struct graph_structure {
    std::size_t total_nodes = 0;
    std::size_t total_edges = 0;
    std::size_t strong_component_count = 0;
    component_list<N> weak_components{};
    component_list<N> cycles{};
    std::vector<N> roots{};
    std::vector<N> leaves{};
    std::vector<std::size_t> weak_component_sizes{};   // descending
    std::vector<std::size_t> cycle_sizes{};            // descending
    std::map<std::string, std::size_t> category_counts{};
};

/// Summarise g: component structure, cycles, roots/leaves, categories.
/// Categories are bucketed with category_label().
template<node_key N>
[[nodiscard]] graph_structure<N>
analyze_structure(dependency_graph<N> const& g) {
    graph_structure<N> s;
    s.total_nodes = g.node_count();
    s.total_edges = g.edge_count();

    s.weak_components = weakly_connected_components(g);
    auto sccs = strongly_connected_components(g);
    s.strong_component_count = sccs.size();
    for (auto& c : sccs) {
        if (c.size() > 1) s.cycles.push_back(std::move(c));
    }
    s.roots = g.roots();
    s.leaves = g.leaves();

    for (auto const& c : s.weak_components) s.weak_component_sizes.push_back(c.size());
    for (auto const& c : s.cycles) s.cycle_sizes.push_back(c.size());
    std::sort(s.weak_component_sizes.begin(), s.weak_component_sizes.end(), std::greater<>{});
    std::sort(s.cycle_sizes.begin(), s.cycle_sizes.end(), std::greater<>{});

    for (auto const& node : g.nodes()) {
        ++s.category_counts[category_label(g.category(node))];
    }
    return s;
}

} // namespace depwave::graph

#endif // DEPWAVE_GRAPH_SUMMARY_H
