// schedule/partition_analyzer.h - Per-wave statistics and the wave matrix
// Part of the depwave deployment-wave library (C++20)
//
// Both functions run on the final (merged, renumbered) sequence and only
// read the graph.  Root and leaf status is global: a member is listed as
// a root when nothing in the whole graph depends on it, and as a leaf
// when it depends on nothing, regardless of which wave its neighbours
// are in.
//
// COMPLEXITY: O(V + E) each.

#ifndef DEPWAVE_SCHEDULE_PARTITION_ANALYZER_H
#define DEPWAVE_SCHEDULE_PARTITION_ANALYZER_H

#include "partition.h"

#include <depwave/graph/dependency_graph.h>
#include <depwave/graph/graph_concepts.h>
#include <depwave/graph/node_info.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace depwave::schedule {

namespace detail {

template<graph::node_key N>
[[nodiscard]] std::unordered_map<N, std::size_t>
partition_numbers(std::vector<partition<N>> const& partitions) {
    std::unordered_map<N, std::size_t> number_of;
    for (auto const& p : partitions) {
        for (auto const& n : p.nodes) number_of.emplace(n, p.number);
    }
    return number_of;
}

} // namespace detail

/// Fill partition_stats for every partition.
///
/// External edges are counted per target partition; in a sound schedule
/// every target is earlier than the source.  Categories are bucketed with
/// graph::category_label().
template<graph::node_key N>
void analyze_partitions(graph::dependency_graph<N> const& g,
                        std::vector<partition<N>>& partitions) {
    using graph_t = graph::dependency_graph<N>;
    auto const number_of = detail::partition_numbers(partitions);

    for (auto& p : partitions) {
        partition_stats<N> s;
        for (auto const& n : p.nodes) {
            ++s.category_counts[graph::category_label(g.category(n))];

            auto const idx = g.index_of(n);
            if (idx == graph_t::npos) continue;

            if (g.in_degree(idx) == 0) s.root_nodes.push_back(n);
            if (g.out_degree(idx) == 0) s.leaf_nodes.push_back(n);

            for (auto v : g.out_indices(idx)) {
                auto it = number_of.find(g.key_of(v));
                if (it == number_of.end()) continue;
                if (it->second == p.number) {
                    ++s.internal_dependencies;
                } else {
                    ++s.external_dependencies;
                    ++s.dependencies_by_partition[it->second];
                }
            }
        }
        std::sort(s.root_nodes.begin(), s.root_nodes.end());
        std::sort(s.leaf_nodes.begin(), s.leaf_nodes.end());
        p.stats = std::move(s);
    }
}

/// Sparse matrix of edges from a later partition to an earlier one.
///
/// Entry (i, j) with i > j holds the number of edges from nodes of
/// partition i to nodes of partition j.  Zero entries are omitted.
///
/// Example:
/// ```cpp
/// // A -> B -> C, waves {C}, {B}, {A}
/// auto m = build_dependency_matrix(g, waves);
/// // m == {{{2, 1}, 1}, {{3, 2}, 1}}
/// ```
template<graph::node_key N>
[[nodiscard]] dependency_matrix
build_dependency_matrix(graph::dependency_graph<N> const& g,
                        std::vector<partition<N>> const& partitions) {
    using graph_t = graph::dependency_graph<N>;
    auto const number_of = detail::partition_numbers(partitions);

    dependency_matrix matrix;
    for (auto const& p : partitions) {
        for (auto const& n : p.nodes) {
            auto const idx = g.index_of(n);
            if (idx == graph_t::npos) continue;
            for (auto v : g.out_indices(idx)) {
                auto it = number_of.find(g.key_of(v));
                if (it != number_of.end() && it->second < p.number) {
                    ++matrix[{p.number, it->second}];
                }
            }
        }
    }
    return matrix;
}

} // namespace depwave::schedule

#endif // DEPWAVE_SCHEDULE_PARTITION_ANALYZER_H
