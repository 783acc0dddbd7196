// schedule/validation.h - Soundness checks for a wave sequence
// Part of the depwave deployment-wave library (C++20)
//
// validate_schedule() checks a partition sequence against its graph and
// reports every violation it finds rather than stopping at the first:
//   forward_dependency  edge a -> b with partition(a) < partition(b)
//   missing_node        graph node placed in no partition
//   duplicate_node      node placed in more than one partition
//   unknown_node        partition member that is not a graph node
//   split_cycle         members of one SCC spread over several partitions
// validate_matrix() checks a dependency matrix on its own: every entry
// must point from a later partition to a strictly earlier one.
//
// Results are deterministic: violations are grouped by kind in the order
// above, and node-keyed groups are sorted by node.

#ifndef DEPWAVE_SCHEDULE_VALIDATION_H
#define DEPWAVE_SCHEDULE_VALIDATION_H

#include "partition.h"

#include <depwave/graph/dependency_graph.h>
#include <depwave/graph/graph_concepts.h>
#include <depwave/graph/scc.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace depwave::schedule {

enum class violation_kind : std::uint8_t {
    forward_dependency,
    missing_node,
    duplicate_node,
    unknown_node,
    split_cycle,
};

[[nodiscard]] constexpr std::string_view to_string(violation_kind k) noexcept {
    switch (k) {
    case violation_kind::forward_dependency: return "forward_dependency";
    case violation_kind::missing_node:       return "missing_node";
    case violation_kind::duplicate_node:     return "duplicate_node";
    case violation_kind::unknown_node:       return "unknown_node";
    case violation_kind::split_cycle:        return "split_cycle";
    }
    return "unknown";
}

/// One problem found in a schedule.
///
/// - node / partition: the offending node and the partition it is in
///   (0 for missing_node)
/// - other / other_partition: the dependency for forward_dependency, the
///   second placement for duplicate_node, the separated SCC member for
///   split_cycle
template<graph::node_key N>
struct schedule_violation {
    violation_kind kind{};
    N node{};
    std::size_t partition = 0;
    std::optional<N> other{};
    std::size_t other_partition = 0;
};

/// Human-readable one-line description.
template<graph::node_key N>
[[nodiscard]] std::string describe(schedule_violation<N> const& v) {
    auto const name = graph::node_name(v.node);
    auto const other = v.other ? graph::node_name(*v.other) : std::string{};
    switch (v.kind) {
    case violation_kind::forward_dependency:
        return name + " (wave " + std::to_string(v.partition) + ") depends on " + other
             + " (wave " + std::to_string(v.other_partition) + ")";
    case violation_kind::missing_node:
        return name + " is not in any wave";
    case violation_kind::duplicate_node:
        return name + " is in wave " + std::to_string(v.partition) + " and wave "
             + std::to_string(v.other_partition);
    case violation_kind::unknown_node:
        return name + " (wave " + std::to_string(v.partition) + ") is not in the graph";
    case violation_kind::split_cycle:
        return name + " (wave " + std::to_string(v.partition) + ") shares a cycle with "
             + other + " (wave " + std::to_string(v.other_partition) + ")";
    }
    return name;
}

/// All violations of the sequence against g.  Empty when sound.
template<graph::node_key N>
[[nodiscard]] std::vector<schedule_violation<N>>
validate_schedule(graph::dependency_graph<N> const& g,
                  std::vector<partition<N>> const& partitions) {
    std::vector<schedule_violation<N>> forward, missing, duplicate, unknown, split;

    std::unordered_map<N, std::size_t> number_of;
    for (auto const& p : partitions) {
        for (auto const& n : p.nodes) {
            auto [it, fresh] = number_of.emplace(n, p.number);
            if (!fresh) {
                duplicate.push_back({violation_kind::duplicate_node, n, it->second, n, p.number});
            }
            if (!g.contains(n)) {
                unknown.push_back({violation_kind::unknown_node, n, p.number, std::nullopt, 0});
            }
        }
    }

    for (auto const& n : g.nodes()) {
        auto it = number_of.find(n);
        if (it == number_of.end()) {
            missing.push_back({violation_kind::missing_node, n, 0, std::nullopt, 0});
            continue;
        }
        for (auto const& d : g.direct_dependencies(n)) {
            auto dit = number_of.find(d);
            if (dit != number_of.end() && dit->second > it->second) {
                forward.push_back({violation_kind::forward_dependency, n, it->second, d, dit->second});
            }
        }
    }

    for (auto const& comp : graph::find_cycles(g)) {
        auto const& anchor = comp.front();
        auto ait = number_of.find(anchor);
        if (ait == number_of.end()) continue;
        for (std::size_t i = 1; i < comp.size(); ++i) {
            auto it = number_of.find(comp[i]);
            if (it != number_of.end() && it->second != ait->second) {
                split.push_back({violation_kind::split_cycle, comp[i], it->second, anchor, ait->second});
            }
        }
    }

    auto by_node = [](schedule_violation<N> const& a, schedule_violation<N> const& b) {
        return a.node < b.node;
    };
    std::stable_sort(duplicate.begin(), duplicate.end(), by_node);
    std::stable_sort(unknown.begin(), unknown.end(), by_node);

    std::vector<schedule_violation<N>> result;
    result.reserve(forward.size() + missing.size() + duplicate.size() + unknown.size() + split.size());
    for (auto* group : {&forward, &missing, &duplicate, &unknown, &split}) {
        result.insert(result.end(), group->begin(), group->end());
    }
    return result;
}

/// A matrix entry that does not point strictly backwards.
struct matrix_violation {
    std::size_t source_partition = 0;
    std::size_t target_partition = 0;
    std::size_t edge_count = 0;
};

/// Entries (i, j) of the matrix with j >= i.
[[nodiscard]] inline std::vector<matrix_violation>
validate_matrix(dependency_matrix const& matrix) {
    std::vector<matrix_violation> result;
    for (auto const& [cell, count] : matrix) {
        if (cell.second >= cell.first) {
            result.push_back({cell.first, cell.second, count});
        }
    }
    return result;
}

} // namespace depwave::schedule

#endif // DEPWAVE_SCHEDULE_VALIDATION_H
