// schedule/priority.h - Admission priority of condensation units
// Part of the depwave deployment-wave library (C++20)
//
// Ready units enter waves in ascending order of the key
//   (tier, total_dependents, -transitive_dependencies, size, min_node)
// where
//   tier                    0 user-prioritised (any member matches a
//                           pattern), 2 ETL (every member has the ETL
//                           category), 1 otherwise
//   total_dependents        sum of direct dependents over the members,
//                           ascending (fewer dependents first)
//   transitive_dependencies units reachable in the condensation,
//                           descending
//   size                    member count, ascending
//   min_node                smallest member, ascending (unique per unit)
//
// Transitive counts need one BFS per unit over the condensation.  Visit
// marks are epoch-stamped so the BFS state is allocated once.

#ifndef DEPWAVE_SCHEDULE_PRIORITY_H
#define DEPWAVE_SCHEDULE_PRIORITY_H

#include "partition.h"
#include "pattern_match.h"

#include <depwave/graph/condensation.h>
#include <depwave/graph/dependency_graph.h>
#include <depwave/graph/graph_concepts.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace depwave::schedule {

/// Coarse priority bucket; lower deploys earlier.
enum class priority_tier : std::uint8_t {
    user_prioritized = 0,
    regular = 1,
    etl = 2,
};

[[nodiscard]] constexpr std::string_view to_string(priority_tier t) noexcept {
    switch (t) {
    case priority_tier::user_prioritized: return "User-Prioritized";
    case priority_tier::regular:          return "Regular";
    case priority_tier::etl:              return "ETL";
    }
    return "Unknown";
}

/// Priority signals for one condensation unit.
template<graph::node_key N>
struct unit_priority {
    std::size_t unit = 0;
    priority_tier tier = priority_tier::regular;
    std::size_t total_dependents = 0;
    std::size_t transitive_dependencies = 0;
    std::size_t size = 0;
    N min_node{};
};

/// Strict admission order: true if a is admitted before b.
template<graph::node_key N>
[[nodiscard]] bool admitted_before(unit_priority<N> const& a, unit_priority<N> const& b) {
    if (a.tier != b.tier) return a.tier < b.tier;
    if (a.total_dependents != b.total_dependents) return a.total_dependents < b.total_dependents;
    if (a.transitive_dependencies != b.transitive_dependencies) {
        return a.transitive_dependencies > b.transitive_dependencies;
    }
    if (a.size != b.size) return a.size < b.size;
    if (a.min_node != b.min_node) return a.min_node < b.min_node;
    return a.unit < b.unit;
}

/// Number of units reachable from each unit in the condensation.
[[nodiscard]] inline std::vector<std::size_t>
transitive_unit_counts(std::vector<std::vector<std::size_t>> const& deps) {
    auto const U = deps.size();
    std::vector<std::size_t> counts(U, 0);
    std::vector<std::size_t> stamp(U, 0);
    std::vector<std::size_t> queue;
    queue.reserve(U);

    for (std::size_t u = 0; u < U; ++u) {
        auto const epoch = u + 1;
        queue.clear();
        queue.push_back(u);
        stamp[u] = epoch;
        std::size_t head = 0;
        while (head < queue.size()) {
            auto const cur = queue[head++];
            for (auto d : deps[cur]) {
                if (stamp[d] != epoch) {
                    stamp[d] = epoch;
                    queue.push_back(d);
                }
            }
        }
        counts[u] = queue.size() - 1;
    }
    return counts;
}

/// Compute the priority of every unit, indexed by unit id.
template<graph::node_key N>
[[nodiscard]] std::vector<unit_priority<N>>
compute_unit_priorities(graph::dependency_graph<N> const& g,
                        graph::condensation<N> const& c,
                        priority_patterns const& patterns,
                        std::string_view etl_category) {
    auto const transitive = transitive_unit_counts(c.dependency_lists());

    std::vector<unit_priority<N>> result(c.unit_count());
    for (std::size_t u = 0; u < c.unit_count(); ++u) {
        auto const& members = c.units[u];
        auto& p = result[u];
        p.unit = u;
        p.size = members.size();
        p.transitive_dependencies = transitive[u];
        if (!members.empty()) {
            p.min_node = *std::min_element(members.begin(), members.end());
        }

        bool any_pattern = false;
        bool all_etl = !members.empty();
        for (auto const& m : members) {
            auto const idx = g.index_of(m);
            if (idx != graph::dependency_graph<N>::npos) {
                p.total_dependents += g.in_degree(idx);
            }
            if (!any_pattern && !patterns.empty() && patterns.matches(graph::node_name(m))) {
                any_pattern = true;
            }
            if (g.category(m) != etl_category) {
                all_etl = false;
            }
        }

        if (any_pattern) {
            p.tier = priority_tier::user_prioritized;
        } else if (all_etl) {
            p.tier = priority_tier::etl;
        } else {
            p.tier = priority_tier::regular;
        }
    }
    return result;
}

/// One row of the diagnostic ranking.
///
/// assigned_partition is the final partition number of the unit, or
/// empty if the unit was never placed.
template<graph::node_key N>
struct ranked_unit {
    unit_priority<N> priority{};
    std::vector<N> nodes{};
    std::optional<std::size_t> assigned_partition{};
    bool user_prioritized = false;
};

/// Every unit in admission order, annotated with its partition.
template<graph::node_key N>
[[nodiscard]] std::vector<ranked_unit<N>>
rank_units(std::vector<unit_priority<N>> const& priorities,
           graph::condensation<N> const& c,
           std::vector<partition<N>> const& partitions) {
    std::unordered_map<N, std::size_t> partition_of;
    for (auto const& p : partitions) {
        for (auto const& n : p.nodes) partition_of.emplace(n, p.number);
    }

    std::vector<ranked_unit<N>> result;
    result.reserve(priorities.size());
    for (auto const& pr : priorities) {
        ranked_unit<N> r;
        r.priority = pr;
        r.nodes = c.units[pr.unit];
        r.user_prioritized = pr.tier == priority_tier::user_prioritized;
        if (!r.nodes.empty()) {
            auto it = partition_of.find(r.nodes.front());
            if (it != partition_of.end()) r.assigned_partition = it->second;
        }
        result.push_back(std::move(r));
    }
    std::sort(result.begin(), result.end(),
        [](ranked_unit<N> const& a, ranked_unit<N> const& b) {
            return admitted_before(a.priority, b.priority);
        });
    return result;
}

} // namespace depwave::schedule

#endif // DEPWAVE_SCHEDULE_PRIORITY_H
