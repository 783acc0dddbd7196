// schedule/deployment_plan.h - End-to-end wave planning pipeline
// Part of the depwave deployment-wave library (C++20)
//
// PIPELINE:
//   options.validate()            bad tunables throw before any work
//   priority_patterns             malformed patterns throw before any work
//   condense(g)                   SCCs collapsed into units
//   compute_unit_priorities       admission key per unit
//   partition_waves               phase 1 (optional) then phase 2
//   merge_small_partitions        fold undersized waves, renumber 1..N
//   analyze_partitions            per-wave statistics
//   build_dependency_matrix       (later, earlier) -> edge count
//   rank_units                    diagnostic ranking, final numbering
//
// The graph is only read.  Each call owns all of its intermediate state,
// so concurrent calls on distinct or shared const graphs are safe.

#ifndef DEPWAVE_SCHEDULE_DEPLOYMENT_PLAN_H
#define DEPWAVE_SCHEDULE_DEPLOYMENT_PLAN_H

#include "partition.h"
#include "partition_analyzer.h"
#include "partition_merger.h"
#include "partition_options.h"
#include "pattern_match.h"
#include "priority.h"
#include "wave_partitioner.h"

#include <depwave/core/debug_log.h>
#include <depwave/graph/condensation.h>
#include <depwave/graph/dependency_graph.h>
#include <depwave/graph/graph_concepts.h>

#include <utility>
#include <vector>

namespace depwave::schedule {

/// Everything a downstream formatter needs.
///
/// - partitions: final waves, numbered 1..N, statistics filled in
/// - matrix: sparse inter-wave dependency counts
/// - ranking: every unit in admission order with its final wave
template<graph::node_key N>
struct deployment_plan {
    std::vector<partition<N>> partitions{};
    dependency_matrix matrix{};
    std::vector<ranked_unit<N>> ranking{};
};

/// Plan the deployment waves of g.
///
/// Throws malformed_pattern_error, std::invalid_argument (options) or
/// graph_inconsistency_error.  An empty graph yields an empty plan.
///
/// Example:
/// ```cpp
/// graph::dependency_graph<std::string> g;
/// g.add_edge("V_ORDERS", "ORDERS");
/// g.add_node_info("ORDERS", {"TABLE"});
/// g.add_node_info("V_ORDERS", {"VIEW"});
/// auto plan = build_deployment_plan(g, partition_options{});
/// // plan.partitions[0].nodes == {"ORDERS"} (TABLE level)
/// // plan.partitions[1].nodes == {"V_ORDERS"} (VIEW level)
/// ```
template<graph::node_key N>
[[nodiscard]] deployment_plan<N>
build_deployment_plan(graph::dependency_graph<N> const& g,
                      partition_options const& options) {
    options.validate();
    priority_patterns const patterns(options.prioritize_patterns);

    deployment_plan<N> plan;
    if (g.empty()) {
        return plan;
    }

    auto const c = graph::condense(g);
    DEPWAVE_DEBUG_LOG("Condensed %zu objects into %zu units", g.node_count(), c.unit_count());

    auto const priorities = compute_unit_priorities(g, c, patterns, options.etl_category);

    partition_state<N> state(c.unit_count());
    partition_waves(g, c, priorities, options, state);
    plan.partitions = std::move(state.partitions);

    merge_small_partitions(g, plan.partitions, options.min_size, options.max_size);
    DEPWAVE_DEBUG_LOG("Planned %zu waves", plan.partitions.size());

    analyze_partitions(g, plan.partitions);
    plan.matrix = build_dependency_matrix(g, plan.partitions);
    plan.ranking = rank_units(priorities, c, plan.partitions);
    return plan;
}

} // namespace depwave::schedule

#endif // DEPWAVE_SCHEDULE_DEPLOYMENT_PLAN_H
