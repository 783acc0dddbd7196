// schedule/wave_partitioner.h - Two-phase wave partitioning over units
// Part of the depwave deployment-wave library (C++20)
//
// Works on the condensation, so every strongly connected component moves
// as one unit and all reasoning is over a DAG.  The set of assigned units
// lives in a caller-owned partition_state that each phase reads and
// extends; waves are only ever appended.
//
// PHASE 1 - category levelling (level_simple_categories)
// Simple categories are levelled in a fixed order (TABLE, VIEW, FUNCTION
// by default).  A unit is levelled when every member has a simple
// category and every unit it depends on is levelled too; it belongs to
// the bucket of the latest simple category among its members.  For each
// category in order, all ready units of that bucket form one uncapped
// simple_object wave, repeatedly, until none is ready; the category
// list is swept again until a full sweep places nothing (a TABLE that
// depends on a FUNCTION lands in the second sweep).
//
// PHASE 2 - priority bin-packing (pack_priority_waves)
// Each iteration takes the ready set R (unassigned units whose
// dependencies are all assigned) in admission order (priority.h), seeds
// a wave with the head, and appends further units in order while the
// wave stays within max_size, stopping once it reaches min_size.  A wave
// may end below min_size only when R runs out.  Units inside the wave
// are ordered with Kahn's algorithm, ties by (size, smallest member).
//
// Readiness is tracked with per-unit counters of unassigned
// dependencies, so each iteration costs O(|R| log |R|) rather than a
// scan of every unit.

#ifndef DEPWAVE_SCHEDULE_WAVE_PARTITIONER_H
#define DEPWAVE_SCHEDULE_WAVE_PARTITIONER_H

#include "partition.h"
#include "partition_options.h"
#include "priority.h"

#include <depwave/core/debug_log.h>
#include <depwave/core/errors.h>
#include <depwave/graph/condensation.h>
#include <depwave/graph/dependency_graph.h>
#include <depwave/graph/graph_concepts.h>
#include <depwave/graph/topological_sort.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace depwave::schedule {

/// Assignment state threaded through the phases.
///
/// - assigned[u]: unit u already belongs to a wave
/// - partitions: waves produced so far, numbered 1..size() in order
template<graph::node_key N>
struct partition_state {
    std::vector<bool> assigned{};
    std::size_t assigned_count = 0;
    std::vector<partition<N>> partitions{};

    partition_state() = default;
    explicit partition_state(std::size_t unit_count) : assigned(unit_count, false) {}

    [[nodiscard]] bool done() const noexcept { return assigned_count == assigned.size(); }
};

namespace detail {

[[nodiscard]] inline std::vector<std::vector<std::size_t>>
invert(std::vector<std::vector<std::size_t>> const& deps) {
    std::vector<std::vector<std::size_t>> dependents(deps.size());
    for (std::size_t u = 0; u < deps.size(); ++u) {
        for (auto d : deps[u]) dependents[d].push_back(u);
    }
    return dependents;
}

/// Flatten units (in the given order) into a new wave and mark them.
template<graph::node_key N>
void append_wave(graph::condensation<N> const& c,
                 std::vector<std::size_t> const& ordered_units,
                 partition_type type,
                 std::vector<std::size_t> seed_units,
                 partition_state<N>& state) {
    partition<N> p;
    p.number = state.partitions.size() + 1;
    p.type = type;
    for (auto u : ordered_units) {
        p.nodes.insert(p.nodes.end(), c.units[u].begin(), c.units[u].end());
        state.assigned[u] = true;
        ++state.assigned_count;
    }
    for (auto u : seed_units) {
        p.seed_nodes.insert(p.seed_nodes.end(), c.units[u].begin(), c.units[u].end());
    }
    p.seed_units = std::move(seed_units);
    state.partitions.push_back(std::move(p));
}

template<graph::node_key N>
void require_state_shape(graph::condensation<N> const& c,
                         partition_state<N> const& state,
                         char const* who) {
    if (state.assigned.size() != c.unit_count()) {
        throw std::invalid_argument(std::string(who) + ": state does not match unit count");
    }
}

} // namespace detail

/// Phase 1: category levelling.
///
/// Appends simple_object waves to state.  Units that do not qualify are
/// left for phase 2.
template<graph::node_key N>
void level_simple_categories(graph::dependency_graph<N> const& g,
                             graph::condensation<N> const& c,
                             std::vector<std::string> const& simple_categories,
                             partition_state<N>& state) {
    detail::require_state_shape(c, state, "level_simple_categories");
    constexpr std::size_t no_bucket = std::numeric_limits<std::size_t>::max();
    auto const U = c.unit_count();
    auto const K = simple_categories.size();
    if (U == 0 || K == 0) {
        return;
    }

    auto const deps = c.dependency_lists();
    auto const dependents = detail::invert(deps);

    // Step 1: bucket = latest simple category among the members.
    std::vector<std::size_t> bucket(U, no_bucket);
    for (std::size_t u = 0; u < U; ++u) {
        if (c.units[u].empty()) continue;
        std::size_t latest = 0;
        bool all_simple = true;
        for (auto const& m : c.units[u]) {
            auto const cat = g.category(m);
            std::size_t k = 0;
            while (k < K && simple_categories[k] != cat) ++k;
            if (k == K) {
                all_simple = false;
                break;
            }
            latest = std::max(latest, k);
        }
        if (all_simple) bucket[u] = latest;
    }

    // Step 2: a unit qualifies when it is simple and everything it depends
    // on is assigned or qualifies.  Evaluated dependencies-first.
    std::vector<std::size_t> all_units(U);
    for (std::size_t u = 0; u < U; ++u) all_units[u] = u;
    auto const topo = graph::topological_order(all_units,
        [&deps](std::size_t u) -> std::vector<std::size_t> const& { return deps[u]; });

    std::vector<bool> qualifies(U, false);
    for (auto u : topo.order) {
        if (state.assigned[u] || bucket[u] == no_bucket) continue;
        bool ok = true;
        for (auto d : deps[u]) {
            if (!state.assigned[d] && !qualifies[d]) {
                ok = false;
                break;
            }
        }
        qualifies[u] = ok;
    }

    // Step 3: readiness counters and per-category ready sets.
    std::vector<std::size_t> pending(U, 0);
    std::vector<std::set<std::size_t>> ready(K);
    for (std::size_t u = 0; u < U; ++u) {
        if (!qualifies[u]) continue;
        for (auto d : deps[u]) {
            if (!state.assigned[d]) ++pending[u];
        }
        if (pending[u] == 0) ready[bucket[u]].insert(u);
    }

    // Step 4: sweep categories until a full sweep places nothing.
    bool placed_in_sweep = true;
    while (placed_in_sweep) {
        placed_in_sweep = false;
        for (std::size_t k = 0; k < K; ++k) {
            while (!ready[k].empty()) {
                std::vector<std::size_t> wave(ready[k].begin(), ready[k].end());
                ready[k].clear();

                detail::append_wave(c, wave, partition_type::simple_object, wave, state);
                DEPWAVE_DEBUG_LOG("Creating partition %zu (%s level) with %zu units, %zu objects",
                                  state.partitions.size(), simple_categories[k].c_str(),
                                  wave.size(), state.partitions.back().size());

                for (auto u : wave) {
                    for (auto d : dependents[u]) {
                        if (qualifies[d] && !state.assigned[d] && --pending[d] == 0) {
                            ready[bucket[d]].insert(d);
                        }
                    }
                }
                placed_in_sweep = true;
            }
        }
    }
}

/// Phase 2: priority-ordered greedy bin-packing of the remaining units.
///
/// Throws graph_inconsistency_error if no unit is ready while some remain
/// (the unit graph has a cycle).  Waves appended before that point stay
/// in state.
template<graph::node_key N>
void pack_priority_waves(graph::condensation<N> const& c,
                         std::vector<unit_priority<N>> const& priorities,
                         std::size_t min_size,
                         std::size_t max_size,
                         partition_state<N>& state) {
    detail::require_state_shape(c, state, "pack_priority_waves");
    auto const U = c.unit_count();
    if (priorities.size() != U) {
        throw std::invalid_argument("pack_priority_waves: priorities do not match unit count");
    }
    if (state.done()) {
        return;
    }

    auto const deps = c.dependency_lists();
    auto const dependents = detail::invert(deps);

    auto by_priority = [&priorities](std::size_t a, std::size_t b) {
        return admitted_before(priorities[a], priorities[b]);
    };
    std::set<std::size_t, decltype(by_priority)> ready(by_priority);

    std::vector<std::size_t> pending(U, 0);
    for (std::size_t u = 0; u < U; ++u) {
        if (state.assigned[u]) continue;
        for (auto d : deps[u]) {
            if (!state.assigned[d]) ++pending[u];
        }
        if (pending[u] == 0) ready.insert(u);
    }

    auto by_size_then_member = [&c, &priorities](std::size_t a, std::size_t b) {
        if (c.units[a].size() != c.units[b].size()) {
            return c.units[a].size() < c.units[b].size();
        }
        return priorities[a].min_node < priorities[b].min_node;
    };

    std::vector<bool> in_wave(U, false);

    while (!state.done()) {
        if (ready.empty()) {
            std::vector<std::size_t> stuck;
            for (std::size_t u = 0; u < U; ++u) {
                if (!state.assigned[u]) stuck.push_back(u);
            }
            DEPWAVE_DEBUG_LOG("No ready units but %zu unassigned; unit graph is cyclic",
                              stuck.size());
            throw graph_inconsistency_error(std::move(stuck));
        }

        // Greedy fill in admission order.  The head always goes in, even
        // when it alone exceeds max_size.
        std::vector<std::size_t> wave;
        std::size_t wave_size = 0;
        for (auto u : ready) {
            auto const sz = c.units[u].size();
            if (wave_size > 0 && wave_size + sz > max_size) continue;
            wave.push_back(u);
            in_wave[u] = true;
            wave_size += sz;
            if (wave_size >= min_size) break;
        }

        // Top up towards min_size with whatever still fits.
        if (wave_size < min_size && wave.size() < ready.size()) {
            for (auto u : ready) {
                if (in_wave[u]) continue;
                auto const sz = c.units[u].size();
                if (wave_size + sz <= max_size) {
                    wave.push_back(u);
                    in_wave[u] = true;
                    wave_size += sz;
                    if (wave_size >= min_size) break;
                }
            }
        }

        auto const seed = wave.front();
        auto const topo = graph::topological_order(wave,
            [&deps](std::size_t u) -> std::vector<std::size_t> const& { return deps[u]; },
            by_size_then_member);

        auto const type = priorities[seed].tier == priority_tier::user_prioritized
            ? partition_type::user_prioritized
            : partition_type::regular;

        for (auto u : wave) {
            ready.erase(u);
            in_wave[u] = false;
        }
        detail::append_wave(c, topo.order, type, std::vector<std::size_t>{seed}, state);
        DEPWAVE_DEBUG_LOG("Creating partition %zu with %zu units, %zu objects (seed unit %zu)",
                          state.partitions.size(), wave.size(), wave_size, seed);

        for (auto u : wave) {
            for (auto d : dependents[u]) {
                if (!state.assigned[d] && --pending[d] == 0) {
                    ready.insert(d);
                }
            }
        }
    }
}

/// Run phase 1 (when enabled) and phase 2 into state.
template<graph::node_key N>
void partition_waves(graph::dependency_graph<N> const& g,
                     graph::condensation<N> const& c,
                     std::vector<unit_priority<N>> const& priorities,
                     partition_options const& options,
                     partition_state<N>& state) {
    options.validate();
    if (options.category_waves) {
        level_simple_categories(g, c, options.simple_categories, state);
    }
    pack_priority_waves(c, priorities, options.min_size, options.max_size, state);
}

/// Convenience overload returning the waves directly.
template<graph::node_key N>
[[nodiscard]] std::vector<partition<N>>
partition_waves(graph::dependency_graph<N> const& g,
                graph::condensation<N> const& c,
                std::vector<unit_priority<N>> const& priorities,
                partition_options const& options) {
    partition_state<N> state(c.unit_count());
    partition_waves(g, c, priorities, options, state);
    return std::move(state.partitions);
}

} // namespace depwave::schedule

#endif // DEPWAVE_SCHEDULE_WAVE_PARTITIONER_H
