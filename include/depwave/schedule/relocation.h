// schedule/relocation.h - Manual relocation of objects between waves
// Part of the depwave deployment-wave library (C++20)
//
// Works on a plain node -> wave assignment so a schedule can be edited
// after the fact.  Each request pins one node to a target wave and the
// minimum set of other nodes is dragged along so the schedule stays
// sound:
//   moving earlier  every dependency that would end up in a later wave
//                   is pulled down to the node's new wave, transitively
//   moving later    every dependent that would end up in an earlier wave
//                   is pushed up to the node's new wave, transitively
// Nodes not reached stay where they are.  Requests are applied in order.
// Emptied waves are removed afterwards by compacting the numbering to
// 1..K, preserving relative order.
//
// COMPLEXITY: O(V + E) per request, plus O(V log V) for compaction.

#ifndef DEPWAVE_SCHEDULE_RELOCATION_H
#define DEPWAVE_SCHEDULE_RELOCATION_H

#include "partition.h"

#include <depwave/core/debug_log.h>
#include <depwave/graph/dependency_graph.h>
#include <depwave/graph/graph_concepts.h>
#include <depwave/graph/topological_sort.h>

#include <algorithm>
#include <cstddef>
#include <deque>
#include <map>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>

namespace depwave::schedule {

/// Node -> 1-based wave number.
template<graph::node_key N>
using wave_assignment = std::map<N, std::size_t>;

/// Pin node to target_wave (1-based).
template<graph::node_key N>
struct relocation_request {
    N node{};
    std::size_t target_wave = 0;
};

/// A node changed wave.
template<graph::node_key N>
struct relocation_move {
    N node{};
    std::size_t from = 0;
    std::size_t to = 0;
};

/// Result of relocate().
///
/// - assignment: compacted assignment
/// - moves: every individual move in application order, in wave numbers
///   before compaction
/// - changes: per node whose wave differs between the input and the
///   compacted result, sorted by node
template<graph::node_key N>
struct relocation_result {
    wave_assignment<N> assignment{};
    std::vector<relocation_move<N>> moves{};
    std::vector<relocation_move<N>> changes{};
};

namespace detail {

enum class relocation_direction { earlier, later };

/// BFS from start: a reached node that violates `bound` (an upper bound
/// when moving earlier, a lower bound when moving later) is clamped to it,
/// and its neighbours on the constrained side that are now out of order
/// are enqueued with its new wave.  A node may be reached again with a
/// tighter bound; waves only move in one direction, so this terminates.
template<graph::node_key N>
void drag_along(graph::dependency_graph<N> const& g,
                N const& start,
                std::size_t target,
                relocation_direction dir,
                wave_assignment<N>& assignment,
                std::vector<relocation_move<N>>& moves) {
    using graph_t = graph::dependency_graph<N>;
    std::deque<std::pair<N, std::size_t>> queue;
    queue.emplace_back(start, target);

    while (!queue.empty()) {
        auto [node, bound] = std::move(queue.front());
        queue.pop_front();

        auto it = assignment.find(node);
        if (it == assignment.end()) continue;

        bool const violates = dir == relocation_direction::earlier
            ? it->second > bound
            : it->second < bound;
        if (!violates) continue;
        moves.push_back({node, it->second, bound});
        it->second = bound;

        auto const idx = g.index_of(node);
        if (idx == graph_t::npos) continue;
        auto const& next = dir == relocation_direction::earlier
            ? g.out_indices(idx)
            : g.in_indices(idx);
        for (auto v : next) {
            auto const& neighbour = g.key_of(v);
            auto nit = assignment.find(neighbour);
            if (nit == assignment.end()) continue;
            bool const out_of_order = dir == relocation_direction::earlier
                ? nit->second > bound
                : nit->second < bound;
            if (out_of_order) {
                queue.emplace_back(neighbour, bound);
            }
        }
    }
}

} // namespace detail

/// Renumber waves to 1..K preserving relative order.
template<graph::node_key N>
[[nodiscard]] wave_assignment<N> compact_waves(wave_assignment<N> const& assignment) {
    std::vector<std::size_t> waves;
    waves.reserve(assignment.size());
    for (auto const& [node, wave] : assignment) waves.push_back(wave);
    std::sort(waves.begin(), waves.end());
    waves.erase(std::unique(waves.begin(), waves.end()), waves.end());

    wave_assignment<N> result;
    for (auto const& [node, wave] : assignment) {
        auto const pos = std::lower_bound(waves.begin(), waves.end(), wave) - waves.begin();
        result.emplace(node, static_cast<std::size_t>(pos) + 1);
    }
    return result;
}

/// Apply relocation requests to an assignment.
///
/// Requests naming a node absent from the assignment are ignored.
/// Throws std::invalid_argument for a target wave of 0.
///
/// Example:
/// ```cpp
/// // A -> B, assignment {B:1, A:2}
/// auto r = relocate(g, assignment, {{"B", 3}});
/// // B moves to 3 and pushes A to 3; compacted: {A:1, B:1}
/// ```
template<graph::node_key N>
[[nodiscard]] relocation_result<N>
relocate(graph::dependency_graph<N> const& g,
         wave_assignment<N> const& assignment,
         std::vector<relocation_request<N>> const& requests) {
    for (auto const& r : requests) {
        if (r.target_wave == 0) {
            throw std::invalid_argument("relocate: target wave must be >= 1");
        }
    }

    relocation_result<N> result;
    auto working = assignment;
    for (auto const& r : requests) {
        auto it = working.find(r.node);
        if (it == working.end()) {
            DEPWAVE_DEBUG_LOG("Ignoring relocation of unknown object %s",
                              graph::node_name(r.node).c_str());
            continue;
        }
        if (r.target_wave < it->second) {
            detail::drag_along(g, r.node, r.target_wave, detail::relocation_direction::earlier,
                               working, result.moves);
        } else if (r.target_wave > it->second) {
            detail::drag_along(g, r.node, r.target_wave, detail::relocation_direction::later,
                               working, result.moves);
        }
    }

    result.assignment = compact_waves(working);
    for (auto const& [node, wave] : result.assignment) {
        auto const before = assignment.at(node);
        if (before != wave) {
            result.changes.push_back({node, before, wave});
        }
    }
    return result;
}

/// Node -> partition number for a partition sequence.
template<graph::node_key N>
[[nodiscard]] wave_assignment<N> assignment_of(std::vector<partition<N>> const& partitions) {
    wave_assignment<N> result;
    for (auto const& p : partitions) {
        for (auto const& n : p.nodes) result.emplace(n, p.number);
    }
    return result;
}

/// Rebuild a partition sequence from an assignment.
///
/// One partition per distinct wave, numbered 1..K in ascending wave
/// order, all of type regular.  Nodes inside a wave are ordered
/// dependencies first, ties by key; members of a cycle that blocks the
/// ordering follow in key order.
template<graph::node_key N>
[[nodiscard]] std::vector<partition<N>>
partitions_from_assignment(graph::dependency_graph<N> const& g,
                           wave_assignment<N> const& assignment) {
    std::map<std::size_t, std::vector<N>> by_wave;
    for (auto const& [node, wave] : assignment) by_wave[wave].push_back(node);

    std::vector<partition<N>> result;
    result.reserve(by_wave.size());
    for (auto& [wave, members] : by_wave) {
        auto topo = graph::topological_order(members,
            [&g](N const& n) { return g.direct_dependencies(n); });
        if (!topo.is_dag) {
            std::unordered_set<N> placed(topo.order.begin(), topo.order.end());
            for (auto const& n : members) {
                if (placed.count(n) == 0) topo.order.push_back(n);
            }
        }
        partition<N> p;
        p.number = result.size() + 1;
        p.type = partition_type::regular;
        p.nodes = std::move(topo.order);
        result.push_back(std::move(p));
    }
    return result;
}

} // namespace depwave::schedule

#endif // DEPWAVE_SCHEDULE_RELOCATION_H
