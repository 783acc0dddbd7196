// schedule/partition_merger.h - Fold undersized waves into their neighbours
// Part of the depwave deployment-wave library (C++20)
//
// ALGORITHM:
// Repeat until nothing changes:
//   1. Backward pass.  For the first wave i (in order) that is below
//      min_size and not a simple_object wave, try to append it to wave
//      i-1: same type, combined size <= max_size, and every dependency of
//      the moved nodes lies in wave <= i-1 or in the merged set.  On
//      success restart from step 1.
//   2. Forward pass, only if step 1 merged nothing anywhere.  For the
//      first wave i below min_size, try to append wave i+1 to it under
//      the symmetric condition (dependencies of both waves lie in
//      wave <= i or in the merged set).  On success restart from step 1.
// Finally renumber 1..N preserving order.
//
// A merge never moves a node after something that depends on it, so a
// sequence without forward dependencies keeps that property.  The wave
// count never grows and no merged wave exceeds max_size.
//
// COMPLEXITY: O(P * (V + E)) per merge, at most P merges.

#ifndef DEPWAVE_SCHEDULE_PARTITION_MERGER_H
#define DEPWAVE_SCHEDULE_PARTITION_MERGER_H

#include "partition.h"

#include <depwave/core/debug_log.h>
#include <depwave/graph/dependency_graph.h>
#include <depwave/graph/graph_concepts.h>

#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace depwave::schedule {

namespace detail {

/// Position (0-based) of every scheduled node.
template<graph::node_key N>
class wave_positions {
public:
    explicit wave_positions(std::vector<partition<N>> const& waves) {
        for (std::size_t i = 0; i < waves.size(); ++i) assign(waves[i], i);
    }

    void assign(partition<N> const& wave, std::size_t pos) {
        for (auto const& n : wave.nodes) pos_[n] = pos;
    }

    /// Position of n, or nullptr if n is not scheduled.
    [[nodiscard]] std::size_t const* find(N const& n) const {
        auto it = pos_.find(n);
        return it == pos_.end() ? nullptr : &it->second;
    }

private:
    std::unordered_map<N, std::size_t> pos_{};
};

/// True if every dependency of the nodes in `moved` sits at a position
/// <= limit, in one of the two waves being joined, or is unscheduled.
template<graph::node_key N>
[[nodiscard]] bool dependencies_resolve(graph::dependency_graph<N> const& g,
                                        wave_positions<N> const& pos,
                                        std::vector<N const*> const& moved,
                                        std::unordered_set<N> const& merged,
                                        std::size_t limit) {
    using index_t = typename graph::dependency_graph<N>::index_type;
    for (auto const* node : moved) {
        auto const idx = g.index_of(*node);
        if (idx == graph::dependency_graph<N>::npos) continue;
        for (auto v : g.out_indices(idx)) {
            auto const& dep = g.key_of(static_cast<index_t>(v));
            auto const* p = pos.find(dep);
            if (p != nullptr && *p > limit && merged.count(dep) == 0) {
                return false;
            }
        }
    }
    return true;
}

template<graph::node_key N>
[[nodiscard]] bool mergeable(std::vector<partition<N>> const& waves,
                             std::size_t small, std::size_t other,
                             std::size_t min_size, std::size_t max_size) {
    auto const& a = waves[small];
    auto const& b = waves[other];
    return !a.is_simple_object_wave()
        && a.size() < min_size
        && a.type == b.type
        && a.size() + b.size() <= max_size;
}

/// Append waves[from] to waves[into] and erase it.
template<graph::node_key N>
void absorb(std::vector<partition<N>>& waves, std::size_t into, std::size_t from) {
    auto& dst = waves[into];
    auto& src = waves[from];
    dst.nodes.insert(dst.nodes.end(), src.nodes.begin(), src.nodes.end());
    dst.seed_units.insert(dst.seed_units.end(), src.seed_units.begin(), src.seed_units.end());
    dst.seed_nodes.insert(dst.seed_nodes.end(), src.seed_nodes.begin(), src.seed_nodes.end());
    waves.erase(waves.begin() + static_cast<std::ptrdiff_t>(from));
}

template<graph::node_key N>
[[nodiscard]] bool try_backward_merge(graph::dependency_graph<N> const& g,
                                      std::vector<partition<N>>& waves,
                                      wave_positions<N>& pos,
                                      std::size_t min_size, std::size_t max_size) {
    for (std::size_t i = 1; i < waves.size(); ++i) {
        if (!mergeable(waves, i, i - 1, min_size, max_size)) continue;

        std::unordered_set<N> merged(waves[i].nodes.begin(), waves[i].nodes.end());
        merged.insert(waves[i - 1].nodes.begin(), waves[i - 1].nodes.end());
        std::vector<N const*> moved;
        moved.reserve(waves[i].size());
        for (auto const& n : waves[i].nodes) moved.push_back(&n);
        if (!dependencies_resolve(g, pos, moved, merged, i - 1)) continue;

        DEPWAVE_DEBUG_LOG("Merging partition %zu (%zu objects) into partition %zu (%zu objects)",
                          waves[i].number, waves[i].size(),
                          waves[i - 1].number, waves[i - 1].size());
        absorb(waves, i - 1, i);
        pos.assign(waves[i - 1], i - 1);
        for (std::size_t j = i; j < waves.size(); ++j) pos.assign(waves[j], j);
        return true;
    }
    return false;
}

template<graph::node_key N>
[[nodiscard]] bool try_forward_merge(graph::dependency_graph<N> const& g,
                                     std::vector<partition<N>>& waves,
                                     wave_positions<N>& pos,
                                     std::size_t min_size, std::size_t max_size) {
    for (std::size_t i = 0; i + 1 < waves.size(); ++i) {
        if (!mergeable(waves, i, i + 1, min_size, max_size)) continue;
        if (waves[i + 1].is_simple_object_wave()) continue;

        std::unordered_set<N> merged(waves[i].nodes.begin(), waves[i].nodes.end());
        merged.insert(waves[i + 1].nodes.begin(), waves[i + 1].nodes.end());
        std::vector<N const*> moved;
        moved.reserve(waves[i].size() + waves[i + 1].size());
        for (auto const& n : waves[i].nodes) moved.push_back(&n);
        for (auto const& n : waves[i + 1].nodes) moved.push_back(&n);
        if (!dependencies_resolve(g, pos, moved, merged, i)) continue;

        DEPWAVE_DEBUG_LOG("Merging partition %zu (%zu objects) into partition %zu (%zu objects)",
                          waves[i + 1].number, waves[i + 1].size(),
                          waves[i].number, waves[i].size());
        absorb(waves, i, i + 1);
        for (std::size_t j = i; j < waves.size(); ++j) pos.assign(waves[j], j);
        return true;
    }
    return false;
}

} // namespace detail

/// Renumber waves 1..N in their current order.
template<graph::node_key N>
void renumber(std::vector<partition<N>>& waves) {
    for (std::size_t i = 0; i < waves.size(); ++i) {
        waves[i].number = i + 1;
    }
}

/// Merge undersized waves in place, then renumber.
///
/// simple_object waves are never merged, in either direction.  Merged
/// waves accumulate the seed units and seed nodes of both sides.
///
/// Example:
/// ```cpp
/// // waves of sizes {30, 10} (both regular), min 40, max 80
/// merge_small_partitions(g, waves, 40, 80);
/// // waves.size() == 1, waves[0].size() == 40
/// ```
template<graph::node_key N>
void merge_small_partitions(graph::dependency_graph<N> const& g,
                            std::vector<partition<N>>& waves,
                            std::size_t min_size,
                            std::size_t max_size) {
    if (waves.empty()) {
        return;
    }
    detail::wave_positions<N> pos(waves);

    bool changed = true;
    while (changed) {
        changed = detail::try_backward_merge(g, waves, pos, min_size, max_size);
        if (!changed) {
            changed = detail::try_forward_merge(g, waves, pos, min_size, max_size);
        }
    }
    renumber(waves);
}

} // namespace depwave::schedule

#endif // DEPWAVE_SCHEDULE_PARTITION_MERGER_H
