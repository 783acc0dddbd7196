// schedule/partition.h - Deployment wave (partition) data model
// Part of the depwave deployment-wave library (C++20)
//
// A partition is an ordered list of objects deployed together.  Nodes
// are stored in deployment order: within a wave, units appear after the
// units they depend on, and the members of one unit are contiguous.
//
// Statistics (partition_stats) are filled by partition_analyzer.h once
// the sequence is final; the partitioner and merger leave them empty.

#ifndef DEPWAVE_SCHEDULE_PARTITION_H
#define DEPWAVE_SCHEDULE_PARTITION_H

#include <depwave/graph/graph_concepts.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace depwave::schedule {

/// How a wave was formed.
enum class partition_type : std::uint8_t {
    simple_object,      ///< phase 1 category level, uncapped, never merged
    user_prioritized,   ///< phase 2, seed unit matched a priority pattern
    regular,            ///< phase 2, everything else
};

[[nodiscard]] constexpr std::string_view to_string(partition_type t) noexcept {
    switch (t) {
    case partition_type::simple_object:    return "simple_object";
    case partition_type::user_prioritized: return "user_prioritized";
    case partition_type::regular:          return "regular";
    }
    return "unknown";
}

/// Derived per-partition statistics.
///
/// - root_nodes / leaf_nodes: members that are global roots (nothing
///   depends on them) / global leaves (they depend on nothing), sorted
/// - internal_dependencies: edges with both endpoints in this partition
/// - external_dependencies: edges from this partition to another one
/// - dependencies_by_partition: external edge count per target partition
/// - category_counts: member count per category ("Unknown" if absent)
template<graph::node_key N>
struct partition_stats {
    std::vector<N> root_nodes{};
    std::vector<N> leaf_nodes{};
    std::size_t internal_dependencies = 0;
    std::size_t external_dependencies = 0;
    std::map<std::size_t, std::size_t> dependencies_by_partition{};
    std::map<std::string, std::size_t> category_counts{};
};

/// One deployment wave.
///
/// - number: 1-based position in the final sequence
/// - nodes: members in deployment order
/// - seed_units: unit(s) that opened the wave (all units for phase 1
///   waves; accumulates across merges)
/// - seed_nodes: members of the seed units
template<graph::node_key N>
struct partition {
    std::size_t number = 0;
    std::vector<N> nodes{};
    partition_type type = partition_type::regular;
    std::vector<std::size_t> seed_units{};
    std::vector<N> seed_nodes{};
    partition_stats<N> stats{};

    [[nodiscard]] std::size_t size() const noexcept { return nodes.size(); }
    [[nodiscard]] bool is_simple_object_wave() const noexcept {
        return type == partition_type::simple_object;
    }
};

/// Sparse inter-partition matrix: (later, earlier) -> edge count.
/// Only non-zero entries are present.
using dependency_matrix = std::map<std::pair<std::size_t, std::size_t>, std::size_t>;

} // namespace depwave::schedule

#endif // DEPWAVE_SCHEDULE_PARTITION_H
