// graph/dependency_graph.h - Directed dependency graph over opaque keys
// Part of the depwave deployment-wave library (C++20)
//
// An edge (caller, referenced) means "caller depends on referenced".
//
// STORAGE:
// Keys are interned to dense uint32 indices in first-seen order.  Forward
// and reverse adjacency are per-index vectors; a hash set of packed
// (caller, referenced) pairs collapses duplicate edges.  Metadata is kept
// in a separate key-indexed map and may be attached to keys that have no
// edges at all.
//
// CANONICALISATION RULES (same as the edge builders):
// 1. Self-edges are dropped, but their endpoint is still registered.
// 2. Duplicate (caller, referenced) pairs are stored once.
//
// DETERMINISM:
// Every query that returns keys returns them in ascending key order, so
// results never depend on insertion order or hash layout.  The index
// accessors expose insertion order and are meant for algorithms that
// sort on their own.

#ifndef DEPWAVE_GRAPH_DEPENDENCY_GRAPH_H
#define DEPWAVE_GRAPH_DEPENDENCY_GRAPH_H

#include "graph_concepts.h"
#include "node_info.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace depwave::graph {

/// Directed graph of object dependencies.
///
/// Example:
/// ```cpp
/// dependency_graph<std::string> g;
/// g.add_edge("V_ORDERS", "ORDERS");      // view depends on table
/// g.add_node_info("ORDERS", {.category = "TABLE"});
/// auto deps = g.direct_dependencies("V_ORDERS");   // {"ORDERS"}
/// auto roots = g.roots();                         // {"V_ORDERS"}
/// ```
template<node_key N>
class dependency_graph {
public:
    using key_type = N;
    using index_type = std::uint32_t;

    static constexpr index_type npos = std::numeric_limits<index_type>::max();

    dependency_graph() = default;

    // =========================================================================
    // Construction
    // =========================================================================

    /// Register a node without edges.  Returns its index (existing index
    /// if already present).
    index_type add_node(N const& key) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            return it->second;
        }
        if (keys_.size() >= static_cast<std::size_t>(npos)) {
            throw std::length_error("dependency_graph::add_node: node count exceeds uint32 range");
        }
        auto const idx = static_cast<index_type>(keys_.size());
        keys_.push_back(key);
        out_.emplace_back();
        in_.emplace_back();
        index_.emplace(key, idx);
        return idx;
    }

    /// Add the dependency caller -> referenced.
    /// Both endpoints are registered; self-edges and repeats are no-ops
    /// beyond registration.
    void add_edge(N const& caller, N const& referenced) {
        auto const u = add_node(caller);
        auto const v = add_node(referenced);
        if (u == v) {
            return;
        }
        auto const packed = (static_cast<std::uint64_t>(u) << 32) | v;
        if (!edges_.insert(packed).second) {
            return;
        }
        out_[u].push_back(v);
        in_[v].push_back(u);
    }

    /// Attach or overwrite metadata.  Does not register the node.
    void add_node_info(N const& key, node_info info) {
        info_.insert_or_assign(key, std::move(info));
    }

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return keys_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edges_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

    [[nodiscard]] bool contains(N const& key) const {
        return index_.find(key) != index_.end();
    }

    [[nodiscard]] bool has_edge(N const& caller, N const& referenced) const {
        auto const u = index_of(caller);
        auto const v = index_of(referenced);
        if (u == npos || v == npos) return false;
        return edges_.count((static_cast<std::uint64_t>(u) << 32) | v) != 0;
    }

    // =========================================================================
    // Metadata
    // =========================================================================

    /// Metadata for key, or nullptr if none was attached.
    [[nodiscard]] node_info const* info(N const& key) const {
        auto it = info_.find(key);
        return it == info_.end() ? nullptr : &it->second;
    }

    /// Category for key, or an empty view if no metadata is attached.
    [[nodiscard]] std::string_view category(N const& key) const {
        auto const* ni = info(key);
        return ni ? std::string_view(ni->category) : std::string_view{};
    }

    // =========================================================================
    // Key-level queries (sorted results)
    // =========================================================================

    /// All nodes in ascending key order.
    [[nodiscard]] std::vector<N> nodes() const {
        std::vector<N> result(keys_);
        std::sort(result.begin(), result.end());
        return result;
    }

    /// Immediate dependencies of key.  Empty if key is absent.
    [[nodiscard]] std::vector<N> direct_dependencies(N const& key) const {
        auto const idx = index_of(key);
        if (idx == npos) return {};
        return sorted_keys(out_[idx]);
    }

    /// Immediate dependents of key.  Empty if key is absent.
    [[nodiscard]] std::vector<N> direct_dependents(N const& key) const {
        auto const idx = index_of(key);
        if (idx == npos) return {};
        return sorted_keys(in_[idx]);
    }

    /// Nodes nothing depends on.
    [[nodiscard]] std::vector<N> roots() const {
        std::vector<N> result;
        for (std::size_t i = 0; i < keys_.size(); ++i) {
            if (in_[i].empty()) result.push_back(keys_[i]);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    /// Nodes that depend on nothing.
    [[nodiscard]] std::vector<N> leaves() const {
        std::vector<N> result;
        for (std::size_t i = 0; i < keys_.size(); ++i) {
            if (out_[i].empty()) result.push_back(keys_[i]);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    // =========================================================================
    // Index-level access (insertion order)
    // =========================================================================

    /// Index of key, or npos if absent.
    [[nodiscard]] index_type index_of(N const& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? npos : it->second;
    }

    [[nodiscard]] N const& key_of(index_type idx) const {
        if (static_cast<std::size_t>(idx) >= keys_.size()) {
            throw std::out_of_range("dependency_graph::key_of: index out of range");
        }
        return keys_[idx];
    }

    [[nodiscard]] std::vector<index_type> const& out_indices(index_type idx) const {
        return out_[idx];
    }

    [[nodiscard]] std::vector<index_type> const& in_indices(index_type idx) const {
        return in_[idx];
    }

    [[nodiscard]] std::size_t out_degree(index_type idx) const { return out_[idx].size(); }
    [[nodiscard]] std::size_t in_degree(index_type idx) const { return in_[idx].size(); }

    /// All indices, ordered by ascending key.
    [[nodiscard]] std::vector<index_type> sorted_indices() const {
        std::vector<index_type> order(keys_.size());
        for (std::size_t i = 0; i < order.size(); ++i) {
            order[i] = static_cast<index_type>(i);
        }
        std::sort(order.begin(), order.end(),
            [this](index_type a, index_type b) { return keys_[a] < keys_[b]; });
        return order;
    }

private:
    [[nodiscard]] std::vector<N> sorted_keys(std::vector<index_type> const& idxs) const {
        std::vector<N> result;
        result.reserve(idxs.size());
        for (auto i : idxs) result.push_back(keys_[i]);
        std::sort(result.begin(), result.end());
        return result;
    }

    std::vector<N> keys_{};
    std::unordered_map<N, index_type> index_{};
    std::vector<std::vector<index_type>> out_{};
    std::vector<std::vector<index_type>> in_{};
    std::unordered_set<std::uint64_t> edges_{};
    std::unordered_map<N, node_info> info_{};
};

} // namespace depwave::graph

#endif // DEPWAVE_GRAPH_DEPENDENCY_GRAPH_H
