// graph/topological_sort.h - Kahn ordering restricted to a subset
// Part of the depwave deployment-wave library (C++20)
//
// ALGORITHM: Kahn's algorithm (BFS-based) over the subgraph induced by a
// subset of keys.  Dependencies outside the subset are ignored.
// Complexity: O((S + E_S) log S) for a subset of S keys with E_S internal
// edges.
// Determinism: among ready keys the smallest under `less` is emitted
// first, giving a unique order for any strict total order.
//
// Used to order the units inside one wave (ties by unit size, then
// smallest member) and the objects inside a relocated wave (ties by key).

#ifndef DEPWAVE_GRAPH_TOPOLOGICAL_SORT_H
#define DEPWAVE_GRAPH_TOPOLOGICAL_SORT_H

#include <cstddef>
#include <functional>
#include <set>
#include <unordered_map>
#include <vector>

namespace depwave::graph {

/// Result of topological sort.
///
/// - order: keys with dependencies before dependents
/// - is_dag: false if the subset contains a cycle; order then holds only
///   the keys that could be emitted before the cycle blocked progress
template<typename K>
struct topo_result {
    std::vector<K> order{};
    bool is_dag = true;
};

/// Topological order of `subset`, dependencies first.
///
/// Parameters:
/// - subset: keys to order (duplicates are not allowed)
/// - deps_of: deps_of(k) returns an iterable of keys k depends on
/// - less: strict total order used to break ties among ready keys
///
/// Example:
/// ```cpp
/// // c depends on b, b depends on a
/// auto r = topological_order<char>({'c', 'a', 'b'}, deps);
/// // r.order == {'a', 'b', 'c'}
/// ```
template<typename K, typename DepsFn, typename Less = std::less<K>>
[[nodiscard]] topo_result<K>
topological_order(std::vector<K> const& subset, DepsFn&& deps_of, Less less = Less{}) {
    topo_result<K> result;
    if (subset.empty()) {
        return result;
    }

    std::unordered_map<K, std::size_t> position;
    position.reserve(subset.size());
    for (std::size_t i = 0; i < subset.size(); ++i) {
        position.emplace(subset[i], i);
    }

    // Step 1: internal in-degrees (edges point dependent -> dependency, so
    // a key becomes ready when all its in-subset dependencies are emitted).
    std::vector<std::size_t> pending(subset.size(), 0);
    std::vector<std::vector<std::size_t>> dependents(subset.size());
    for (std::size_t i = 0; i < subset.size(); ++i) {
        for (auto const& d : deps_of(subset[i])) {
            auto it = position.find(d);
            if (it == position.end() || it->second == i) continue;
            ++pending[i];
            dependents[it->second].push_back(i);
        }
    }

    // Step 2: ready set ordered by `less`.
    auto by_key = [&](std::size_t a, std::size_t b) {
        return less(subset[a], subset[b]);
    };
    std::set<std::size_t, decltype(by_key)> ready(by_key);
    for (std::size_t i = 0; i < subset.size(); ++i) {
        if (pending[i] == 0) ready.insert(i);
    }

    // Step 3: Kahn's iteration.
    result.order.reserve(subset.size());
    while (!ready.empty()) {
        auto const chosen = *ready.begin();
        ready.erase(ready.begin());
        result.order.push_back(subset[chosen]);

        for (auto dep : dependents[chosen]) {
            if (--pending[dep] == 0) {
                ready.insert(dep);
            }
        }
    }

    result.is_dag = result.order.size() == subset.size();
    return result;
}

} // namespace depwave::graph

#endif // DEPWAVE_GRAPH_TOPOLOGICAL_SORT_H
