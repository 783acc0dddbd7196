// graph/scc.h - Strongly connected components (iterative Tarjan) and cycles
// Part of the depwave deployment-wave library (C++20)
//
// ALGORITHM: Iterative Tarjan's algorithm.
// Complexity: O(V + E) time, O(V) space.
// Determinism: start nodes are taken in ascending key order; members of
// each component are sorted, and components are sorted by their smallest
// member.  The result is therefore independent of insertion order.
//
// The recursion of the textbook algorithm is replaced by an explicit work
// stack of tagged frames:
//   visit          - assign index/lowlink, push onto the Tarjan stack,
//                    become a process frame
//   process        - advance the neighbour cursor; schedule
//                    update_lowlink + visit for an unvisited neighbour,
//                    fold in the index of an on-stack neighbour, or close
//                    the component when the cursor is exhausted
//   update_lowlink - fold a finished child's lowlink into its parent
// Stack depth is bounded by the heap, not by the call stack, so chains of
// millions of nodes are fine.

#ifndef DEPWAVE_GRAPH_SCC_H
#define DEPWAVE_GRAPH_SCC_H

#include "dependency_graph.h"
#include "graph_concepts.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace depwave::graph {

/// Components as sorted member lists, ordered by smallest member.
template<node_key N>
using component_list = std::vector<std::vector<N>>;

namespace detail {

/// Sort members of each component, then components by first member.
template<node_key N>
void canonicalise(component_list<N>& comps) {
    for (auto& c : comps) {
        std::sort(c.begin(), c.end());
    }
    std::sort(comps.begin(), comps.end(),
        [](std::vector<N> const& a, std::vector<N> const& b) {
            return a.front() < b.front();
        });
}

} // namespace detail

/// Strongly connected components via iterative Tarjan.
///
/// Every node appears in exactly one component.  A component with more
/// than one member is a true cycle.
///
/// Example:
/// ```cpp
/// dependency_graph<std::string> g;
/// g.add_edge("A", "B");
/// g.add_edge("B", "A");
/// g.add_edge("B", "C");
/// auto sccs = strongly_connected_components(g);
/// // sccs == {{"A", "B"}, {"C"}}
/// ```
template<node_key N>
[[nodiscard]] component_list<N>
strongly_connected_components(dependency_graph<N> const& g) {
    using index_t = typename dependency_graph<N>::index_type;
    constexpr index_t UNVISITED = dependency_graph<N>::npos;

    component_list<N> result;
    auto const V = g.node_count();
    if (V == 0) {
        return result;
    }

    std::vector<index_t> index_of(V, UNVISITED);    // discovery index
    std::vector<index_t> lowlink(V, 0);              // lowest reachable index
    std::vector<bool> on_stack(V, false);            // on the Tarjan stack
    std::vector<index_t> tarjan_stack;               // awaiting assignment
    index_t next_index = 0;

    enum class frame_kind : std::uint8_t { visit, process, update_lowlink };

    struct frame {
        frame_kind kind;
        index_t node;        // visited/processed node, or parent for update_lowlink
        index_t child;       // child for update_lowlink
        std::size_t cursor;  // next neighbour position for process
    };
    std::vector<frame> work;

    for (auto const start : g.sorted_indices()) {
        if (index_of[start] != UNVISITED) {
            continue;
        }

        work.push_back(frame{frame_kind::visit, start, 0, 0});

        while (!work.empty()) {
            auto& top = work.back();

            switch (top.kind) {
            case frame_kind::visit: {
                auto const u = top.node;
                index_of[u] = next_index;
                lowlink[u] = next_index;
                ++next_index;
                tarjan_stack.push_back(u);
                on_stack[u] = true;
                top.kind = frame_kind::process;
                top.cursor = 0;
                break;
            }

            case frame_kind::process: {
                auto const u = top.node;
                auto const& nbrs = g.out_indices(u);

                if (top.cursor < nbrs.size()) {
                    auto const w = nbrs[top.cursor];
                    ++top.cursor;

                    if (index_of[w] == UNVISITED) {
                        // "Recurse": parent update runs after w completes.
                        // top is invalidated by the pushes below.
                        work.push_back(frame{frame_kind::update_lowlink, u, w, 0});
                        work.push_back(frame{frame_kind::visit, w, 0, 0});
                    } else if (on_stack[w]) {
                        lowlink[u] = std::min(lowlink[u], index_of[w]);
                    }
                    break;
                }

                // Neighbours exhausted.
                work.pop_back();
                if (lowlink[u] == index_of[u]) {
                    std::vector<N> comp;
                    while (true) {
                        auto const w = tarjan_stack.back();
                        tarjan_stack.pop_back();
                        on_stack[w] = false;
                        comp.push_back(g.key_of(w));
                        if (w == u) break;
                    }
                    result.push_back(std::move(comp));
                }
                break;
            }

            case frame_kind::update_lowlink: {
                auto const parent = top.node;
                auto const child = top.child;
                work.pop_back();
                lowlink[parent] = std::min(lowlink[parent], lowlink[child]);
                break;
            }
            }
        }
    }

    detail::canonicalise(result);
    return result;
}

/// Circular dependencies: the strongly connected components with more
/// than one member, in the same order as strongly_connected_components.
template<node_key N>
[[nodiscard]] component_list<N>
find_cycles(dependency_graph<N> const& g) {
    component_list<N> cycles;
    for (auto& comp : strongly_connected_components(g)) {
        if (comp.size() > 1) {
            cycles.push_back(std::move(comp));
        }
    }
    return cycles;
}

} // namespace depwave::graph

#endif // DEPWAVE_GRAPH_SCC_H
