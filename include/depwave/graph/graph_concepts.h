// graph/graph_concepts.h - Node key concept and naming
// Part of the depwave deployment-wave library (C++20)
//
// Node identities are opaque to every algorithm.  The only operations
// required are equality, a total order (for deterministic sorting) and a
// hash (for lookup).  Metadata lives beside the graph in node_info, never
// inside the key.
//
// node_name() maps a key to the text that prioritisation patterns are
// matched against.

#ifndef DEPWAVE_GRAPH_CONCEPTS_H
#define DEPWAVE_GRAPH_CONCEPTS_H

#include <concepts>
#include <cstddef>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace depwave::graph {

/// Requirements on a node identifier.
///
/// Satisfied by std::string, integral types, and any regular user type
/// that is totally ordered and has a std::hash specialisation.
template<typename N>
concept node_key =
    std::totally_ordered<N> &&
    std::semiregular<N> &&
    requires(N const& n) {
        { std::hash<N>{}(n) } -> std::convertible_to<std::size_t>;
    };

/// Text form of a node key, used for pattern matching and diagnostics.
template<node_key N>
[[nodiscard]] std::string node_name(N const& n) {
    if constexpr (std::is_convertible_v<N const&, std::string_view>) {
        return std::string(std::string_view(n));
    } else if constexpr (std::is_arithmetic_v<N>) {
        return std::to_string(n);
    } else {
        std::ostringstream os;
        os << n;
        return os.str();
    }
}

} // namespace depwave::graph

#endif // DEPWAVE_GRAPH_CONCEPTS_H
