// graph/node_info.h - Per-object metadata attached to graph nodes
// Part of the depwave deployment-wave library (C++20)
//
// Metadata is supplied by the upstream loader and only consulted by the
// scheduling heuristics (category levelling, ETL tier, histograms).  The
// graph algorithms never look at it.

#ifndef DEPWAVE_GRAPH_NODE_INFO_H
#define DEPWAVE_GRAPH_NODE_INFO_H

#include <optional>
#include <string>
#include <string_view>

namespace depwave::graph {

/// Metadata for one database or ETL object.
///
/// - category: object class as reported upstream ("TABLE", "VIEW",
///   "PROCEDURE", "ETL", ...)
/// - technology: source technology, if known
/// - conversion_status: upstream conversion state, if known
struct node_info {
    std::string category{};
    std::optional<std::string> technology{};
    std::optional<std::string> conversion_status{};

    friend bool operator==(node_info const&, node_info const&) = default;
};

/// Histogram label for a category.  Objects with no metadata and objects
/// whose metadata carries an empty category both count as "Unknown".
[[nodiscard]] inline std::string category_label(std::string_view category) {
    return category.empty() ? std::string("Unknown") : std::string(category);
}

} // namespace depwave::graph

#endif // DEPWAVE_GRAPH_NODE_INFO_H
