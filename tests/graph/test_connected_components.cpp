// tests/graph/test_connected_components.cpp - Weakly connected components
//
// Tests: direction is ignored, isolated nodes, canonical order, deep
// chains.

#include <depwave/graph/connected_components.h>
#include <depwave/graph/dependency_graph.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <vector>

using namespace depwave::graph;
using strings = std::vector<std::string>;

TEST(WeakComponentsTest, EmptyGraph) {
    dependency_graph<std::string> g;
    EXPECT_TRUE(weakly_connected_components(g).empty());
}

TEST(WeakComponentsTest, DirectionIgnored) {
    dependency_graph<std::string> g;
    g.add_edge("A", "B");
    g.add_edge("C", "B");
    g.add_edge("X", "Y");
    auto const wcc = weakly_connected_components(g);
    ASSERT_EQ(wcc.size(), 2u);
    EXPECT_EQ(wcc[0], (strings{"A", "B", "C"}));
    EXPECT_EQ(wcc[1], (strings{"X", "Y"}));
}

TEST(WeakComponentsTest, IsolatedNodesAreSingletons) {
    dependency_graph<std::string> g;
    g.add_node("Q");
    g.add_edge("B", "A");
    g.add_node("P");
    auto const wcc = weakly_connected_components(g);
    ASSERT_EQ(wcc.size(), 3u);
    EXPECT_EQ(wcc[0], (strings{"A", "B"}));
    EXPECT_EQ(wcc[1], strings{"P"});
    EXPECT_EQ(wcc[2], strings{"Q"});
}

TEST(WeakComponentsTest, ReachedOnlyThroughReverseEdges) {
    // Star into a hub: every spoke depends on HUB.
    dependency_graph<std::string> g;
    g.add_edge("S1", "HUB");
    g.add_edge("S2", "HUB");
    g.add_edge("S3", "HUB");
    auto const wcc = weakly_connected_components(g);
    ASSERT_EQ(wcc.size(), 1u);
    EXPECT_EQ(wcc[0], (strings{"HUB", "S1", "S2", "S3"}));
}

TEST(WeakComponentsTest, DeepChain) {
    dependency_graph<int> g;
    constexpr int n = 100'000;
    for (int i = n - 1; i > 0; --i) g.add_edge(i, i - 1);
    auto const wcc = weakly_connected_components(g);
    ASSERT_EQ(wcc.size(), 1u);
    EXPECT_EQ(wcc[0].size(), static_cast<std::size_t>(n));
}
