// tests/schedule/test_partition_analyzer.cpp - Wave statistics and matrix
//
// Tests: global root and leaf status, internal vs external edges with
// per-partition breakdown, category histogram (same buckets as the
// structure summary), sparse matrix entries.

#include <depwave/graph/dependency_graph.h>
#include <depwave/graph/graph_summary.h>
#include <depwave/schedule/partition.h>
#include <depwave/schedule/partition_analyzer.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <vector>

using namespace depwave::schedule;
using depwave::graph::dependency_graph;
using strings = std::vector<std::string>;

namespace {

// Waves: 1 = {C, D}, 2 = {B}, 3 = {A, E}
// A -> B -> C, A -> D, E -> D, E -> A
struct fixture {
    dependency_graph<std::string> g;
    std::vector<partition<std::string>> waves;

    fixture() {
        g.add_edge("A", "B");
        g.add_edge("B", "C");
        g.add_edge("A", "D");
        g.add_edge("E", "D");
        g.add_edge("E", "A");
        g.add_node_info("C", {.category = "TABLE"});
        g.add_node_info("D", {.category = "TABLE"});
        g.add_node_info("A", {.category = "PROCEDURE"});

        waves.resize(3);
        waves[0].number = 1;
        waves[0].nodes = {"C", "D"};
        waves[1].number = 2;
        waves[1].nodes = {"B"};
        waves[2].number = 3;
        waves[2].nodes = {"A", "E"};
    }
};

} // anonymous namespace

TEST(PartitionAnalyzerTest, RootsAndLeavesAreGlobal) {
    fixture f;
    analyze_partitions(f.g, f.waves);
    EXPECT_EQ(f.waves[0].stats.leaf_nodes, (strings{"C", "D"}));
    EXPECT_TRUE(f.waves[0].stats.root_nodes.empty());
    EXPECT_TRUE(f.waves[1].stats.root_nodes.empty());
    EXPECT_TRUE(f.waves[1].stats.leaf_nodes.empty());
    // A has a dependent (E), so only E is a root even though A has no
    // dependents outside wave 3.
    EXPECT_EQ(f.waves[2].stats.root_nodes, strings{"E"});
}

TEST(PartitionAnalyzerTest, InternalAndExternalEdges) {
    fixture f;
    analyze_partitions(f.g, f.waves);

    auto const& w1 = f.waves[0].stats;
    EXPECT_EQ(w1.internal_dependencies, 0u);
    EXPECT_EQ(w1.external_dependencies, 0u);

    auto const& w2 = f.waves[1].stats;
    EXPECT_EQ(w2.external_dependencies, 1u);
    EXPECT_EQ(w2.dependencies_by_partition.at(1), 1u);

    auto const& w3 = f.waves[2].stats;
    EXPECT_EQ(w3.internal_dependencies, 1u);       // E -> A
    EXPECT_EQ(w3.external_dependencies, 3u);       // A->B, A->D, E->D
    EXPECT_EQ(w3.dependencies_by_partition.at(1), 2u);
    EXPECT_EQ(w3.dependencies_by_partition.at(2), 1u);
}

TEST(PartitionAnalyzerTest, CategoryHistogram) {
    fixture f;
    analyze_partitions(f.g, f.waves);
    EXPECT_EQ(f.waves[0].stats.category_counts.at("TABLE"), 2u);
    EXPECT_EQ(f.waves[1].stats.category_counts.at("Unknown"), 1u);
    EXPECT_EQ(f.waves[2].stats.category_counts.at("PROCEDURE"), 1u);
    EXPECT_EQ(f.waves[2].stats.category_counts.at("Unknown"), 1u);
}

TEST(PartitionAnalyzerTest, ReanalysisReplacesStats) {
    fixture f;
    analyze_partitions(f.g, f.waves);
    analyze_partitions(f.g, f.waves);
    EXPECT_EQ(f.waves[2].stats.external_dependencies, 3u);
    EXPECT_EQ(f.waves[0].stats.category_counts.at("TABLE"), 2u);
}

TEST(DependencyMatrixTest, LaterToEarlierCounts) {
    fixture f;
    auto const m = build_dependency_matrix(f.g, f.waves);
    dependency_matrix const expected{
        {{2, 1}, 1},   // B -> C
        {{3, 1}, 2},   // A -> D, E -> D
        {{3, 2}, 1},   // A -> B
    };
    EXPECT_EQ(m, expected);
}

TEST(DependencyMatrixTest, EmptyAndSingleWave) {
    dependency_graph<std::string> g;
    g.add_edge("A", "B");
    std::vector<partition<std::string>> none;
    EXPECT_TRUE(build_dependency_matrix(g, none).empty());

    std::vector<partition<std::string>> one(1);
    one[0].number = 1;
    one[0].nodes = {"B", "A"};
    EXPECT_TRUE(build_dependency_matrix(g, one).empty());
}

TEST(PartitionAnalyzerTest, EmptyCategoryMatchesStructureSummary) {
    dependency_graph<std::string> g;
    g.add_node("BLANK");
    g.add_node("BARE");
    g.add_node_info("BLANK", {.category = ""});
    std::vector<partition<std::string>> waves(1);
    waves[0].number = 1;
    waves[0].nodes = {"BARE", "BLANK"};

    analyze_partitions(g, waves);
    auto const structure = depwave::graph::analyze_structure(g);
    EXPECT_EQ(waves[0].stats.category_counts, structure.category_counts);
    EXPECT_EQ(waves[0].stats.category_counts.at("Unknown"), 2u);
}
