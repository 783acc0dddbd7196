// tests/schedule/test_deployment_plan.cpp - End-to-end planning
//
// Tests: empty input, early failure on bad options and patterns, the
// documented warehouse example, ranking against merged numbering, and
// randomised graphs checked for soundness, merge completeness and
// run-to-run determinism.

#include <depwave/core/errors.h>
#include <depwave/graph/dependency_graph.h>
#include <depwave/schedule/deployment_plan.h>
#include <depwave/schedule/validation.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using namespace depwave::schedule;
using depwave::graph::dependency_graph;
using strings = std::vector<std::string>;

namespace {

dependency_graph<std::string> make_random_graph(unsigned seed, int nodes, int edges) {
    static char const* const categories[] = {
        "TABLE", "VIEW", "FUNCTION", "PROCEDURE", "ETL", "",
    };
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> pick_node(0, nodes - 1);
    std::uniform_int_distribution<int> pick_cat(0, 5);

    auto name = [](int i) {
        std::string s = std::to_string(i);
        return "obj_" + std::string(4 - s.size(), '0') + s;
    };

    dependency_graph<std::string> g;
    for (int i = 0; i < nodes; ++i) {
        g.add_node(name(i));
        std::string const cat = categories[pick_cat(rng)];
        if (!cat.empty()) g.add_node_info(name(i), {.category = cat});
    }
    for (int e = 0; e < edges; ++e) {
        // Mostly downhill edges, with some back edges to form cycles.
        int a = pick_node(rng);
        int b = pick_node(rng);
        if (a < b && (rng() % 8) != 0) std::swap(a, b);
        g.add_edge(name(a), name(b));
    }
    return g;
}

void expect_merge_complete(std::vector<partition<std::string>> const& parts,
                           partition_options const& o) {
    auto blocked = [&](std::size_t small, std::size_t other) {
        auto const& a = parts[small];
        auto const& b = parts[other];
        return a.is_simple_object_wave() || b.is_simple_object_wave()
            || a.size() >= o.min_size || a.type != b.type
            || a.size() + b.size() > o.max_size;
    };
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            EXPECT_TRUE(blocked(i, i - 1)) << "wave " << i + 1 << " could merge backward";
        }
        if (i + 1 < parts.size()) {
            EXPECT_TRUE(blocked(i, i + 1)) << "wave " << i + 1 << " could merge forward";
        }
    }
}

} // anonymous namespace

// =========================================================================
// Pipeline behaviour
// =========================================================================

TEST(DeploymentPlanTest, EmptyGraph) {
    dependency_graph<std::string> g;
    auto const plan = build_deployment_plan(g, partition_options{});
    EXPECT_TRUE(plan.partitions.empty());
    EXPECT_TRUE(plan.matrix.empty());
    EXPECT_TRUE(plan.ranking.empty());
}

TEST(DeploymentPlanTest, BadOptionsFailFirst) {
    dependency_graph<std::string> g;
    g.add_node("A");
    EXPECT_THROW((void)build_deployment_plan(g, partition_options{.min_size = 9, .max_size = 3}),
                 std::invalid_argument);
}

TEST(DeploymentPlanTest, MalformedPatternFailsEvenOnEmptyGraph) {
    dependency_graph<std::string> g;
    EXPECT_THROW((void)build_deployment_plan(g, partition_options{.prioritize_patterns = {"A[*"}}),
                 depwave::malformed_pattern_error);
}

TEST(DeploymentPlanTest, TableThenView) {
    dependency_graph<std::string> g;
    g.add_edge("V_ORDERS", "ORDERS");
    g.add_node_info("ORDERS", {.category = "TABLE"});
    g.add_node_info("V_ORDERS", {.category = "VIEW"});
    auto const plan = build_deployment_plan(g, partition_options{});
    ASSERT_EQ(plan.partitions.size(), 2u);
    EXPECT_EQ(plan.partitions[0].nodes, strings{"ORDERS"});
    EXPECT_EQ(plan.partitions[1].nodes, strings{"V_ORDERS"});
    EXPECT_EQ(plan.partitions[1].stats.external_dependencies, 1u);
    EXPECT_EQ(plan.partitions[1].stats.root_nodes, strings{"V_ORDERS"});
    EXPECT_EQ(plan.matrix.at({2, 1}), 1u);
}

TEST(DeploymentPlanTest, RankingUsesMergedNumbering) {
    dependency_graph<std::string> g;
    g.add_edge("s2", "s1");
    g.add_edge("s3", "s2");
    g.add_edge("s4", "s3");
    g.add_edge("s5", "s4");
    auto const plan = build_deployment_plan(g, partition_options{.min_size = 3, .max_size = 3});
    ASSERT_EQ(plan.partitions.size(), 2u);
    EXPECT_EQ(plan.partitions[0].nodes, (strings{"s1", "s2", "s3"}));
    EXPECT_EQ(plan.partitions[1].nodes, (strings{"s4", "s5"}));

    ASSERT_EQ(plan.ranking.size(), 5u);
    for (auto const& r : plan.ranking) {
        ASSERT_TRUE(r.assigned_partition.has_value());
        auto const expected = r.nodes.front() <= "s3" ? 1u : 2u;
        EXPECT_EQ(*r.assigned_partition, expected) << r.nodes.front();
    }
}

TEST(DeploymentPlanTest, CycleStaysTogetherAcrossMerging) {
    dependency_graph<std::string> g;
    g.add_edge("A", "B");
    g.add_edge("B", "A");
    auto const plan = build_deployment_plan(g, partition_options{});
    ASSERT_EQ(plan.partitions.size(), 1u);
    EXPECT_EQ(plan.partitions[0].nodes, (strings{"A", "B"}));
    EXPECT_EQ(plan.partitions[0].stats.internal_dependencies, 2u);
    EXPECT_TRUE(plan.matrix.empty());
}

// =========================================================================
// Randomised properties
// =========================================================================

TEST(DeploymentPlanPropertyTest, RandomGraphsAreSoundAndMerged) {
    partition_options const options{.min_size = 5, .max_size = 12,
                                    .prioritize_patterns = {"obj_00[0-4]?", "obj_0123"}};
    for (unsigned seed = 1; seed <= 25; ++seed) {
        auto const g = make_random_graph(seed, 300, 450);
        auto const plan = build_deployment_plan(g, options);

        auto const violations = validate_schedule(g, plan.partitions);
        EXPECT_TRUE(violations.empty())
            << "seed " << seed << ": " << describe(violations.front());
        EXPECT_TRUE(validate_matrix(plan.matrix).empty()) << "seed " << seed;

        std::size_t total = 0;
        for (std::size_t i = 0; i < plan.partitions.size(); ++i) {
            auto const& p = plan.partitions[i];
            EXPECT_EQ(p.number, i + 1);
            EXPECT_FALSE(p.nodes.empty());
            if (!p.is_simple_object_wave()) {
                EXPECT_TRUE(p.size() <= options.max_size || p.seed_units.size() == 1)
                    << "seed " << seed << " wave " << p.number;
            }
            total += p.size();
        }
        EXPECT_EQ(total, g.node_count());
        expect_merge_complete(plan.partitions, options);

        std::unordered_map<std::string, std::size_t> number_of;
        for (auto const& p : plan.partitions) {
            for (auto const& n : p.nodes) number_of.emplace(n, p.number);
        }
        for (auto const& r : plan.ranking) {
            ASSERT_TRUE(r.assigned_partition.has_value());
            for (auto const& n : r.nodes) EXPECT_EQ(number_of.at(n), *r.assigned_partition);
        }
    }
}

TEST(DeploymentPlanPropertyTest, RepeatedRunsAreIdentical) {
    partition_options const options{.min_size = 4, .max_size = 9,
                                    .prioritize_patterns = {"obj_01*"}};
    for (unsigned seed = 100; seed < 105; ++seed) {
        auto const g = make_random_graph(seed, 200, 320);
        auto const first = build_deployment_plan(g, options);
        auto const second = build_deployment_plan(g, options);

        ASSERT_EQ(first.partitions.size(), second.partitions.size());
        for (std::size_t i = 0; i < first.partitions.size(); ++i) {
            EXPECT_EQ(first.partitions[i].nodes, second.partitions[i].nodes);
            EXPECT_EQ(first.partitions[i].type, second.partitions[i].type);
            EXPECT_EQ(first.partitions[i].seed_units, second.partitions[i].seed_units);
        }
        EXPECT_EQ(first.matrix, second.matrix);
        ASSERT_EQ(first.ranking.size(), second.ranking.size());
        for (std::size_t i = 0; i < first.ranking.size(); ++i) {
            EXPECT_EQ(first.ranking[i].nodes, second.ranking[i].nodes);
            EXPECT_EQ(first.ranking[i].assigned_partition, second.ranking[i].assigned_partition);
        }
    }
}

TEST(DeploymentPlanPropertyTest, InsertionOrderDoesNotMatter) {
    dependency_graph<std::string> forward;
    dependency_graph<std::string> backward;
    std::vector<std::pair<std::string, std::string>> edges{
        {"P1", "T1"}, {"P1", "T2"}, {"P2", "P1"}, {"V1", "T1"},
        {"P3", "P4"}, {"P4", "P3"}, {"P3", "V1"}, {"E1", "P2"},
    };
    for (auto const& [a, b] : edges) forward.add_edge(a, b);
    for (auto it = edges.rbegin(); it != edges.rend(); ++it) backward.add_edge(it->first, it->second);
    for (auto* g : {&forward, &backward}) {
        g->add_node_info("T1", {.category = "TABLE"});
        g->add_node_info("T2", {.category = "TABLE"});
        g->add_node_info("V1", {.category = "VIEW"});
        g->add_node_info("E1", {.category = "ETL"});
    }
    partition_options const options{.min_size = 2, .max_size = 3};
    auto const a = build_deployment_plan(forward, options);
    auto const b = build_deployment_plan(backward, options);
    ASSERT_EQ(a.partitions.size(), b.partitions.size());
    for (std::size_t i = 0; i < a.partitions.size(); ++i) {
        EXPECT_EQ(a.partitions[i].nodes, b.partitions[i].nodes);
    }
    EXPECT_EQ(a.matrix, b.matrix);
}
