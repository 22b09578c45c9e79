/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#include "../../sercheck/backend/cca/cycle_detector.h"
#include "gtest/gtest.h"

using namespace sercheck;

using Edges = std::vector<std::pair<std::string, std::string>>;

static PrecedenceGraph MakeGraph(const Edges& edges, const std::vector<std::string>& lonely_nodes = {}) {
  PrecedenceGraph graph;
  for (const std::string& node : lonely_nodes) {
    graph.AddNode(node);
  }
  for (const auto& [from, to] : edges) {
    graph.AddEdge(from, to);
  }
  return graph;
}

// The cycle must be closed and every step must be an edge of the graph.
static void ExpectValidCycle(const PrecedenceGraph& graph, const std::vector<std::string>& cycle) {
  ASSERT_GE(cycle.size(), 3u);
  EXPECT_EQ(cycle.front(), cycle.back());
  for (size_t i = 0; i + 1 < cycle.size(); ++i) {
    EXPECT_TRUE(graph.HasEdge(cycle[i], cycle[i + 1])) << cycle[i] << " -> " << cycle[i + 1];
  }
}

struct CycleCase {
  std::string name;
  Edges edges;
  bool has_cycle;
};

class CycleDetectorTest : public ::testing::TestWithParam<CycleCase> {};

TEST_P(CycleDetectorTest, DepthFirst) {
  const CycleCase& param = GetParam();
  const PrecedenceGraph graph = MakeGraph(param.edges);
  const std::optional<std::vector<std::string>> cycle = FindCycle(graph);
  ASSERT_EQ(param.has_cycle, cycle.has_value());
  EXPECT_EQ(param.has_cycle, HasCycle(graph));
  if (cycle.has_value()) {
    ExpectValidCycle(graph, *cycle);
  }
}

TEST_P(CycleDetectorTest, TopologicalSortAgrees) {
  const CycleCase& param = GetParam();
  EXPECT_EQ(param.has_cycle, HasCycleByTopologicalSort(MakeGraph(param.edges)));
}

INSTANTIATE_TEST_SUITE_P(
    Shapes, CycleDetectorTest,
    testing::Values(CycleCase{"Empty", {}, false}, CycleCase{"SingleEdge", {{"1", "2"}}, false},
                    CycleCase{"TwoCycle", {{"1", "2"}, {"2", "1"}}, true},
                    CycleCase{"Chain", {{"1", "2"}, {"2", "3"}, {"3", "4"}}, false},
                    CycleCase{"Diamond", {{"1", "2"}, {"1", "3"}, {"2", "4"}, {"3", "4"}}, false},
                    CycleCase{"ThreeCycle", {{"1", "2"}, {"2", "3"}, {"3", "1"}}, true},
                    CycleCase{"CycleBehindTail", {{"0", "1"}, {"1", "2"}, {"2", "3"}, {"3", "2"}}, true},
                    CycleCase{"CycleInSecondComponent", {{"1", "2"}, {"3", "4"}, {"4", "5"}, {"5", "3"}}, true},
                    // 2 is finished before 3 reaches it again, which is a cross edge
                    CycleCase{"CrossEdge", {{"1", "2"}, {"3", "2"}, {"3", "1"}}, false},
                    CycleCase{"Tree", {{"1", "2"}, {"1", "3"}, {"2", "4"}, {"2", "5"}, {"3", "6"}}, false}),
    [](const testing::TestParamInfo<CycleCase>& info) { return info.param.name; });

TEST(FindCycleTest, LonelyNodes) {
  const PrecedenceGraph graph = MakeGraph({}, {"1", "2", "3"});
  EXPECT_FALSE(HasCycle(graph));
  EXPECT_FALSE(HasCycleByTopologicalSort(graph));
}

TEST(FindCycleTest, WitnessOfTwoCycle) {
  const PrecedenceGraph graph = MakeGraph({{"T1", "T2"}, {"T2", "T1"}});
  const std::optional<std::vector<std::string>> cycle = FindCycle(graph);
  ASSERT_TRUE(cycle.has_value());
  const std::vector<std::string> expected{"T1", "T2", "T1"};
  EXPECT_EQ(expected, *cycle);
}

// The witness starts at the node the back edge points to, not at the DFS root.
TEST(FindCycleTest, WitnessSkipsTail) {
  const PrecedenceGraph graph = MakeGraph({{"a", "b"}, {"b", "c"}, {"c", "d"}, {"d", "b"}});
  const std::optional<std::vector<std::string>> cycle = FindCycle(graph);
  ASSERT_TRUE(cycle.has_value());
  const std::vector<std::string> expected{"b", "c", "d", "b"};
  EXPECT_EQ(expected, *cycle);
}

TEST(FindCycleTest, DeepChain) {
  constexpr int kDepth = 100000;
  Edges edges;
  for (int i = 0; i < kDepth; ++i) {
    edges.emplace_back(std::to_string(i), std::to_string(i + 1));
  }
  PrecedenceGraph graph = MakeGraph(edges);
  EXPECT_FALSE(HasCycle(graph));
  graph.AddEdge(std::to_string(kDepth), "0");
  const std::optional<std::vector<std::string>> cycle = FindCycle(graph);
  ASSERT_TRUE(cycle.has_value());
  EXPECT_EQ(static_cast<size_t>(kDepth + 2), cycle->size());
  EXPECT_TRUE(HasCycleByTopologicalSort(graph));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
