/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#include "../../sercheck/backend/cca/precedence_graph.h"
#include "gtest/gtest.h"

using namespace sercheck;

using DisplayMap = PrecedenceGraph::DisplayMap;

static History MustParse(const std::string& text) {
  std::optional<History> history = History::Parse(text);
  if (!history.has_value()) {
    throw std::invalid_argument("bad history in test: " + text);
  }
  return std::move(*history);
}

TEST(PrecedenceGraphTest, AddEdge) {
  PrecedenceGraph graph;
  graph.AddEdge("T1", "T2");
  graph.AddEdge("T1", "T2");
  graph.AddEdge("T3", "T3");
  EXPECT_TRUE(graph.HasEdge("T1", "T2"));
  EXPECT_FALSE(graph.HasEdge("T2", "T1"));
  EXPECT_TRUE(graph.Contains("T2"));
  EXPECT_FALSE(graph.Contains("T3"));
  EXPECT_EQ(1u, graph.edge_count());
  EXPECT_EQ(2u, graph.node_count());
  EXPECT_THROW(graph.Successors("T3"), std::out_of_range);
}

TEST(PrecedenceGraphTest, NodesInAscendingOrder) {
  PrecedenceGraph graph;
  graph.AddNode("T3");
  graph.AddEdge("T2", "T1");
  EXPECT_EQ((std::vector<std::string>{"T1", "T2", "T3"}), graph.nodes());
  EXPECT_TRUE(PrecedenceGraph().nodes().empty());
}

TEST(PrecedenceGraphTest, Display) {
  PrecedenceGraph graph;
  graph.AddNode("T3");
  graph.AddEdge("T2", "T1");
  graph.AddEdge("T2", "T0");
  const DisplayMap expected{{"T0", {}}, {"T1", {}}, {"T2", {"T0", "T1"}}, {"T3", {}}};
  EXPECT_EQ(expected, graph.ToDisplay());
  std::ostringstream os;
  os << graph;
  EXPECT_EQ("{T0: [], T1: [], T2: [T0, T1], T3: []}", os.str());
}

TEST(BuildPrecedenceGraphTest, ReadBeforeWrite) {
  const History history =
      History::FromTuples({{"T1", "R", "x"}, {"T2", "R", "x"}, {"T1", "W", "x"}, {"T2", "C", ""}, {"T1", "C", ""}});
  const DisplayMap expected{{"T1", {}}, {"T2", {"T1"}}};
  EXPECT_EQ(expected, BuildPrecedenceGraph(history).ToDisplay());
}

TEST(BuildPrecedenceGraphTest, ConflictsBothWays) {
  const History history = History::FromTuples(
      {{"T1", "R", "x"}, {"T2", "W", "x"}, {"T2", "R", "y"}, {"T1", "W", "y"}, {"T1", "C", ""}, {"T2", "C", ""}});
  const PrecedenceGraph graph = BuildPrecedenceGraph(history);
  EXPECT_TRUE(graph.HasEdge("T1", "T2"));
  EXPECT_TRUE(graph.HasEdge("T2", "T1"));
  EXPECT_EQ(2u, graph.edge_count());
}

TEST(BuildPrecedenceGraphTest, AbortedTransactionIsDropped) {
  const History history = History::FromTuples({{"T1", "R", "x"}, {"T2", "W", "x"}, {"T1", "A", ""}, {"T2", "C", ""}});
  const DisplayMap expected{{"T2", {}}};
  EXPECT_EQ(expected, BuildPrecedenceGraph(history).ToDisplay());
}

TEST(BuildPrecedenceGraphTest, AbortedTransactionAddsNoEdgeEitherWay) {
  const PrecedenceGraph graph = BuildPrecedenceGraph(MustParse("W1x R2x W3x W2y R1y A2 C1 C3"));
  EXPECT_FALSE(graph.Contains("2"));
  EXPECT_TRUE(graph.HasEdge("1", "3"));
  EXPECT_EQ(1u, graph.edge_count());
}

TEST(BuildPrecedenceGraphTest, CommitOnlyTransactionIsNode) {
  const DisplayMap expected{{"1", {}}, {"2", {}}};
  EXPECT_EQ(expected, BuildPrecedenceGraph(MustParse("R1x C1 C2")).ToDisplay());
}

TEST(BuildPrecedenceGraphTest, AbortOnlyTransactionIsNotNode) {
  const DisplayMap expected{{"1", {}}};
  EXPECT_EQ(expected, BuildPrecedenceGraph(MustParse("R1x A2 C1")).ToDisplay());
}

TEST(BuildPrecedenceGraphTest, ReadsNeverConflict) {
  const PrecedenceGraph graph = BuildPrecedenceGraph(MustParse("R1x R2x R3x R2x R1x R3y R1y C1 C2 C3"));
  EXPECT_EQ(3u, graph.node_count());
  EXPECT_EQ(0u, graph.edge_count());
}

TEST(BuildPrecedenceGraphTest, DifferentItemsNeverConflict) {
  const PrecedenceGraph graph = BuildPrecedenceGraph(MustParse("W1x W2y W3z R1y"));
  EXPECT_TRUE(graph.HasEdge("2", "1"));
  EXPECT_EQ(1u, graph.edge_count());
}

TEST(BuildPrecedenceGraphTest, SameTransactionNeverConflicts) {
  const PrecedenceGraph graph = BuildPrecedenceGraph(MustParse("W1x R1x W1x C1"));
  EXPECT_EQ(0u, graph.edge_count());
  EXPECT_TRUE(graph.Contains("1"));
}

TEST(BuildPrecedenceGraphTest, RepeatedConflictsCollapse) {
  const PrecedenceGraph graph = BuildPrecedenceGraph(MustParse("W1x W2x W1y R2y W1z W2z C1 C2"));
  const DisplayMap expected{{"1", {"2"}}, {"2", {}}};
  EXPECT_EQ(expected, graph.ToDisplay());
}

TEST(BuildPrecedenceGraphTest, EmptyHistory) {
  EXPECT_EQ(0u, BuildPrecedenceGraph(History()).node_count());
}

TEST(BuildPrecedenceGraphTest, HistoryIsNotModified) {
  const History history = MustParse("R1x W2x A1 C2");
  const History copy = history;
  BuildPrecedenceGraph(history);
  EXPECT_EQ(copy, history);
}

TEST(BuildPrecedenceGraphTest, RejectUnknownOperation) {
  try {
    BuildPrecedenceGraph(History::FromTuples({{"T1", "R", "x"}, {"T2", "X", "x"}}));
    FAIL() << "unknown operation kind accepted";
  } catch (const ScheduleError& e) {
    EXPECT_EQ(ErrorCode::INVALID_OPERATION, e.code());
  }
}

TEST(BuildPrecedenceGraphTest, RejectMissingDataItem) {
  try {
    BuildPrecedenceGraph(History::FromTuples({{"T1", "W", ""}, {"T1", "C", ""}}));
    FAIL() << "write without data item accepted";
  } catch (const ScheduleError& e) {
    EXPECT_EQ(ErrorCode::MISSING_DATA_ITEM, e.code());
  }
}

TEST(BuildPrecedenceGraphTest, RejectMissingTransactionId) {
  try {
    BuildPrecedenceGraph(History::FromTuples({{"", "R", "x"}}));
    FAIL() << "operation without transaction id accepted";
  } catch (const ScheduleError& e) {
    EXPECT_EQ(ErrorCode::MISSING_TRANSACTION_ID, e.code());
  }
}

// A malformed operation is rejected even when it belongs to an aborted transaction.
TEST(BuildPrecedenceGraphTest, RejectMalformedAbortedOperation) {
  EXPECT_THROW(BuildPrecedenceGraph(History::FromTuples({{"T1", "R", ""}, {"T1", "A", ""}})), ScheduleError);
}

TEST(IsConflictTest, Kinds) {
  const Operation r1x(Operation::ReadTypeConstant(), "1", "x");
  const Operation w1x(Operation::WriteTypeConstant(), "1", "x");
  const Operation r2x(Operation::ReadTypeConstant(), "2", "x");
  const Operation w2x(Operation::WriteTypeConstant(), "2", "x");
  const Operation w2y(Operation::WriteTypeConstant(), "2", "y");
  const Operation c2(Operation::CommitTypeConstant(), "2");
  EXPECT_FALSE(IsConflict(r1x, r2x));
  EXPECT_TRUE(IsConflict(r1x, w2x));
  EXPECT_TRUE(IsConflict(w1x, r2x));
  EXPECT_TRUE(IsConflict(w1x, w2x));
  EXPECT_FALSE(IsConflict(w1x, w2y));
  EXPECT_FALSE(IsConflict(w1x, c2));
  EXPECT_FALSE(IsConflict(r1x, w1x));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
