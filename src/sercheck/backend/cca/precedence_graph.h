/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#pragma once
#include "../util/error.h"
#include "../util/generic.h"

namespace sercheck {

// Directed graph over transaction ids. An edge T1->T2 means T1 must precede T2 in any equivalent
// serial execution.
class PrecedenceGraph {
 public:
  using AdjacencyMap = std::map<std::string, std::set<std::string>>;
  using DisplayMap = std::map<std::string, std::vector<std::string>>;

  PrecedenceGraph() {}

  void AddNode(const std::string& trans_id) { adjacency_.try_emplace(trans_id); }

  // Both ends become nodes. Self edges are dropped.
  void AddEdge(const std::string& pre_trans_id, const std::string& trans_id) {
    if (pre_trans_id == trans_id) {
      return;
    }
    adjacency_[pre_trans_id].insert(trans_id);
    AddNode(trans_id);
  }

  bool Contains(const std::string& trans_id) const { return adjacency_.count(trans_id) != 0; }

  bool HasEdge(const std::string& pre_trans_id, const std::string& trans_id) const {
    const auto it = adjacency_.find(pre_trans_id);
    return it != adjacency_.end() && it->second.count(trans_id) != 0;
  }

  // Throws std::out_of_range for an unknown node.
  const std::set<std::string>& Successors(const std::string& trans_id) const { return adjacency_.at(trans_id); }

  std::vector<std::string> nodes() const {
    std::vector<std::string> nodes;
    nodes.reserve(adjacency_.size());
    for (const auto& [trans_id, _] : adjacency_) {
      nodes.emplace_back(trans_id);
    }
    return nodes;
  }

  size_t node_count() const { return adjacency_.size(); }

  size_t edge_count() const {
    size_t count = 0;
    for (const auto& [_, successors] : adjacency_) {
      count += successors.size();
    }
    return count;
  }

  const AdjacencyMap& adjacency() const { return adjacency_; }

  // Node -> successor list, both in ascending id order, for deterministic rendering.
  DisplayMap ToDisplay() const {
    DisplayMap display;
    for (const auto& [trans_id, successors] : adjacency_) {
      display.emplace(trans_id, std::vector<std::string>(successors.begin(), successors.end()));
    }
    return display;
  }

  bool operator==(const PrecedenceGraph& graph) const { return adjacency_ == graph.adjacency_; }

 private:
  AdjacencyMap adjacency_;
};

// Renders {T1: [], T2: [T1]}
inline std::string GraphToString(const PrecedenceGraph::DisplayMap& display) {
  std::ostringstream os;
  os << '{';
  bool first_node = true;
  for (const auto& [trans_id, successors] : display) {
    os << (first_node ? "" : ", ") << trans_id << ": [";
    for (size_t i = 0; i < successors.size(); ++i) {
      os << (i == 0 ? "" : ", ") << successors[i];
    }
    os << ']';
    first_node = false;
  }
  os << '}';
  return os.str();
}

inline std::ostream& operator<<(std::ostream& os, const PrecedenceGraph& graph) {
  return os << GraphToString(graph.ToDisplay());
}

// Transactions issuing an ABORT anywhere in the history.
inline std::set<std::string> AbortedTransactions(const History& history) {
  std::set<std::string> aborted;
  for (const Operation& operation : history.operations()) {
    if (operation.type() == Operation::Type::ABORT) {
      aborted.insert(operation.trans_id());
    }
  }
  return aborted;
}

// Drop every operation of an aborted transaction except the ABORT itself. Order is preserved.
inline std::vector<Operation> ValidOperations(const History& history, const std::set<std::string>& aborted) {
  std::vector<Operation> valid_operations;
  std::copy_if(history.operations().begin(), history.operations().end(), std::back_inserter(valid_operations),
               [&aborted](const Operation& operation) {
                 return aborted.count(operation.trans_id()) == 0 || operation.type() == Operation::Type::ABORT;
               });
  return valid_operations;
}

// Read-Write, Write-Read and Write-Write on the same item by different transactions.
inline bool IsConflict(const Operation& early, const Operation& later) {
  return early.IsPointDML() && later.IsPointDML() && early.trans_id() != later.trans_id() &&
         !early.item_id().empty() && early.item_id() == later.item_id() &&
         (early.type() == Operation::Type::WRITE || later.type() == Operation::Type::WRITE);
}

// Throws ScheduleError if any operation of the history is malformed.
inline PrecedenceGraph BuildPrecedenceGraph(const History& history) {
  ThrowIfMalformed(history);
  const std::set<std::string> aborted = AbortedTransactions(history);
  const std::vector<Operation> valid_operations = ValidOperations(history, aborted);

  PrecedenceGraph graph;
  for (const Operation& operation : valid_operations) {
    // an abort marker alone does not make its transaction a participant
    if (aborted.count(operation.trans_id()) == 0) {
      graph.AddNode(operation.trans_id());
    }
  }

  for (size_t i = 0, size = valid_operations.size(); i < size; ++i) {
    const Operation& early = valid_operations[i];
    if (early.IsTCL()) {
      continue;
    }
    for (size_t j = i + 1; j < size; ++j) {
      const Operation& later = valid_operations[j];
      if (IsConflict(early, later)) {
        graph.AddEdge(early.trans_id(), later.trans_id());
      }
    }
  }
  return graph;
}

}  // namespace sercheck
