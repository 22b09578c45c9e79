/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#pragma once
#include "precedence_graph.h"

namespace sercheck {

// Depth-first search for a back edge. The recursion is replaced by an explicit stack of frames,
// each frame holding a node and the position of its next unexplored successor, so deep graphs do
// not exhaust the call stack.
//
// Returns one cycle as a closed path [T1, T2, ..., T1], or nullopt when the graph is acyclic.
// Every node is tried as a root at most once and a visited node is never explored again, so the
// cost is O(V + E).
inline std::optional<std::vector<std::string>> FindCycle(const PrecedenceGraph& graph) {
  using AdjacencyMap = PrecedenceGraph::AdjacencyMap;
  struct Frame {
    AdjacencyMap::const_iterator node;
    std::set<std::string>::const_iterator next;
  };

  const AdjacencyMap& adjacency = graph.adjacency();
  std::set<std::string> visited;
  std::set<std::string> on_stack;
  std::vector<Frame> stack;

  const auto cycle_from = [&stack](const std::string& head) {
    std::vector<std::string> cycle;
    auto it = std::find_if(stack.begin(), stack.end(), [&head](const Frame& frame) { return frame.node->first == head; });
    for (; it != stack.end(); ++it) {
      cycle.emplace_back(it->node->first);
    }
    cycle.emplace_back(head);
    return cycle;
  };

  for (auto root = adjacency.begin(); root != adjacency.end(); ++root) {
    if (visited.count(root->first) != 0) {
      continue;
    }
    visited.insert(root->first);
    on_stack.insert(root->first);
    stack.push_back({root, root->second.begin()});

    while (!stack.empty()) {
      Frame& frame = stack.back();
      if (frame.next == frame.node->second.end()) {
        on_stack.erase(frame.node->first);
        stack.pop_back();
        continue;
      }
      const std::string& successor = *(frame.next++);
      if (on_stack.count(successor) != 0) {
        return cycle_from(successor);
      }
      if (visited.count(successor) != 0) {
        continue;
      }
      visited.insert(successor);
      const auto node = adjacency.find(successor);
      if (node == adjacency.end()) {
        continue;  // a successor without an entry has no outgoing edges
      }
      on_stack.insert(successor);
      stack.push_back({node, node->second.begin()});
    }
  }
  return std::nullopt;
}

inline bool HasCycle(const PrecedenceGraph& graph) { return FindCycle(graph).has_value(); }

// Keep removing nodes whose in-degree is 0. Nodes left at the end are on or behind a cycle.
inline bool HasCycleByTopologicalSort(const PrecedenceGraph& graph) {
  std::map<std::string, uint64_t> in_degrees;
  for (const auto& [trans_id, successors] : graph.adjacency()) {
    in_degrees.try_emplace(trans_id, 0);
    for (const std::string& successor : successors) {
      ++in_degrees[successor];
    }
  }

  std::vector<std::string> free_nodes;
  for (const auto& [trans_id, in_degree] : in_degrees) {
    if (in_degree == 0) {
      free_nodes.emplace_back(trans_id);
    }
  }

  uint64_t removed_num = 0;
  while (!free_nodes.empty()) {
    const std::string trans_id = std::move(free_nodes.back());
    free_nodes.pop_back();
    ++removed_num;
    if (!graph.Contains(trans_id)) {
      continue;
    }
    for (const std::string& successor : graph.Successors(trans_id)) {
      if (--in_degrees[successor] == 0) {
        free_nodes.emplace_back(successor);
      }
    }
  }
  return removed_num != in_degrees.size();
}

}  // namespace sercheck
