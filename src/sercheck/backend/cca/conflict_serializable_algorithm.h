/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */

#ifdef ENUM_BEGIN
#ifdef ENUM_MEMBER
#ifdef ENUM_END

ENUM_BEGIN(CycleCheck)
ENUM_MEMBER(CycleCheck, DEPTH_FIRST)
ENUM_MEMBER(CycleCheck, TOPOLOGICAL)
ENUM_END(CycleCheck)

#endif
#endif
#endif

#ifndef SERCHECK_CCA_CONFLICT_SERIALIZABLE_ALGORITHM_H
#define SERCHECK_CCA_CONFLICT_SERIALIZABLE_ALGORITHM_H

#include "algorithm.h"
#include "cycle_detector.h"
#include "ending_validator.h"
#include "precedence_graph.h"

namespace sercheck {

#define ENUM_FILE "../cca/conflict_serializable_algorithm.h"
#include "../util/extend_enum.h"

struct SerializabilityResult {
  bool is_serializable = true;
  std::vector<std::string> warnings;
  PrecedenceGraph::DisplayMap graph;
  std::optional<std::vector<std::string>> cycle;  // set when is_serializable is false
};

inline std::string CycleToString(const std::vector<std::string>& cycle) {
  std::ostringstream os;
  for (size_t i = 0; i < cycle.size(); ++i) {
    os << (i == 0 ? "" : " -> ") << cycle[i];
  }
  return os.str();
}

// Ending warnings are computed on the raw history and never change the verdict. Throws
// ScheduleError on a malformed history.
inline SerializabilityResult CheckConflictSerializability(const History& history) {
  SerializabilityResult result;
  result.warnings = ValidateTransactionEndings(history);
  const PrecedenceGraph graph = BuildPrecedenceGraph(history);
  result.cycle = FindCycle(graph);
  result.is_serializable = !result.cycle.has_value();
  result.graph = graph.ToDisplay();
  return result;
}

template <CycleCheck CHECK>
class ConflictSerializableAlgorithm : public HistoryAlgorithm {
 public:
  ConflictSerializableAlgorithm()
      : HistoryAlgorithm(CHECK == CycleCheck::DEPTH_FIRST ? "Conflict Serializable"
                                                          : "Conflict Serializable (Topological)"),
        serializable_count_(0),
        non_serializable_count_(0) {}
  virtual ~ConflictSerializableAlgorithm() {}

  virtual bool Check(const History& history, std::ostream* const os = nullptr) const override {
    SerializabilityResult result;
    if constexpr (CHECK == CycleCheck::DEPTH_FIRST) {
      result = CheckConflictSerializability(history);
    } else {
      result.warnings = ValidateTransactionEndings(history);
      const PrecedenceGraph graph = BuildPrecedenceGraph(history);
      result.is_serializable = !HasCycleByTopologicalSort(graph);
      result.graph = graph.ToDisplay();
    }

    TRY_LOG(os) << "graph: " << GraphToString(result.graph);
    if (result.cycle.has_value()) {
      TRY_LOG(os) << std::endl << "cycle: " << CycleToString(*result.cycle);
    }
    for (const std::string& warning : result.warnings) {
      TRY_LOG(os) << std::endl << warning;
    }

    ++(result.is_serializable ? serializable_count_ : non_serializable_count_);
    return result.is_serializable;
  }

  virtual void Statistics() const override {
    const uint64_t serializable = serializable_count_.load();
    const uint64_t non_serializable = non_serializable_count_.load();
    std::cout << "=== " << name() << " ===" << std::endl;
    std::cout << std::setw(30) << "Serializable: " << std::setw(8) << serializable << " / "
              << serializable + non_serializable << std::endl;
    std::cout << std::setw(30) << "Not Serializable: " << std::setw(8) << non_serializable << " / "
              << serializable + non_serializable << std::endl;
  }

 private:
  mutable std::atomic<uint64_t> serializable_count_;
  mutable std::atomic<uint64_t> non_serializable_count_;
};

}  // namespace sercheck

#endif
