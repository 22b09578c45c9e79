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

struct TransactionEndState {
  bool has_commit = false;
  bool has_abort = false;
  bool has_other_ops = false;
};

// Warn about transactions that both commit and abort, and about transactions that read or write
// but never terminate. Warnings follow the order in which transactions first appear. The raw
// history is scanned, aborted transactions included.
inline std::vector<std::string> ValidateTransactionEndings(const History& history) {
  ThrowIfMalformed(history);

  std::vector<std::string> trans_order;
  std::unordered_map<std::string, TransactionEndState> states;
  for (const Operation& operation : history.operations()) {
    const auto [it, inserted] = states.try_emplace(operation.trans_id());
    if (inserted) {
      trans_order.emplace_back(operation.trans_id());
    }
    TransactionEndState& state = it->second;
    if (operation.type() == Operation::Type::COMMIT) {
      state.has_commit = true;
    } else if (operation.type() == Operation::Type::ABORT) {
      state.has_abort = true;
    } else {
      state.has_other_ops = true;
    }
  }

  std::vector<std::string> warnings;
  for (const std::string& trans_id : trans_order) {
    const TransactionEndState& state = states.at(trans_id);
    if (state.has_commit && state.has_abort) {
      warnings.emplace_back("Warning: transaction " + trans_id + " has both Commit and Abort");
    } else if (!state.has_commit && !state.has_abort && state.has_other_ops) {
      warnings.emplace_back("Warning: transaction " + trans_id + " has neither Commit nor Abort");
    }
  }
  return warnings;
}

}  // namespace sercheck
