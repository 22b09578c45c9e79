/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#pragma once
#include <random>

#include "../util/generic.h"

namespace sercheck {

class HistoryGenerator {
 public:
  HistoryGenerator() {}
  virtual ~HistoryGenerator() {}
  virtual void DeliverHistories(const std::function<void(History &&)> &handle) const = 0;
};

// One history per line. Empty lines and lines starting with '#' are skipped, so are lines that do
// not parse.
class InputHistoryGenerator : public HistoryGenerator {
 public:
  InputHistoryGenerator(const std::string &path) : path_(path) {}
  ~InputHistoryGenerator() {}
  virtual void DeliverHistories(const std::function<void(History &&)> &handle) const override {
    std::ifstream fs(path_);
    if (!fs) {
      std::cerr << "Open Operation Sequences File Failed: " << path_ << std::endl;
      return;
    }
    uint64_t line_no = 0;
    for (std::string line; std::getline(fs, line);) {
      ++line_no;
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.find_first_not_of(" \t\r") == std::string::npos || line[line.find_first_not_of(" \t")] == '#') {
        continue;
      }
      if (std::optional<History> history = History::Parse(line); history.has_value()) {
        handle(std::move(*history));
      } else {
        std::cerr << "Invalid history at line " << line_no << ": \'" << line << "\'" << std::endl;
      }
    }
  }

 private:
  const std::string path_;
};

class RandomHistoryGenerator : public HistoryGenerator {
 public:
  RandomHistoryGenerator(const Options &opt, const uint64_t history_num)
      : trans_num_(opt.trans_num),
        item_num_(opt.item_num),
        dml_operation_num_(opt.max_dml),
        history_num_(history_num),
        with_abort_(opt.with_abort),
        tcl_position_(opt.tcl_position),
        with_write_(opt.with_write),
        rd_(),
        gen_(rd_()),
        rand_trans_id_(0, opt.trans_num == 0 ? 0 : opt.trans_num - 1),
        rand_item_id_(0, opt.item_num == 0 ? 0 : opt.item_num - 1),
        rand_bool_(0.5) {
    if (trans_num_ == 0 || item_num_ == 0) {
      throw std::string("RandomHistoryGenerator needs at least one transaction and one item");
    }
  }

  ~RandomHistoryGenerator() {}

  virtual void DeliverHistories(const std::function<void(History &&)> &handle) const override {
    for (uint64_t history_no = 0; history_no < history_num_; ++history_no) {
      History dml_history = MakeDMLHistory();
      if (tcl_position_ == TclPosition::NOWHERE) {
        handle(std::move(dml_history));
      } else {
        handle(MixTCLOperations(std::move(dml_history), MakeTCLHistory(dml_history)));
      }
    }
  }

  static std::string TransName(const uint64_t trans_id) { return std::to_string(trans_id); }

  // a, b, ..., z, then v26, v27, ...
  static std::string ItemName(const uint64_t item_id) {
    return item_id < 26 ? std::string(1, static_cast<char>('a' + item_id)) : "v" + std::to_string(item_id);
  }

 private:
  History MakeDMLHistory() const {
    std::vector<Operation> dml_operations;
    for (uint64_t dml_operation_no = 0; dml_operation_no < dml_operation_num_; ++dml_operation_no) {
      const std::string trans_id = TransName(rand_trans_id_(gen_));
      const std::string item_id = ItemName(rand_item_id_(gen_));
      if (with_write_ != Intensity::NONE_HAVE && rand_bool_(gen_)) {
        dml_operations.emplace_back(Operation::WriteTypeConstant(), trans_id, item_id);
      } else {
        dml_operations.emplace_back(Operation::ReadTypeConstant(), trans_id, item_id);
      }
    }
    const bool has_write = std::any_of(dml_operations.begin(), dml_operations.end(),
                                       [](const Operation &operation) { return operation.type() == Operation::Type::WRITE; });
    if (with_write_ == Intensity::ALL_HAVE && !has_write && !dml_operations.empty()) {
      Operation &operation = dml_operations[std::uniform_int_distribution<size_t>(0, dml_operations.size() - 1)(gen_)];
      operation = Operation(Operation::WriteTypeConstant(), operation.trans_id(), operation.item_id());
    }
    return History(std::move(dml_operations));
  }

  // One COMMIT or ABORT for each transaction appearing in the DML history, in random order.
  History MakeTCLHistory(const History &dml_history) const {
    std::vector<Operation> tcl_operations;
    std::set<std::string> trans_ids;
    for (const Operation &operation : dml_history.operations()) {
      if (!trans_ids.insert(operation.trans_id()).second) {
        continue;
      }
      if (with_abort_ && rand_bool_(gen_)) {
        tcl_operations.emplace_back(Operation::AbortTypeConstant(), operation.trans_id());
      } else {
        tcl_operations.emplace_back(Operation::CommitTypeConstant(), operation.trans_id());
      }
    }
    std::shuffle(tcl_operations.begin(), tcl_operations.end(), gen_);
    return History(std::move(tcl_operations));
  }

  // TAIL appends the TCL operations. ANYWHERE moves each of them to a random position after the
  // last DML operation of its transaction.
  History MixTCLOperations(History &&dml_history, History &&tcl_history) const {
    if (tcl_position_ == TclPosition::TAIL) {
      return dml_history + tcl_history;
    }
    std::vector<Operation> operations = std::move(dml_history.operations());
    for (const Operation &tcl_operation : tcl_history.operations()) {
      size_t left = 0;
      for (size_t i = 0; i < operations.size(); ++i) {
        if (operations[i].trans_id() == tcl_operation.trans_id()) {
          left = i + 1;
        }
      }
      const size_t pos = std::uniform_int_distribution<size_t>(left, operations.size())(gen_);
      operations.insert(operations.begin() + pos, tcl_operation);
    }
    return History(std::move(operations));
  }

  const uint64_t trans_num_;
  const uint64_t item_num_;
  const uint64_t dml_operation_num_;
  const uint64_t history_num_;
  const bool with_abort_;
  const TclPosition tcl_position_;
  const Intensity with_write_;
  mutable std::random_device rd_;
  mutable std::mt19937 gen_;
  mutable std::uniform_int_distribution<uint64_t> rand_trans_id_;
  mutable std::uniform_int_distribution<uint64_t> rand_item_id_;
  mutable std::bernoulli_distribution rand_bool_;
};

}  // namespace sercheck
