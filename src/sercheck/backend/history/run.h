/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#pragma once
#include <signal.h>

#include <chrono>
#include <cstdlib>

#include "../cca/algorithm.h"
#include "../util/error.h"
#include "../util/generic.h"
#include "generator.h"
#include "outputter.h"

namespace sercheck {

using AlgorithmWithFilter = std::pair<std::shared_ptr<HistoryAlgorithm>, std::optional<bool>>;

inline std::vector<std::shared_ptr<Outputter>> outs;
inline void handler(int signum) {
  for (auto &i : outs) {
    i->ResultToFile("[WARNING] The test is uncompleted!");
  }
  exit(0);
}

// Check the history with one algorithm. A malformed history counts as not passing, the reason is
// kept in the result info.
inline std::unique_ptr<CheckResult> CheckOne(const HistoryAlgorithm &algorithm, const History &history) {
  auto check_result = std::make_unique<CheckResult>();
  const auto start_time = std::chrono::steady_clock::now();
  try {
    check_result->ok_ = algorithm.Check(history, &check_result->info_);
  } catch (const ScheduleError &e) {
    check_result->ok_ = false;
    check_result->info_ << e.what();
  }
  check_result->time_compt_ =
      std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start_time).count();
  check_result->algorithm_name_ = algorithm.name();
  return check_result;
}

// Each algorithm checks the history. The history is passed to the outputters only if every
// algorithm's result satisfies its filter.
inline void FilterRun(const std::shared_ptr<HistoryGenerator> &generator,
                      const std::vector<AlgorithmWithFilter> &algorithms,
                      const std::vector<std::shared_ptr<Outputter>> &outputters) {
  const auto task = [&algorithms, &outputters](const History &history) {
    std::vector<std::unique_ptr<CheckResult>> check_results;
    for (const auto &[algorithm, filter] : algorithms) {
      auto check_result = CheckOne(*algorithm, history);
      // If filter == true, output only if check passes;
      // If filter == false, output only if check not passes;
      // If filter not has a value, output whether check passes or not
      if (filter.has_value() && check_result->ok_ != filter.value()) {
        return;
      }
      check_results.emplace_back(std::move(check_result));
    }
    for (const std::shared_ptr<Outputter> &outputter : outputters) {
      outputter->Output(check_results, history);
    }
  };

  // The signal handler flushes the outputters only while this run is in progress.
  struct OutputtersRegistration {
    OutputtersRegistration(const std::vector<std::shared_ptr<Outputter>> &outputters) {
      outs = outputters;
      signal(SIGINT, handler);
      signal(SIGTERM, handler);
    }
    ~OutputtersRegistration() {
      signal(SIGINT, SIG_DFL);
      signal(SIGTERM, SIG_DFL);
      outs.clear();
    }
  };

  const OutputtersRegistration registration(outputters);
  generator->DeliverHistories([&task](History &&history) { task(history); });
  for (const auto &[algorithm, _] : algorithms) {
    algorithm->Statistics();
  }
}

// Each algorithm check the histories and record the time cost.
template <typename OS>
void BenchmarkRun(const std::vector<History> &histories,
                  const std::vector<std::shared_ptr<HistoryAlgorithm>> &algorithms, OS &&os) {
  for (const std::shared_ptr<HistoryAlgorithm> &algorithm : algorithms) {
    auto start = std::chrono::steady_clock::now();
    uint64_t ok_count = 0;
    for (const History &history : histories) {
      if (algorithm->Check(history)) {
        ++ok_count;
      }
    }
    std::chrono::duration<double> diff = std::chrono::steady_clock::now() - start;
    os << "\'" << algorithm->name() << "\'"
       << " serializable histories: " << ok_count << "/" << histories.size() << " duration: " << diff.count()
       << "s" << std::endl;
  }
}

template <typename OS>
void BenchmarkRun(const std::shared_ptr<HistoryGenerator> &generator,
                  const std::vector<std::shared_ptr<HistoryAlgorithm>> &algorithms, OS &&os) {
  std::vector<History> histories;
  generator->DeliverHistories([&histories](History &&history) { histories.emplace_back(std::move(history)); });
  BenchmarkRun(histories, algorithms, std::forward<OS>(os));
}

// Random histories for each (trans_num, item_num) pair, with trans_num * item_num / 4 DML
// operations each.
template <typename OS>
void BenchmarkRun(const std::vector<uint64_t> &trans_nums, const std::vector<uint64_t> &item_nums, const uint64_t num,
                  const std::vector<std::shared_ptr<HistoryAlgorithm>> &algorithms, OS &&os, const bool with_abort,
                  const TclPosition tcl_position) {
  Options opts;
  opts.with_abort = with_abort;
  opts.tcl_position = tcl_position;
  opts.with_write = Intensity::NO_LIMIT;
  for (size_t i = 0; i < trans_nums.size() && i < item_nums.size(); ++i) {
    const uint64_t trans_num = trans_nums[i];
    const uint64_t item_num = item_nums[i];
    const uint64_t dml_operation_num = std::max<uint64_t>(trans_num * item_num / 4, 1);
    os << "====== trans_num: " << trans_num << " item_num: " << item_num
       << " dml_operation_num: " << dml_operation_num << " ======" << std::endl;
    opts.trans_num = trans_num;
    opts.item_num = item_num;
    opts.max_dml = dml_operation_num;
    BenchmarkRun(std::make_shared<RandomHistoryGenerator>(opts, num), algorithms, os);
  }
  os << std::endl;
}

}  // namespace sercheck
