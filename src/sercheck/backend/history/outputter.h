/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#pragma once
#include "../cca/ending_validator.h"
#include "../util/error.h"
#include "../util/generic.h"

namespace sercheck {

struct CheckResult {
  CheckResult() : ok_(false) {}
  CheckResult(const CheckResult&) = delete;
  CheckResult(CheckResult&&) = default;
  ~CheckResult() {}
  bool ok_;
  std::string algorithm_name_;
  std::ostringstream info_;
  std::optional<double> time_compt_;
};

class Outputter {
 public:
  Outputter(const std::string& output_filename) : os_(output_filename) {
    if (!os_) {
      throw "Open output file " + output_filename + " failed";
    }
  }
  virtual ~Outputter() {}
  virtual void Output(const std::vector<std::unique_ptr<CheckResult>>& results,
                      const History& history) = 0;
  virtual void ResultToFile(const std::string&) = 0;

 protected:
  std::ofstream os_;
};

// Output detail infomation of each history for each algorithm
class DetailOutputter : public Outputter {
 public:
  DetailOutputter(const std::string& output_filename) : Outputter(output_filename), no_(0) {}
  virtual ~DetailOutputter() {}
  virtual void ResultToFile(const std::string&) override {}
  virtual void Output(const std::vector<std::unique_ptr<CheckResult>>& results,
                      const History& history) override {
    std::stringstream ss;
    ss << ">>>>>> {" << (++no_) << "} " << history << std::endl;
    for (const std::unique_ptr<CheckResult>& result : results) {
      ss << "[ " << result->algorithm_name_ << " ] " << (result->ok_ ? "serializable" : "not serializable")
         << std::endl;
      ss << result->info_.str() << std::endl;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    os_ << ss.rdbuf() << std::endl;
  }

 private:
  std::mutex mutex_;
  std::atomic<uint64_t> no_;
};

// Count verdicts per algorithm. The 0th algorithm is the datum the others are compared with.
class SummaryOutputter : public Outputter {
 private:
  struct Info {
    Info() : time_consume_(0.0), ok_count_(0), ng_count_(0), disagree_count_(0) {}
    double time_consume_;
    uint64_t ok_count_;
    uint64_t ng_count_;
    uint64_t disagree_count_;
  };

 public:
  SummaryOutputter(const std::string& output_filename)
      : Outputter(output_filename), history_count_(0), warned_history_count_(0), malformed_history_count_(0) {}
  virtual ~SummaryOutputter() { ResultToFile("finish success"); }

  virtual void ResultToFile(const std::string& s) override {
    std::lock_guard<std::mutex> lock(mutex_);
    os_ << s << std::endl;
    os_ << "Datum Algorithm: " << datum_algorithm_name_ << std::endl;
    os_ << "Total Histories: " << history_count_ << std::endl;
    os_ << "Histories With Ending Warnings: " << warned_history_count_ << std::endl;
    os_ << "Malformed Histories: " << malformed_history_count_ << std::endl;
    os_ << std::endl;
    for (const auto& [algorithm_name, info] : infos_) {
      os_ << ">>>>>> " << algorithm_name;
      if (info.time_consume_ > 0) {
        os_ << " (" << info.time_consume_ << "ns)";
      }
      os_ << std::endl;
      os_ << " ├ Serializable Histories: " << info.ok_count_ << std::endl;
      os_ << " ├ Not Serializable Histories: " << info.ng_count_ << std::endl;
      os_ << " └ Disagree With Datum: " << info.disagree_count_ << std::endl;
    }
    os_ << std::flush;
  }

  virtual void Output(const std::vector<std::unique_ptr<CheckResult>>& results,
                      const History& history) override {
    bool has_warning = false;
    bool malformed = false;
    try {
      has_warning = !ValidateTransactionEndings(history).empty();
    } catch (const ScheduleError&) {
      malformed = true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++history_count_;
    warned_history_count_ += has_warning;
    malformed_history_count_ += malformed;
    if (results.empty()) {
      return;
    }
    const bool datum_ok = results[0]->ok_;
    datum_algorithm_name_ = results[0]->algorithm_name_;
    for (const std::unique_ptr<CheckResult>& result : results) {
      Info& info = infos_[result->algorithm_name_];
      if (result->time_compt_.has_value()) {
        info.time_consume_ += result->time_compt_.value();
      }
      info.ok_count_ += result->ok_;
      info.ng_count_ += !result->ok_;
      info.disagree_count_ += (result->ok_ != datum_ok);
    }
  }

 private:
  std::mutex mutex_;
  std::string datum_algorithm_name_;
  uint64_t history_count_;
  uint64_t warned_history_count_;
  uint64_t malformed_history_count_;
  std::map<std::string, Info> infos_;
};

}  // namespace sercheck
