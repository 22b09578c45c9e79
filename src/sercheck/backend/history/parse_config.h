/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#pragma once
#include <libconfig.h++>

#include <typeinfo>

#include "../cca/conflict_serializable_algorithm.h"
#include "../util/generic.h"
#include "generator.h"
#include "outputter.h"
#include "run.h"

namespace sercheck {

template <typename EnumType>
EnumType EnumParse(const std::string& s) {
  if (const std::optional<EnumType> e = FromString<EnumType>(s); e.has_value()) {
    return *e;
  }
  throw std::string("Parse Enum failed: ") + s + " type:" + typeid(EnumType).name();
}

// if you want add generator, add here
inline std::shared_ptr<HistoryGenerator> GeneratorParse(const libconfig::Config& cfg, const std::string& name) {
  try {
    const libconfig::Setting& s = cfg.lookup(name);
    if (name == "InputGenerator") {
      const std::string file = s.lookup("file");
      return std::make_shared<InputHistoryGenerator>(file);
    } else if (name == "RandomGenerator") {
      Options opt;
      opt.trans_num = static_cast<unsigned int>(s.lookup("trans_num"));
      opt.item_num = static_cast<unsigned int>(s.lookup("item_num"));
      opt.max_dml = static_cast<unsigned int>(s.lookup("max_dml"));
      opt.with_abort = s.lookup("with_abort");
      opt.tcl_position = EnumParse<TclPosition>(s.lookup("tcl_position"));
      opt.with_write = EnumParse<Intensity>(s.lookup("with_write"));
      const uint64_t history_num = static_cast<unsigned int>(s.lookup("history_num"));
      return std::make_shared<RandomHistoryGenerator>(opt, history_num);
    }
  } catch (const libconfig::SettingNotFoundException& nfex) {
    throw name + " setting " + std::string(nfex.getPath()) + " no found";
  } catch (const libconfig::SettingTypeException& tex) {
    throw name + " setting " + std::string(tex.getPath()) + " has wrong type";
  }
  throw "Unknown generator name " + name;
}

// if you want add algorithm, add here
inline std::shared_ptr<HistoryAlgorithm> AlgorithmParse(const std::string& algorithm_name) {
  if (algorithm_name == "ConflictSerializableAlgorithm") {
    return std::make_shared<ConflictSerializableAlgorithm<CycleCheck::DEPTH_FIRST>>();
  } else if (algorithm_name == "ConflictSerializableAlgorithm_TOPO") {
    return std::make_shared<ConflictSerializableAlgorithm<CycleCheck::TOPOLOGICAL>>();
  }
  throw "Unknown algorithm name " + algorithm_name;
}

// Each entry is either an algorithm name or a group { name = "..."; filter = true/false; }.
inline std::vector<AlgorithmWithFilter> MultiAlgorithmParse(const libconfig::Setting& s) {
  std::vector<AlgorithmWithFilter> algorithms;
  const int len = s.getLength();
  if (len == 0) {
    throw "algorithm list is empty";
  }
  for (int i = 0; i < len; i++) {
    const libconfig::Setting& entry = s[i];
    if (entry.isGroup()) {
      const std::string algorithm_name = entry.lookup("name");
      std::optional<bool> filter;
      // If <filter> cannot find, it means we need not do filter
      if (bool value; entry.lookupValue("filter", value)) {
        filter = value;
      }
      algorithms.emplace_back(AlgorithmParse(algorithm_name), filter);
    } else {
      const std::string algorithm_name = entry;
      algorithms.emplace_back(AlgorithmParse(algorithm_name), std::nullopt);
    }
  }
  return algorithms;
}

// if you want add outtputer, add here
inline std::vector<std::shared_ptr<Outputter>> OutputterParse(const libconfig::Config& cfg,
                                                              const libconfig::Setting& s) {
  std::vector<std::shared_ptr<Outputter>> res;
  try {
    const int len = s.getLength();
    for (int i = 0; i < len; i++) {
      const std::string outputter = s[i];
      const std::string file = cfg.lookup(outputter).lookup("file");
      if (outputter == "DetailOutputter") {
        res.emplace_back(std::make_shared<DetailOutputter>(file));
      } else if (outputter == "SummaryOutputter") {
        res.emplace_back(std::make_shared<SummaryOutputter>(file));
      } else {
        throw "Unknown outputter name " + outputter;
      }
    }
  } catch (const libconfig::SettingNotFoundException& nfex) {
    throw "Outputter setting " + std::string(nfex.getPath()) + " no found";
  }
  return res;
}

inline void FilterRunParse(const libconfig::Config& cfg) {
  try {
    const libconfig::Setting& s = cfg.lookup("FilterRun");
    const std::string generator_name = s.lookup("generator");
    auto generator = GeneratorParse(cfg, generator_name);
    auto algorithms = MultiAlgorithmParse(s.lookup("algorithms"));
    auto outputters = OutputterParse(cfg, s.lookup("outputters"));
    FilterRun(generator, algorithms, outputters);
  } catch (const libconfig::SettingNotFoundException& nfex) {
    throw "Func FilterRun setting " + std::string(nfex.getPath()) + " no found";
  }
}

inline void BenchmarkRunParse(const libconfig::Config& cfg) {
  try {
    const libconfig::Setting& s = cfg.lookup("BenchmarkRun");
    const libconfig::Setting& algorithm_names = s.lookup("algorithms");
    std::vector<std::shared_ptr<HistoryAlgorithm>> algorithms;
    for (int i = 0; i < algorithm_names.getLength(); i++) {
      const std::string algorithm_name = algorithm_names[i];
      algorithms.emplace_back(AlgorithmParse(algorithm_name));
    }

    std::vector<uint64_t> trans_nums, item_nums;
    const libconfig::Setting& trans_nums_ = s.lookup("trans_nums");
    const libconfig::Setting& item_nums_ = s.lookup("item_nums");
    const int len = trans_nums_.getLength();
    if (len != item_nums_.getLength()) {
      throw "BenchmarkRun trans num != item num";
    }
    for (int i = 0; i < len; i++) {
      trans_nums.emplace_back(static_cast<unsigned int>(trans_nums_[i]));
      item_nums.emplace_back(static_cast<unsigned int>(item_nums_[i]));
    }

    const uint64_t history_num = static_cast<unsigned int>(s.lookup("history_num"));
    const std::string os = s.lookup("os");
    const bool with_abort = s.lookup("with_abort");
    const TclPosition tcl_position = EnumParse<TclPosition>(s.lookup("tcl_position"));
    if (os == "cout") {
      BenchmarkRun(trans_nums, item_nums, history_num, algorithms, std::cout, with_abort, tcl_position);
    } else {
      BenchmarkRun(trans_nums, item_nums, history_num, algorithms, std::ofstream(os), with_abort, tcl_position);
    }
  } catch (const libconfig::SettingNotFoundException& nfex) {
    throw "Func BenchmarkRun setting " + std::string(nfex.getPath()) + " no found";
  }
}

// if you want add func, add here and corresponding parser
inline void TargetParse(const libconfig::Config& cfg) {
  try {
    const libconfig::Setting& target = cfg.lookup("Target");
    const int len = target.getLength();
    for (int i = 0; i < len; i++) {
      const std::string str = target[i];
      if (str == "FilterRun") {
        FilterRunParse(cfg);
      } else if (str == "BenchmarkRun") {
        BenchmarkRunParse(cfg);
      } else {
        throw "func name err: " + str;
      }
    }
  } catch (const libconfig::SettingNotFoundException& nfex) {
    throw "Target setting " + std::string(nfex.getPath()) + " no found";
  }
}

inline void ReadAndRun(const std::string& conf_path) {
  libconfig::Config cfg;
  try {
    cfg.readFile(conf_path.c_str());
  } catch (const libconfig::FileIOException& fioex) {
    throw "I/O error while reading file " + conf_path;
  } catch (const libconfig::ParseException& pex) {
    throw "Parse error at " + std::string(pex.getFile()) + ":" + std::to_string(pex.getLine()) + " - " +
        pex.getError();
  }
  TargetParse(cfg);
}

}  // namespace sercheck
