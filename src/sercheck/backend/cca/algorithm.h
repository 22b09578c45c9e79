/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#pragma once
#include "../util/generic.h"

namespace sercheck {

#define TRY_LOG(os) \
  if ((os) != nullptr) *(os)

// A history checker. Check returns true when the history passes and writes its diagnostic
// information to os when os is not null.
class HistoryAlgorithm {
 public:
  HistoryAlgorithm(const std::string& name) : name_(name) {}
  virtual ~HistoryAlgorithm() {}

  virtual bool Check(const History& history, std::ostream* const os = nullptr) const = 0;
  virtual void Statistics() const {};
  std::string name() const { return name_; }

  const std::string name_;
};

}  // namespace sercheck
