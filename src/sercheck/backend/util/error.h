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

ENUM_BEGIN(ErrorCode)
ENUM_MEMBER(ErrorCode, INVALID_OPERATION)
ENUM_MEMBER(ErrorCode, MISSING_DATA_ITEM)
ENUM_MEMBER(ErrorCode, MISSING_TRANSACTION_ID)
ENUM_END(ErrorCode)

#endif
#endif
#endif

#ifndef SERCHECK_UTIL_ERROR_H
#define SERCHECK_UTIL_ERROR_H

#include <stdexcept>

#include "generic.h"

namespace sercheck {

#define ENUM_FILE "./error.h"
#include "extend_enum.h"

// Thrown when a history contains an operation the checker cannot interpret.
class ScheduleError : public std::runtime_error {
 public:
  ScheduleError(const ErrorCode code, const std::string& message)
      : std::runtime_error(std::string("[") + ToString(code) + "] " + message), code_(code) {}

  ErrorCode code() const { return code_; }

 private:
  const ErrorCode code_;
};

inline void ThrowIfMalformed(const Operation& operation, const size_t position) {
  const std::string where = " at position " + std::to_string(position);
  if (operation.trans_id().empty()) {
    throw ScheduleError(ErrorCode::MISSING_TRANSACTION_ID, "operation without transaction id" + where);
  }
  if (!operation.IsPointDML() && !operation.IsTCL()) {
    throw ScheduleError(ErrorCode::INVALID_OPERATION,
                        "unrecognized operation type of transaction " + operation.trans_id() + where);
  }
  if (operation.IsTCL() && !operation.item_id().empty()) {
    throw ScheduleError(ErrorCode::INVALID_OPERATION, "commit or abort of transaction " + operation.trans_id() +
                                                          " carries data item " + operation.item_id() + where);
  }
  if (operation.IsPointDML() && operation.item_id().empty()) {
    throw ScheduleError(ErrorCode::MISSING_DATA_ITEM,
                        "read or write of transaction " + operation.trans_id() + " has no data item" + where);
  }
}

inline void ThrowIfMalformed(const History& history) {
  for (size_t i = 0; i < history.size(); ++i) {
    ThrowIfMalformed(history[i], i);
  }
}

}  // namespace sercheck

#endif
