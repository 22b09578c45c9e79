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

ENUM_BEGIN(Intensity)
ENUM_MEMBER(Intensity, NONE_HAVE)
ENUM_MEMBER(Intensity, ALL_HAVE)
ENUM_MEMBER(Intensity, NO_LIMIT)
ENUM_END(Intensity)

ENUM_BEGIN(TclPosition)
ENUM_MEMBER(TclPosition, TAIL)
ENUM_MEMBER(TclPosition, ANYWHERE)
ENUM_MEMBER(TclPosition, NOWHERE)
ENUM_END(TclPosition)

#endif
#endif
#endif

#ifndef SERCHECK_UTIL_GENERIC_H
#define SERCHECK_UTIL_GENERIC_H

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sercheck {

class Operation {
 public:
  enum class Type : char {
    UNKNOWN = '?',
    READ = 'R',
    WRITE = 'W',
    COMMIT = 'C',
    ABORT = 'A'
  };
  using ReadTypeConstant = std::integral_constant<Type, Type::READ>;
  using WriteTypeConstant = std::integral_constant<Type, Type::WRITE>;
  using CommitTypeConstant = std::integral_constant<Type, Type::COMMIT>;
  using AbortTypeConstant = std::integral_constant<Type, Type::ABORT>;

  Operation() : type_(Type::UNKNOWN) {}
  Operation(const CommitTypeConstant dtl_type, const std::string& trans_id)
      : type_(dtl_type.value), trans_id_(trans_id) {}
  Operation(const AbortTypeConstant dtl_type, const std::string& trans_id)
      : type_(dtl_type.value), trans_id_(trans_id) {}
  Operation(const ReadTypeConstant dml_type, const std::string& trans_id, const std::string& item_id)
      : type_(dml_type.value), trans_id_(trans_id), item_id_(item_id) {}
  Operation(const WriteTypeConstant dml_type, const std::string& trans_id, const std::string& item_id)
      : type_(dml_type.value), trans_id_(trans_id), item_id_(item_id) {}
  // Unchecked construction, the type may be UNKNOWN and the item may be missing. Histories built
  // this way are validated when they are checked.
  Operation(const std::string& trans_id, const Type type, const std::string& item_id = "")
      : type_(type), trans_id_(trans_id), item_id_(item_id) {}

  // Build an operation from the (trans_id, kind, data_item) tuple form, kind being "R", "W", "C"
  // or "A". Any other kind yields an UNKNOWN operation.
  static Operation FromTuple(const std::string& trans_id, const std::string& kind,
                             const std::string& item_id) {
    const Type type = kind.size() == 1 ? ParseType(kind[0]) : Type::UNKNOWN;
    return Operation(trans_id, type, item_id);
  }

  static Type ParseType(const char c) {
    switch (c) {
      case 'R':
        return Type::READ;
      case 'W':
        return Type::WRITE;
      case 'C':
        return Type::COMMIT;
      case 'A':
        return Type::ABORT;
      default:
        return Type::UNKNOWN;
    }
  }

  Type type() const { return type_; }
  const std::string& trans_id() const { return trans_id_; }
  const std::string& item_id() const { return item_id_; }

  bool IsPointDML() const { return IsPointDML(type_); }
  bool IsTCL() const { return IsTCL(type_); }
  static bool IsPointDML(const Type& type) { return type == Type::READ || type == Type::WRITE; }
  static bool IsTCL(const Type& type) { return type == Type::COMMIT || type == Type::ABORT; }

  bool operator==(const Operation& r) const {
    return type_ == r.type_ && trans_id_ == r.trans_id_ && item_id_ == r.item_id_;
  }

  friend std::ostream& operator<<(std::ostream& os, const Operation& operation) {
    return os << static_cast<char>(operation.type_) << operation.trans_id_ << operation.item_id_;
  }

  // Reads one token of the form <type><trans_id>[<item>], e.g. R1a, WT2x, C1. The transaction id
  // is a run of digits, upper-case letters or '_'; the item starts with a lower-case letter.
  friend std::istream& operator>>(std::istream& is, Operation& operation) {
    std::string token;
    if (!(is >> token)) {
      return is;
    }
    const Type type = ParseType(token[0]);
    if (type == Type::UNKNOWN) {
      std::cerr << "Unknown operation type character: " << token[0]
                << ". Supported operations: R W C A" << std::endl;
      is.setstate(std::ios::failbit);
      return is;
    }
    size_t pos = 1;
    while (pos < token.size() && IsTransIdChar_(token[pos])) {
      ++pos;
    }
    if (pos == 1) {
      std::cerr << "Transaction ID must be digits or upper-case letters: " << token << std::endl;
      is.setstate(std::ios::failbit);
      return is;
    }
    const std::string item_id = token.substr(pos);
    if (IsPointDML(type) && !IsItemId_(item_id)) {
      std::cerr << "Data Item must start with a lowercase letter: " << token << std::endl;
      is.setstate(std::ios::failbit);
      return is;
    }
    if (IsTCL(type) && !item_id.empty()) {
      std::cerr << "Commit and Abort take no data item: " << token << std::endl;
      is.setstate(std::ios::failbit);
      return is;
    }
    operation = Operation(token.substr(1, pos - 1), type, item_id);
    return is;
  }

 private:
  static bool IsTransIdChar_(const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c)) ||
           c == '_';
  }

  static bool IsItemId_(const std::string& item_id) {
    if (item_id.empty() || !std::islower(static_cast<unsigned char>(item_id[0]))) {
      return false;
    }
    return std::all_of(item_id.begin(), item_id.end(), [](const char c) {
      return std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)) ||
             c == '_';
    });
  }

  Type type_;
  std::string trans_id_;
  std::string item_id_;  // empty for COMMIT and ABORT
};

class History {
 public:
  using Tuple = std::tuple<std::string, std::string, std::string>;

  History() {}
  History(const std::vector<Operation>& operations) : operations_(operations) {}
  History(std::vector<Operation>&& operations) : operations_(std::move(operations)) {}
  History(History&& history) = default;
  History(const History& history) = default;
  ~History() {}

  History& operator=(History&& history) = default;
  History& operator=(const History& history) = default;

  // Concatenation keeps the order of both histories, used to append TCL operations to DML ones.
  History operator+(const History& history) const {
    std::vector<Operation> new_operations = operations_;
    new_operations.insert(new_operations.end(), history.operations_.begin(), history.operations_.end());
    return History(std::move(new_operations));
  }

  static History FromTuples(const std::vector<Tuple>& tuples) {
    std::vector<Operation> operations;
    operations.reserve(tuples.size());
    for (const auto& [trans_id, kind, item_id] : tuples) {
      operations.emplace_back(Operation::FromTuple(trans_id, kind, item_id));
    }
    return History(std::move(operations));
  }

  // Parse a whole history written in the text notation. Returns nullopt for invalid text.
  static std::optional<History> Parse(const std::string& text) {
    std::vector<Operation> operations;
    std::stringstream ss(text);
    for (std::string token; ss >> token;) {
      std::istringstream token_stream(token);
      Operation operation;
      if (!(token_stream >> operation)) {
        return std::nullopt;
      }
      operations.emplace_back(std::move(operation));
    }
    return History(std::move(operations));
  }

  std::vector<Operation>& operations() { return operations_; }
  const std::vector<Operation>& operations() const { return operations_; }
  size_t size() const { return operations_.size(); }
  bool empty() const { return operations_.empty(); }

  uint64_t trans_num() const {
    std::set<std::string> trans_ids;
    for (const Operation& operation : operations_) {
      trans_ids.insert(operation.trans_id());
    }
    return trans_ids.size();
  }

  uint64_t item_num() const {
    std::set<std::string> item_ids;
    for (const Operation& operation : operations_) {
      if (!operation.item_id().empty()) {
        item_ids.insert(operation.item_id());
      }
    }
    return item_ids.size();
  }

  Operation& operator[](const size_t index) { return operations_[index]; }
  const Operation& operator[](const size_t index) const { return operations_[index]; }

  bool operator==(const History& history) const { return operations_ == history.operations_; }

  friend std::ostream& operator<<(std::ostream& os, const History& history) {
    for (size_t i = 0; i < history.operations_.size(); ++i) {
      os << (i == 0 ? "" : " ") << history.operations_[i];
    }
    return os;
  }

  // Reads one line. The stream fails on invalid text so a bad line is never taken as a history.
  friend std::istream& operator>>(std::istream& is, History& history) {
    std::string s;
    if (std::getline(is, s)) {
      if (std::optional<History> parsed = Parse(s); parsed.has_value()) {
        history = std::move(*parsed);
      } else {
        std::cerr << "Invalid history: \'" << s << "\'" << std::endl;
        is.setstate(std::ios::failbit);
      }
    }
    return is;
  }

 private:
  std::vector<Operation> operations_;
};

#define ENUM_FILE "./generic.h"
#include "extend_enum.h"

struct Options {
  uint64_t trans_num;
  uint64_t item_num;
  uint64_t max_dml;

  bool with_abort;
  TclPosition tcl_position;
  Intensity with_write;
};

}  // namespace sercheck
#endif
