/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#pragma once
#include <iostream>
#include <string>

#include "cca/conflict_serializable_algorithm.h"
#include "util/error.h"
#include "util/generic.h"

namespace sercheck {

class Printer {
 public:
  static void Print(const std::string& info) {
    std::cout << info << std::endl;
    std::cout << std::endl;
  }

  static void PrintStartInfo() {
    std::cout << "Welcome to the sercheck shell." << std::endl;
    std::cout << "version: 1.0.0\n" << std::endl;
    std::cout << "Type a history such as 'R1x W2x R2y W1y C1 C2' to check whether it is conflict serializable."
              << std::endl;
    std::cout << "Type 'help' or 'h' for help.\n" << std::endl;
  }

  static void PrintHelpInfo() {
    std::cout << "List of all sercheck shell commands:" << std::endl;
    std::cout << "help         (h) Output this message" << std::endl;
    std::cout << "quit         (q) Quit the shell" << std::endl;
    std::cout << std::endl;
    std::cout << "Any other line is checked as a history. One operation is <type><trans_id><item>:" << std::endl;
    std::cout << "    Operation Type -> R: Read, W: Write, C: Commit, A: Abort" << std::endl;
    std::cout << "    Transaction ID -> digits, upper-case letters or '_', such as 1 2 T1 ..." << std::endl;
    std::cout << "    Data Item      -> starts with a lower-case letter, such as x y a1 ..., none for C and A"
              << std::endl;
    std::cout << std::endl;
  }

  static void PrintResult(const SerializabilityResult& result, std::ostream& os = std::cout) {
    os << (result.is_serializable ? "Conflict Serializable" : "Not Conflict Serializable") << std::endl;
    os << "Precedence Graph: " << GraphToString(result.graph) << std::endl;
    if (result.cycle.has_value()) {
      os << "Cycle: " << CycleToString(*result.cycle) << std::endl;
    }
    for (const std::string& warning : result.warnings) {
      os << warning << std::endl;
    }
    os << std::endl;
  }

  static void TrimSpace(std::string& str) {
    const auto begin = str.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
      str.clear();
      return;
    }
    str = str.substr(begin, str.find_last_not_of(" \t\r") - begin + 1);
  }
};

class Checker {
 public:
  // Returns false when the text is not a valid history or the history is malformed.
  bool Exec(const std::string& text, std::ostream& os = std::cout) const {
    const std::optional<History> history = History::Parse(text);
    if (!history.has_value()) {
      os << "Invalid history, type 'h' for the notation\n" << std::endl;
      return false;
    }
    try {
      Printer::PrintResult(CheckConflictSerializability(*history), os);
    } catch (const ScheduleError& e) {
      os << e.what() << "\n" << std::endl;
      return false;
    }
    return true;
  }
};

}  // namespace sercheck
