/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#include "shell.h"

using namespace sercheck;

int main() {
  const Checker checker;
  Printer::PrintStartInfo();

  while (true) {
    std::cout << "sercheck> ";
    std::string text;
    if (!std::getline(std::cin, text)) {
      std::cout << std::endl;
      break;
    }
    Printer::TrimSpace(text);
    if (text.empty()) {
      continue;
    } else if ("help" == text || "h" == text) {
      Printer::PrintHelpInfo();
    } else if ("q" == text || "quit" == text) {
      break;
    } else {
      checker.Exec(text);
    }
  }
  return 0;
}
