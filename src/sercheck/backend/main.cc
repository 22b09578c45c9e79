/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */
#include <gflags/gflags.h>

#include <iostream>

#include "history/parse_config.h"

DEFINE_string(conf_path, "config/config.cfg", "program configure file.");

using namespace sercheck;

int main(int argc, char **argv) {
  gflags::SetUsageMessage("check histories for conflict serializability, e.g. sercheck --conf_path=config/config.cfg");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  std::cout << "FLAGS_conf_path:" << FLAGS_conf_path << std::endl;

  try {
    ReadAndRun(FLAGS_conf_path);
  } catch (const libconfig::SettingException &sex) {
    std::cerr << "setting " << sex.getPath() << " error: " << sex.what() << std::endl;
    return 1;
  } catch (char const *str) {
    std::cerr << str << std::endl;
    return 1;
  } catch (const std::string &str) {
    std::cerr << str << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  gflags::ShutDownCommandLineFlags();
  return 0;
}
