/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-broadcast-daemon.cpp
 * @brief Entry point of the gsn-broadcast node process.
 *
 * The harness starts one process per node and talks to it over stdin and
 * stdout, one JSON envelope per line. The process runs until stdin reaches
 * end of file or it receives SIGINT or SIGTERM. Diagnostics go to stderr.
 *
 * Exit status: 0 on a normal exit, 2 if the configuration in the environment
 * is invalid.
 */

#include <unistd.h>

#include <iostream>
#include <memory>

#include "gsn.hpp"

int main() {
  auto config = gsn::loadConfigFromEnv();
  if (!config) {
    std::cerr << "gsn-broadcast: " << config.error() << "\n";

    return 2;
  }

  // created before any other thread, see Gsn_Runtime_Manager
  auto inst = gsn::Gsn_Runtime_Manager::createInstance();

  auto stdio = std::make_shared<gsn::Gsn_Stdio>(STDIN_FILENO, STDOUT_FILENO);

  {
    gsn::Gsn_Node node{"gsn-broadcast", stdio, stdio, *config,
                       [&inst]() { inst->exitMainLoop(); }};

    inst->enterMainLoop();
  }

  return 0;
}
