/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-test-runtime.cpp
 * @brief The unit test for gsn-runtime module.
 */

#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

#include "gsn-proc.hpp"
#include "gsn-runtime.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  // first, so that every thread below inherits the signal mask
  auto inst = gsn::Gsn_Runtime_Manager::createInstance();
  EXPECT_TRUE(inst == gsn::Gsn_Runtime_Manager::createInstance());

  std::atomic<int> hupCount{};
  std::atomic<bool> termHandled{};

  inst->registerSignalHandler(SIGHUP, [&hupCount](int signo) {
    std::cout << "handle signal " << signo << "\n";
    hupCount++;
  });

  // runs before the default SIGTERM handler that exits the main loop
  inst->registerSignalHandler(SIGTERM, [&termHandled](int signo) {
    std::cout << "handle signal " << signo << "\n";
    termHandled = true;
  });

  gsn::Gsn_Proc raiseProc{"raise", [&hupCount]() {
                            std::this_thread::sleep_for(
                                std::chrono::milliseconds(200));
                            kill(getpid(), SIGHUP);

                            while (hupCount.load() < 1) {
                              gsn::Gsn_Proc::yield();
                            }

                            kill(getpid(), SIGTERM);
                          }};

  raiseProc.exec();

  inst->enterMainLoop();
  raiseProc.wait();

  EXPECT_TRUE(1 == hupCount.load());
  EXPECT_TRUE(termHandled.load());

  return RUN_ALL_TESTS();
}
