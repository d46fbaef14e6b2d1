/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-test-async.cpp
 * @brief The unit test for gsn-async module.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "gsn-async.hpp"
#include "gsn-proc.hpp"

class Counter : gsn::Gsn_Async {
public:
  Counter() : gsn::Gsn_Async{"counter"} {}

  void increment() { GSN_ASYNC_CALL_WITH_CAPTURE({ this->m_count++; }, this); }

  void sync() { this->waitForEmpty(); }

  operator long long() { return m_count; }

private:
  long long m_count{};
};

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  Counter cnt{};
  gsn::Gsn_Proc proc1{"proc1", [&cnt]() {
                        for (int n = 0; n < 100; n++) {
                          cnt.increment();
                          gsn::Gsn_Proc::yield();
                        }
                      }};

  gsn::Gsn_Proc proc2{"proc2", [&cnt]() {
                        for (int n = 0; n < 100; n++) {
                          cnt.increment();
                          gsn::Gsn_Proc::yield();
                        }
                      }};

  proc1.exec();
  proc2.exec();

  proc1.wait();
  proc2.wait();
  cnt.sync();

  EXPECT_TRUE(static_cast<long long>(cnt) == 200);

  // tasks run one at a time in submission order
  gsn::Gsn_Async ordered{"ordered"};
  std::vector<int> order{};

  for (int n = 0; n < 50; n++) {
    ordered.addExecTask([&order, n]() { order.push_back(n); });
  }

  ordered.waitForEmpty();
  EXPECT_TRUE(50 == order.size());

  for (int n = 0; n < 50; n++) {
    EXPECT_TRUE(n == order[n]);
  }

  bool done{};
  gsn::Gsn_Async asyncWithWait{"async"};

  auto waitHandler = asyncWithWait.addExecTaskWithWait([&done] {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    done = true;
  });

  waitHandler->wait();
  EXPECT_TRUE(done);

  waitHandler = asyncWithWait.addExecTaskWithWait(
      [] { throw std::runtime_error("just exception"); });

  bool exceptionCatch{};
  try {
    waitHandler->wait();
  } catch (const std::runtime_error &e) {
    std::cout << "caught: " << e.what() << "\n";
    exceptionCatch = true;
  }

  EXPECT_TRUE(exceptionCatch);

  // a failing task without wait object does not stop the executor
  asyncWithWait.addExecTask([] { throw std::runtime_error("lost exception"); });

  int after{};
  waitHandler = asyncWithWait.addExecTaskWithWait([&after] { after = 1; });
  waitHandler->wait();

  EXPECT_TRUE(1 == after);

  auto thrown = asyncWithWait.takeThrownException();
  EXPECT_TRUE(thrown != nullptr);
  EXPECT_TRUE(asyncWithWait.takeThrownException() == nullptr);

  return RUN_ALL_TESTS();
}
