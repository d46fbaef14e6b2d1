/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-test-pipe.cpp
 * @brief The unit test for gsn-pipe module.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "gsn-pipe.hpp"
#include "gsn-proc.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  // consumer mode, items are handed over in batches of 3
  bool readDoneOnce{};
  int cnt{};
  gsn::Gsn_Pipe<int> pipe{"pipe",
                          [&cnt, &readDoneOnce](int val) {
                            EXPECT_TRUE(val == cnt);

                            cnt++;
                            readDoneOnce = true;
                          },
                          3};

  gsn::Gsn_Proc::yield();

  pipe.write(0);
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  EXPECT_TRUE(!readDoneOnce);

  pipe.write(1);
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  EXPECT_TRUE(!readDoneOnce);

  pipe.write(2);
  pipe.waitForEmpty();
  EXPECT_TRUE(readDoneOnce);
  EXPECT_TRUE(3 == cnt);

  // passive mode, the pipe is an in-memory transport
  gsn::Gsn_Pipe<std::string> transport{"transport"};

  std::string first{"first"};
  transport.write(first);
  EXPECT_TRUE("first" == first);

  transport.write(std::string{"second"});
  transport.write(std::string{"third"});

  auto line = transport.read();
  EXPECT_TRUE(line);
  EXPECT_TRUE("first" == *line);

  auto lines = transport.read(2);
  EXPECT_TRUE(2 == lines.size());
  EXPECT_TRUE("second" == lines[0]);
  EXPECT_TRUE("third" == lines[1]);

  // a reader blocked on an empty pipe gets the next write
  std::string readData{};
  gsn::Gsn_Proc readProc{"readProc", [&transport, &readData]() {
                           auto data = transport.read();
                           if (data) {
                             readData = std::move_if_noexcept(*data);
                           }
                         }};

  readProc.exec();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  transport.write(std::string{"hello pipe"});
  readProc.wait();

  EXPECT_TRUE("hello pipe" == readData);

  // after the timeout a partial batch is returned
  transport.write(std::string{"only one"});
  lines = transport.read(5, 100000);
  EXPECT_TRUE(1 == lines.size());
  EXPECT_TRUE("only one" == lines[0]);

  return RUN_ALL_TESTS();
}
