/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-test-stdio.cpp
 * @brief The unit test for gsn-stdio module.
 */

#include <gtest/gtest.h>

#include <unistd.h>

#include <array>
#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

#include "gsn-proc.hpp"
#include "gsn-stdio.hpp"

static void writeRaw(int fd, std::string_view data) {
  EXPECT_TRUE(static_cast<ssize_t>(data.size()) ==
              ::write(fd, data.data(), data.size()));
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  std::array<int, 2> inFds{};
  std::array<int, 2> outFds{};

  EXPECT_TRUE(0 == pipe(inFds.data()));
  EXPECT_TRUE(0 == pipe(outFds.data()));

  {
    gsn::Gsn_Stdio stdio{inFds[0], outFds[1], true};

    // lines split across writes, CRLF and a last line without newline
    writeRaw(inFds[1], "{\"src\":\"c1\"}\n{\"sr");
    writeRaw(inFds[1], "c\":\"c2\"}\r\n\n");

    auto line = stdio.read();
    EXPECT_TRUE(line);
    EXPECT_TRUE("{\"src\":\"c1\"}" == *line);

    line = stdio.read();
    EXPECT_TRUE(line);
    EXPECT_TRUE("{\"src\":\"c2\"}" == *line);

    line = stdio.read();
    EXPECT_TRUE(line);
    EXPECT_TRUE(line->empty());

    // a reader blocked in read(2) is woken up by the next line
    std::string readData{};
    gsn::Gsn_Proc readProc{"readProc", [&stdio, &readData]() {
                             auto data = stdio.read();
                             if (data) {
                               readData = std::move_if_noexcept(*data);
                             }
                           }};

    readProc.exec();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    writeRaw(inFds[1], "hello stdio\n");
    readProc.wait();
    EXPECT_TRUE("hello stdio" == readData);

    writeRaw(inFds[1], "last");
    close(inFds[1]);

    line = stdio.read();
    EXPECT_TRUE(line);
    EXPECT_TRUE("last" == *line);

    line = stdio.read();
    EXPECT_TRUE(!line);

    line = stdio.read();
    EXPECT_TRUE(!line);

    std::string out{"{\"dest\":\"c1\"}"};
    stdio.write(out);
    stdio.write(std::string{"second"});

    std::array<char, 64> buf{};
    std::string written{};

    while (written.size() < out.size() + 1 + 7) {
      ssize_t n = ::read(outFds[0], buf.data(), buf.size());
      EXPECT_TRUE(n > 0);
      if (n <= 0) {
        break;
      }

      written.append(buf.data(), n);
    }

    EXPECT_TRUE("{\"dest\":\"c1\"}\nsecond\n" == written);
  }

  // the write end is closed with the Gsn_Stdio
  std::array<char, 8> buf{};
  EXPECT_TRUE(0 == ::read(outFds[0], buf.data(), buf.size()));
  close(outFds[0]);

  return RUN_ALL_TESTS();
}
