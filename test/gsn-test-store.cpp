/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-test-store.cpp
 * @brief The unit test for gsn-store module.
 */

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "gsn-store.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  gsn::Gsn_Store store{};

  EXPECT_TRUE(0 == store.size());
  EXPECT_TRUE(store.snapshot().empty());
  EXPECT_TRUE(!store.contains("5"));

  EXPECT_TRUE(store.record("5"));
  EXPECT_TRUE(store.contains("5"));
  EXPECT_TRUE(1 == store.size());

  // recording again is a no-op
  EXPECT_TRUE(!store.record("5"));
  EXPECT_TRUE(1 == store.size());

  EXPECT_TRUE(store.record("\"5\""));
  EXPECT_TRUE(store.record("{\"a\":1}"));
  EXPECT_TRUE(!store.record("\"5\""));

  auto snapshot = store.snapshot();
  EXPECT_TRUE(3 == snapshot.size());
  EXPECT_TRUE((std::set<gsn::Gsn_Value>{"5", "\"5\"", "{\"a\":1}"} == snapshot));

  // a snapshot is a copy, the store only grows
  EXPECT_TRUE(store.record("6"));
  EXPECT_TRUE(3 == snapshot.size());
  EXPECT_TRUE(4 == store.size());

  for (const auto &value : snapshot) {
    EXPECT_TRUE(store.contains(value));
  }

  return RUN_ALL_TESTS();
}
