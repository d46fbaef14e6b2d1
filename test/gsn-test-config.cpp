/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-test-config.cpp
 * @brief The unit test for gsn-config module.
 */

#include <gtest/gtest.h>

#include <stdlib.h>

#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "gsn-config.hpp"

static auto mapSource(std::map<std::string, std::string> values)
    -> gsn::Gsn_Config_Source {
  return [values](std::string_view key) -> std::optional<std::string> {
    auto iter = values.find(std::string{key});
    if (values.end() == iter) {
      return {};
    }

    return iter->second;
  };
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  auto config = gsn::loadConfig(mapSource({}));
  EXPECT_TRUE(config);
  EXPECT_TRUE(std::chrono::milliseconds(GSN_NODE_TICK_IN_MS) == config->m_tick);
  EXPECT_TRUE(std::chrono::milliseconds(400) == config->m_retry_base);
  EXPECT_TRUE(std::chrono::milliseconds(3200) == config->m_retry_max);
  EXPECT_TRUE(gsn::Gsn_Topology_Mode::kHarness == config->m_topology_mode);
  EXPECT_TRUE(4 == config->m_tree_fanout);

  config = gsn::loadConfig(mapSource({{"GSN_TICK_MS", "25"},
                                      {"GSN_RETRY_BASE_MS", "50"},
                                      {"GSN_RETRY_MAX_MS", "50"},
                                      {"GSN_TOPOLOGY", "Tree"},
                                      {"GSN_TREE_FANOUT", "2"}}));
  EXPECT_TRUE(config);
  EXPECT_TRUE(std::chrono::milliseconds(25) == config->m_tick);
  EXPECT_TRUE(std::chrono::milliseconds(50) == config->m_retry_base);
  EXPECT_TRUE(std::chrono::milliseconds(50) == config->m_retry_max);
  EXPECT_TRUE(gsn::Gsn_Topology_Mode::kTree == config->m_topology_mode);
  EXPECT_TRUE(2 == config->m_tree_fanout);

  config = gsn::loadConfig(mapSource({{"GSN_TOPOLOGY", "HARNESS"}}));
  EXPECT_TRUE(config);
  EXPECT_TRUE(gsn::Gsn_Topology_Mode::kHarness == config->m_topology_mode);

  config = gsn::loadConfig(mapSource({{"GSN_TICK_MS", "abc"}}));
  EXPECT_TRUE(!config);
  std::cout << config.error() << "\n";
  EXPECT_TRUE(std::string::npos != config.error().find("GSN_TICK_MS"));

  config = gsn::loadConfig(mapSource({{"GSN_TICK_MS", "0"}}));
  EXPECT_TRUE(!config);

  config = gsn::loadConfig(mapSource({{"GSN_RETRY_MAX_MS", "-5"}}));
  EXPECT_TRUE(!config);

  config = gsn::loadConfig(mapSource({{"GSN_RETRY_BASE_MS", "10ms"}}));
  EXPECT_TRUE(!config);

  config = gsn::loadConfig(mapSource({{"GSN_RETRY_BASE_MS", "5000"}}));
  EXPECT_TRUE(!config);
  std::cout << config.error() << "\n";
  EXPECT_TRUE(std::string::npos != config.error().find("GSN_RETRY_MAX_MS"));

  // intervals are bounded by a day
  config = gsn::loadConfig(mapSource({{"GSN_RETRY_BASE_MS", "1000000000000000"},
                                      {"GSN_RETRY_MAX_MS", "1000000000000000"}}));
  EXPECT_TRUE(!config);
  std::cout << config.error() << "\n";
  EXPECT_TRUE(std::string::npos != config.error().find("GSN_RETRY_BASE_MS"));

  config = gsn::loadConfig(mapSource({{"GSN_RETRY_MAX_MS", "86400001"}}));
  EXPECT_TRUE(!config);
  EXPECT_TRUE(std::string::npos != config.error().find("GSN_RETRY_MAX_MS"));

  config = gsn::loadConfig(mapSource({{"GSN_TICK_MS", "99999999999"}}));
  EXPECT_TRUE(!config);
  EXPECT_TRUE(std::string::npos != config.error().find("GSN_TICK_MS"));

  config = gsn::loadConfig(mapSource({{"GSN_RETRY_MAX_MS", "86400000"}}));
  EXPECT_TRUE(config);
  EXPECT_TRUE(std::chrono::hours(24) == config->m_retry_max);

  config = gsn::loadConfig(mapSource({{"GSN_TOPOLOGY", "ring"}}));
  EXPECT_TRUE(!config);

  config = gsn::loadConfig(mapSource({{"GSN_TREE_FANOUT", "0"}}));
  EXPECT_TRUE(!config);

  // the process environment
  setenv("GSN_TICK_MS", "42", 1);
  setenv("GSN_TOPOLOGY", "tree", 1);

  config = gsn::loadConfigFromEnv();
  EXPECT_TRUE(config);
  EXPECT_TRUE(std::chrono::milliseconds(42) == config->m_tick);
  EXPECT_TRUE(gsn::Gsn_Topology_Mode::kTree == config->m_topology_mode);

  setenv("GSN_RETRY_MAX_MS", "nope", 1);
  EXPECT_TRUE(!gsn::loadConfigFromEnv());

  unsetenv("GSN_TICK_MS");
  unsetenv("GSN_TOPOLOGY");
  unsetenv("GSN_RETRY_MAX_MS");

  return RUN_ALL_TESTS();
}
