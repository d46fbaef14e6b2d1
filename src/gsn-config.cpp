/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-config.cpp
 * @brief Parsing of the node configuration.
 */

#include "gsn-config.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "gsn-util.hpp"

namespace gsn {

namespace {

auto parsePositive(const Gsn_Config_Source &source, std::string_view key,
                   long long default_value, long long max_value)
    -> std::expected<long long, std::string> {
  auto value = source(key);
  if (!value) {
    return default_value;
  }

  long long number{};
  const char *first = value->data();
  const char *last = value->data() + value->size();

  auto [ptr, ec] = std::from_chars(first, last, number);
  if (ec != std::errc{} || ptr != last || number <= 0) {
    return std::unexpected(std::string{key} + ": \"" + *value +
                           "\" is not a positive integer");
  }

  if (number > max_value) {
    return std::unexpected(std::string{key} + ": " + std::to_string(number) +
                           " exceeds " + std::to_string(max_value));
  }

  return number;
}

} // namespace

auto loadConfig(const Gsn_Config_Source &source)
    -> std::expected<Gsn_Node_Config, std::string> {
  Gsn_Node_Config config{};

  auto tick = parsePositive(source, "GSN_TICK_MS", config.m_tick.count(),
                            GSN_INTERVAL_MAX_IN_MS);
  if (!tick) {
    return std::unexpected(tick.error());
  }

  auto retry_base =
      parsePositive(source, "GSN_RETRY_BASE_MS",
                    config.m_retry_base.count(), GSN_INTERVAL_MAX_IN_MS);
  if (!retry_base) {
    return std::unexpected(retry_base.error());
  }

  auto retry_max =
      parsePositive(source, "GSN_RETRY_MAX_MS",
                    config.m_retry_max.count(), GSN_INTERVAL_MAX_IN_MS);
  if (!retry_max) {
    return std::unexpected(retry_max.error());
  }

  if (*retry_base > *retry_max) {
    return std::unexpected("GSN_RETRY_BASE_MS (" + std::to_string(*retry_base) +
                           ") exceeds GSN_RETRY_MAX_MS (" +
                           std::to_string(*retry_max) + ")");
  }

  auto fanout = parsePositive(source, "GSN_TREE_FANOUT",
                              static_cast<long long>(config.m_tree_fanout),
                              std::numeric_limits<int>::max());
  if (!fanout) {
    return std::unexpected(fanout.error());
  }

  auto mode = source("GSN_TOPOLOGY");
  if (mode) {
    if (stringCompare(*mode, "harness")) {
      config.m_topology_mode = Gsn_Topology_Mode::kHarness;
    } else if (stringCompare(*mode, "tree")) {
      config.m_topology_mode = Gsn_Topology_Mode::kTree;
    } else {
      return std::unexpected("GSN_TOPOLOGY: \"" + *mode +
                             "\" is neither harness nor tree");
    }
  }

  config.m_tick = std::chrono::milliseconds{*tick};
  config.m_retry_base = std::chrono::milliseconds{*retry_base};
  config.m_retry_max = std::chrono::milliseconds{*retry_max};
  config.m_tree_fanout = static_cast<size_t>(*fanout);

  return config;
}

auto loadConfigFromEnv() -> std::expected<Gsn_Node_Config, std::string> {
  return loadConfig([](std::string_view key) -> std::optional<std::string> {
    const std::string name{key};

    const char *value = std::getenv(name.c_str());
    if (nullptr == value) {
      return {};
    }

    return std::string{value};
  });
}

} // namespace gsn
