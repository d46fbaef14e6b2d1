/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-config.hpp
 * @brief Node configuration: compile-time defaults and environment overrides.
 *
 * The defaults below can be overridden at build time (-DGSN_NODE_TICK_IN_MS=50)
 * and at run time through the environment:
 *
 *   GSN_TICK_MS        interval of the retransmission scan
 *   GSN_RETRY_BASE_MS  delay before the first retransmission
 *   GSN_RETRY_MAX_MS   upper bound of the retransmission delay
 *   GSN_TOPOLOGY       "harness" (use the topology message) or "tree"
 *   GSN_TREE_FANOUT    children per node when GSN_TOPOLOGY is "tree"
 */

#ifndef GSN_CONFIG_HPP_
#define GSN_CONFIG_HPP_

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#ifndef GSN_NODE_TICK_IN_MS
#define GSN_NODE_TICK_IN_MS (100)
#endif

#ifndef GSN_RETRY_BASE_IN_MS
#define GSN_RETRY_BASE_IN_MS (400)
#endif

#ifndef GSN_RETRY_MAX_IN_MS
#define GSN_RETRY_MAX_IN_MS (3200)
#endif

#ifndef GSN_TREE_FANOUT
#define GSN_TREE_FANOUT (4)
#endif

// upper bound of every interval and delay, 24 hours
#ifndef GSN_INTERVAL_MAX_IN_MS
#define GSN_INTERVAL_MAX_IN_MS (86400000)
#endif

namespace gsn {

enum class Gsn_Topology_Mode {
  kHarness,
  kTree,
};

struct Gsn_Node_Config {
  std::chrono::milliseconds m_tick{GSN_NODE_TICK_IN_MS};
  std::chrono::milliseconds m_retry_base{GSN_RETRY_BASE_IN_MS};
  std::chrono::milliseconds m_retry_max{GSN_RETRY_MAX_IN_MS};
  Gsn_Topology_Mode m_topology_mode{Gsn_Topology_Mode::kHarness};
  size_t m_tree_fanout{GSN_TREE_FANOUT};
};

/**
 * @brief Lookup of one configuration variable, absent if not set.
 */
using Gsn_Config_Source =
    std::function<std::optional<std::string>(std::string_view key)>;

/**
 * @brief Build the configuration from the defaults overridden by source.
 *
 * @param source Returns the value of a configuration key if it is set
 *
 * @return The configuration, or a message naming the offending key if a
 *         value is not a positive integer, an interval exceeds
 *         GSN_INTERVAL_MAX_IN_MS, the topology mode is unknown or the retry
 *         base exceeds the retry max.
 */
auto loadConfig(const Gsn_Config_Source &source)
    -> std::expected<Gsn_Node_Config, std::string>;

/**
 * @brief loadConfig() over the process environment.
 */
auto loadConfigFromEnv() -> std::expected<Gsn_Node_Config, std::string>;

} // namespace gsn

#endif // GSN_CONFIG_HPP_
