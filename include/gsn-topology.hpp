/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-topology.hpp
 * @brief Gsn_Topology: the neighbor set this node gossips to.
 *
 * The neighbor set is replaced as a whole by setNeighbors(), never edited in
 * place, and starts empty: a node that never receives a topology stores and
 * serves values but does not propagate them. The dissemination engine reads
 * neighbors() at the time of every fan out, it never caches the set.
 *
 * spanningTree() computes an alternative adjacency locally: a k-ary tree over
 * the sorted roster, which every node derives identically without
 * coordination. Each node gossips to its parent and its children only, so a
 * value crosses every tree edge once in each direction it needs to travel.
 *
 * Not thread-safe, owned by Gsn_Node.
 */

#ifndef GSN_TOPOLOGY_HPP_
#define GSN_TOPOLOGY_HPP_

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gsn {

class Gsn_Topology {
public:
  Gsn_Topology() = default;
  virtual ~Gsn_Topology() noexcept = default;

  Gsn_Topology(const Gsn_Topology &obj) = delete;
  const Gsn_Topology &operator=(const Gsn_Topology &obj) = delete;
  Gsn_Topology(Gsn_Topology &&obj) = delete;
  Gsn_Topology &operator=(Gsn_Topology &&obj) = delete;

  /**
   * @brief Replace the neighbor set.
   *
   * @param neighbors The new neighbor ids, duplicates are collapsed
   * @return The ids that are neighbors now but were not before the call, in
   *         ascending order.
   */
  auto setNeighbors(const std::vector<std::string> &neighbors)
      -> std::vector<std::string>;

  auto neighbors() const -> const std::set<std::string> &;

  auto isNeighbor(const std::string &node) const -> bool;

  /**
   * @brief Neighbors of self in a fanout-ary tree laid over the sorted roster:
   *        its parent (unless self is the root) and its children.
   *
   * @param roster Every node id of the run
   * @param self   This node's id
   * @param fanout Children per tree node, at least 1
   * @return The neighbor ids, empty if self is not in the roster.
   */
  static auto spanningTree(std::vector<std::string> roster,
                           std::string_view self, size_t fanout)
      -> std::vector<std::string>;

private:
  std::set<std::string> m_neighbors{};
}; // class Gsn_Topology

} // namespace gsn

#endif // GSN_TOPOLOGY_HPP_
