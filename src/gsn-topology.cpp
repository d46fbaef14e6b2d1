/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-topology.cpp
 * @brief Implementation of Gsn_Topology.
 */

#include "gsn-topology.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gsn {

auto Gsn_Topology::setNeighbors(const std::vector<std::string> &neighbors)
    -> std::vector<std::string> {
  std::set<std::string> new_neighbors{neighbors.begin(), neighbors.end()};
  std::vector<std::string> added{};

  std::set_difference(new_neighbors.begin(), new_neighbors.end(),
                      m_neighbors.begin(), m_neighbors.end(),
                      std::back_inserter(added));

  m_neighbors = std::move(new_neighbors);

  return added;
}

auto Gsn_Topology::neighbors() const -> const std::set<std::string> & {
  return m_neighbors;
}

auto Gsn_Topology::isNeighbor(const std::string &node) const -> bool {
  return m_neighbors.contains(node);
}

auto Gsn_Topology::spanningTree(std::vector<std::string> roster,
                                std::string_view self, size_t fanout)
    -> std::vector<std::string> {
  std::vector<std::string> tree_neighbors{};

  std::sort(roster.begin(), roster.end());
  roster.erase(std::unique(roster.begin(), roster.end()), roster.end());

  auto iter = std::find(roster.begin(), roster.end(), self);
  if (roster.end() == iter) {
    return tree_neighbors;
  }

  fanout = std::max<size_t>(1, fanout);

  const auto index = static_cast<size_t>(std::distance(roster.begin(), iter));

  if (index > 0) {
    tree_neighbors.push_back(roster[(index - 1) / fanout]);
  }

  for (size_t child = index * fanout + 1;
       child <= index * fanout + fanout && child < roster.size(); child++) {
    tree_neighbors.push_back(roster[child]);
  }

  return tree_neighbors;
}

} // namespace gsn
