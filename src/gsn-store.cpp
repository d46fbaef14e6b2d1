/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-store.cpp
 * @brief Implementation of Gsn_Store.
 */

#include "gsn-store.hpp"

#include <set>

namespace gsn {

auto Gsn_Store::record(const Gsn_Value &value) -> bool {
  return m_values.insert(value).second;
}

auto Gsn_Store::contains(const Gsn_Value &value) const -> bool {
  return m_values.contains(value);
}

auto Gsn_Store::snapshot() const -> std::set<Gsn_Value> {
  return {m_values.begin(), m_values.end()};
}

auto Gsn_Store::size() const -> size_t { return m_values.size(); }

} // namespace gsn
