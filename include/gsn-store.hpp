/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-store.hpp
 * @brief Gsn_Store: the set of broadcast values known to this node.
 *
 * The store is append-only for the life of the process: record() inserts a
 * value once and reports whether it was new, so that the caller fans out only
 * the first copy of a value and every duplicate (retransmission, second path)
 * is absorbed here. Nothing is ever removed.
 *
 * Gsn_Store is not thread-safe, it is owned by Gsn_Node and only touched from
 * the node's serialized context.
 */

#ifndef GSN_STORE_HPP_
#define GSN_STORE_HPP_

#include <set>
#include <unordered_set>

#include "gsn-message-pb-util.hpp"

namespace gsn {

class Gsn_Store {
public:
  Gsn_Store() = default;
  virtual ~Gsn_Store() noexcept = default;

  Gsn_Store(const Gsn_Store &obj) = delete;
  const Gsn_Store &operator=(const Gsn_Store &obj) = delete;
  Gsn_Store(Gsn_Store &&obj) = delete;
  Gsn_Store &operator=(Gsn_Store &&obj) = delete;

  /**
   * @brief Insert value if absent.
   *
   * @param value The value to insert
   * @return true if value was not known before the call.
   */
  auto record(const Gsn_Value &value) -> bool;

  auto contains(const Gsn_Value &value) const -> bool;

  /**
   * @brief The full known set, ordered by canonical text.
   */
  auto snapshot() const -> std::set<Gsn_Value>;

  auto size() const -> size_t;

private:
  std::unordered_set<Gsn_Value> m_values{};
}; // class Gsn_Store

} // namespace gsn

#endif // GSN_STORE_HPP_
