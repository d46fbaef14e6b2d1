/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-dissemination.hpp
 * @brief Gsn_Disseminator: push every known value to every neighbor and
 *        retry until each neighbor acknowledged it.
 *
 * State is a pending-ack table keyed by (neighbor, value). An entry exists
 * from the moment a value is first sent to a neighbor until that neighbor
 * acknowledges it, and holds an attempt counter and the deadline of the next
 * retransmission. The table is scanned on every tick() instead of keeping one
 * timer per entry, so a partitioned link costs one entry per value and never
 * more, however long the partition lasts.
 *
 * Dissemination rules:
 * - onNewValue(): a value the store recorded for the first time is sent right
 *   away to every current neighbor that has no entry for it yet (skipping the
 *   neighbor it came from).
 * - onAck(): removes the entry, unknown or repeated acks are ignored.
 * - tick(): every entry whose deadline passed is resent and rescheduled. Due
 *   entries of one neighbor go out as a single batch. There is no attempt
 *   limit, a value is retried until the link heals.
 * - onNeighborsAdded(): a neighbor that joins the neighbor set receives every
 *   value known at that point, so values recorded before the topology arrived
 *   still reach it.
 *
 * Retry deadlines follow a capped exponential backoff,
 *   retryDelay(attempts) = min(retry_base * 2^attempts, retry_max),
 * which never decreases with the attempt count. The first deadline after the
 * initial send is now + retryDelay(0).
 *
 * Entries of a neighbor that was later dropped from the topology are kept and
 * retried: the peer still exists and is still addressable.
 *
 * Not thread-safe. Gsn_Node calls it from its serialized context only, and
 * the send task is invoked synchronously from within these calls.
 */

#ifndef GSN_DISSEMINATION_HPP_
#define GSN_DISSEMINATION_HPP_

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "gsn-message-pb-util.hpp"
#include "gsn-topology.hpp"

namespace gsn {

class Gsn_Disseminator {
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using SendTask = std::function<void(const std::string &neighbor,
                                      const std::vector<Gsn_Value> &values)>;

  struct Gsn_Pending_Ack {
    long long m_attempts{};
    TimePoint m_deadline{};
  };

  /**
   * @brief Gsn_Disseminator constructor.
   *
   * @param topology   The neighbor set, read at every fan out
   * @param send       Sends one gossip message carrying values to neighbor
   * @param retry_base Delay before the first retransmission
   * @param retry_max  Upper bound of the retransmission delay
   *
   * Both delays are clamped to [1ms, GSN_INTERVAL_MAX_IN_MS] and retry_max to
   * at least retry_base.
   */
  Gsn_Disseminator(const Gsn_Topology &topology, SendTask send,
                   std::chrono::milliseconds retry_base,
                   std::chrono::milliseconds retry_max);
  virtual ~Gsn_Disseminator() noexcept = default;

  Gsn_Disseminator(const Gsn_Disseminator &obj) = delete;
  const Gsn_Disseminator &operator=(const Gsn_Disseminator &obj) = delete;
  Gsn_Disseminator(Gsn_Disseminator &&obj) = delete;
  Gsn_Disseminator &operator=(Gsn_Disseminator &&obj) = delete;

  /**
   * @brief Send a newly recorded value to the current neighbors.
   *
   * @param value The value just recorded by the store
   * @param now   Current time
   * @param from  The node the value was received from, not sent back to it;
   *              empty for a client broadcast
   */
  void onNewValue(const Gsn_Value &value, TimePoint now,
                  const std::string &from = {});

  /**
   * @brief Neighbor acknowledged value.
   *
   * @return true if a pending entry was removed.
   */
  auto onAck(const std::string &neighbor, const Gsn_Value &value) -> bool;

  /**
   * @brief Queue and send every value to every neighbor in added that has
   *        no entry for it yet, one batch per neighbor.
   */
  void onNeighborsAdded(const std::vector<std::string> &added,
                        const std::set<Gsn_Value> &values, TimePoint now);

  /**
   * @brief Resend every entry whose deadline is at or before now.
   *
   * @return The number of entries resent.
   */
  auto tick(TimePoint now) -> size_t;

  auto retryDelay(long long attempts) const -> std::chrono::milliseconds;

  auto pendingCount() const -> size_t;
  auto isPending(const std::string &neighbor, const Gsn_Value &value) const
      -> bool;
  auto attempts(const std::string &neighbor, const Gsn_Value &value) const
      -> std::optional<long long>;

private:
  using Key = std::pair<std::string, Gsn_Value>;

  /**
   * @brief Create the entry for (neighbor, value) unless it exists.
   *
   * @return true if a new entry was created.
   */
  auto schedule(const std::string &neighbor, const Gsn_Value &value,
                TimePoint now) -> bool;

  const Gsn_Topology &m_topology;
  SendTask m_send{};
  std::chrono::milliseconds m_retry_base{};
  std::chrono::milliseconds m_retry_max{};

  std::map<Key, Gsn_Pending_Ack> m_pending{};
}; // class Gsn_Disseminator

} // namespace gsn

#endif // GSN_DISSEMINATION_HPP_
