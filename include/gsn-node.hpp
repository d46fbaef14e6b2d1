/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-node.hpp
 * @brief Gsn_Node: protocol handler of a gossip broadcast node.
 *
 * A Gsn_Node reads JSON envelopes from an input Gsn_Io<std::string>, applies
 * them to its state and writes replies and gossip to an output
 * Gsn_Io<std::string>. It owns:
 * - Gsn_Node_State, the identity and roster assigned by init,
 * - Gsn_Store, the known set,
 * - Gsn_Topology, the neighbor set,
 * - Gsn_Disseminator, the pending-ack table and its retry schedule,
 * - an input thread (Gsn_Proc) and a tick timer (Gsn_Timer).
 *
 * The input thread and the timer never touch that state: they post tasks into
 * the node's Gsn_Async context, so inbound messages and ticks are applied one
 * at a time in arrival order by a single thread.
 *
 * Message handling:
 *
 *   init       assign id and roster                    init_ok
 *   topology   replace the neighbor set                topology_ok
 *   broadcast  record, gossip if new                   broadcast_ok
 *   read       known set                               read_ok {messages}
 *   gossip     record each value, gossip new ones on   gossip_ok {messages}
 *   gossip_ok  clear the pending entries it acks       -
 *
 * Requests before init get error 11, unknown request types error 10, a body
 * without type or holding an integer a double can not represent exactly
 * error 12, and a second init with another node id error 22.
 * Nothing without msg_id is answered with an error, inbound error bodies and
 * replies other than gossip_ok are logged and dropped.
 *
 * The introspection methods run in the Gsn_Async context and wait for it, so
 * they must not be called from a task of the same node.
 */

#ifndef GSN_NODE_HPP_
#define GSN_NODE_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "gsn-async.hpp"
#include "gsn-config.hpp"
#include "gsn-dissemination.hpp"
#include "gsn-io.hpp"
#include "gsn-message-pb-util.hpp"
#include "gsn-proc.hpp"
#include "gsn-store.hpp"
#include "gsn-timer.hpp"
#include "gsn-topology.hpp"

namespace gsn {

struct Gsn_Node_State {
  std::string m_id{};
  std::vector<std::string> m_roster{};
  bool m_initialized{};
};

class Gsn_Node : public Gsn_Async {
  using InputClosedHandler = std::function<void()>;

public:
  /**
   * @brief Construct a Gsn_Node and start reading input.
   *
   * @param name            Name used in diagnostics
   * @param input           Source of inbound envelopes, one per read()
   * @param output          Sink of outbound envelopes, one per write()
   * @param config          Tick interval, retry backoff and topology mode
   * @param on_input_closed Called in the node's context once input reached
   *                        end of stream and every earlier line was handled
   */
  Gsn_Node(std::string_view name,
           std::shared_ptr<Gsn_Io<std::string>> input,
           std::shared_ptr<Gsn_Io<std::string>> output,
           Gsn_Node_Config config = {},
           InputClosedHandler on_input_closed = {});
  virtual ~Gsn_Node() noexcept;

  Gsn_Node(const Gsn_Node &obj) = delete;
  const Gsn_Node &operator=(const Gsn_Node &obj) = delete;
  Gsn_Node(Gsn_Node &&obj) = delete;
  Gsn_Node &operator=(Gsn_Node &&obj) = delete;

  /**
   * @brief Post one inbound line to the node, as if read from input.
   */
  void receive(std::string line);

  auto snapshot() -> std::set<Gsn_Value>;
  auto neighbors() -> std::set<std::string>;
  auto pendingCount() -> size_t;
  auto isInitialized() -> bool;
  auto nodeId() -> std::string;

private:
  void handleLine(const std::string &line);
  void handleMessage(const gsn::MessagePb &request);

  void handleInit(const gsn::MessagePb &request);
  void handleTopology(const gsn::MessagePb &request);
  void handleBroadcast(const gsn::MessagePb &request);
  void handleRead(const gsn::MessagePb &request);
  void handleGossip(const gsn::MessagePb &request);
  void handleGossipOk(const gsn::MessagePb &request);

  void applyNeighbors(const std::vector<std::string> &neighbors);
  void tick();

  void reply(const gsn::MessagePb &request, gsn::MessagePb &response);
  void replyError(const gsn::MessagePb &request, Gsn_ErrorCode code,
                  const std::string &text);
  void sendGossip(const std::string &neighbor,
                  const std::vector<Gsn_Value> &values);
  void send(gsn::MessagePb &pb);

  auto nextMsgId() -> std::uint32_t;

  Gsn_Node_Config m_config{};
  std::shared_ptr<Gsn_Io<std::string>> m_input{};
  std::shared_ptr<Gsn_Io<std::string>> m_output{};
  InputClosedHandler m_on_input_closed{};

  Gsn_Node_State m_state{};
  Gsn_Store m_store{};
  Gsn_Topology m_topology{};
  Gsn_Disseminator m_disseminator;
  std::uint32_t m_msg_id{};

  std::unique_ptr<Gsn_Proc> m_input_proc{};
  std::unique_ptr<Gsn_Timer<std::chrono::milliseconds>> m_tick_timer{};
}; // class Gsn_Node

} // namespace gsn

#endif // GSN_NODE_HPP_
