/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-node.cpp
 * @brief Implementation of Gsn_Node, the gossip broadcast protocol handler.
 *
 * Every handle*() method runs in the node's Gsn_Async context. Values are
 * kept in their canonical JSON text (Gsn_Value) from the moment they are
 * decoded, so the store and the pending-ack table compare them by value.
 */

#include "gsn-node.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gsn-async.hpp"
#include "gsn-config.hpp"
#include "gsn-debug.hpp"
#include "gsn-dissemination.hpp"
#include "gsn-message-pb-util.hpp"
#include "gsn-proc.hpp"
#include "gsn-timer.hpp"
#include "gsn-topology.hpp"
#include "gsn-util.hpp"

namespace gsn {

Gsn_Node::Gsn_Node(std::string_view name,
                   std::shared_ptr<Gsn_Io<std::string>> input,
                   std::shared_ptr<Gsn_Io<std::string>> output,
                   Gsn_Node_Config config, InputClosedHandler on_input_closed)
    : Gsn_Async{name}, m_config{config}, m_input{std::move(input)},
      m_output{std::move(output)},
      m_on_input_closed{std::move(on_input_closed)},
      m_disseminator{m_topology,
                     [this](const std::string &neighbor,
                            const std::vector<Gsn_Value> &values) -> void {
                       this->sendGossip(neighbor, values);
                     },
                     config.m_retry_base, config.m_retry_max} {
  if (!m_output) {
    throw std::invalid_argument("Gsn_Node (" + getName() +
                                ") requires an output");
  }

  if (m_input) {
    m_input_proc = std::make_unique<Gsn_Proc>(
        getName() + "_input", [this]() -> void {
          while (true) {
            std::optional<std::string> line{};

            try {
              line = m_input->read();
            } catch (const std::runtime_error &e) {
              GSN_DEBUG_PRINT(std::cerr << getName()
                                        << ": input failed: " << e.what()
                                        << "\n");
            }

            if (!line) {
              break;
            }

            this->receive(std::move(*line));
          }

          // queued behind every line read so far
          GSN_ASYNC_CALL_WITH_CAPTURE(
              {
                GSN_DEBUG_PRINT(std::cerr << getName() << ": input closed\n");

                if (m_on_input_closed) {
                  m_on_input_closed();
                }
              },
              this);
        });

    if (!m_input_proc->exec()) {
      throw std::runtime_error("Failed to start input task of Gsn_Node (" +
                               getName() + ")");
    }
  }

  m_tick_timer = std::make_unique<Gsn_Timer<std::chrono::milliseconds>>(
      m_config.m_tick, [this]() -> void {
        GSN_ASYNC_CALL_WITH_CAPTURE({ this->tick(); }, this);
      });
}

Gsn_Node::~Gsn_Node() noexcept try {
  // no new task can be posted once both threads are gone
  m_tick_timer = {};
  m_input_proc = {};

  this->waitForEmpty();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

void Gsn_Node::receive(std::string line) {
  GSN_ASYNC_CALL_WITH_CAPTURE({ this->handleLine(line); }, this,
                              line = std::move(line));
}

auto Gsn_Node::snapshot() -> std::set<Gsn_Value> {
  std::set<Gsn_Value> values{};

  auto waiter = this->addExecTaskWithWait(
      [this, &values]() -> void { values = m_store.snapshot(); });
  waiter->wait();

  return values;
}

auto Gsn_Node::neighbors() -> std::set<std::string> {
  std::set<std::string> neighbors{};

  auto waiter = this->addExecTaskWithWait(
      [this, &neighbors]() -> void { neighbors = m_topology.neighbors(); });
  waiter->wait();

  return neighbors;
}

auto Gsn_Node::pendingCount() -> size_t {
  size_t count{};

  auto waiter = this->addExecTaskWithWait(
      [this, &count]() -> void { count = m_disseminator.pendingCount(); });
  waiter->wait();

  return count;
}

auto Gsn_Node::isInitialized() -> bool {
  bool initialized{};

  auto waiter = this->addExecTaskWithWait([this, &initialized]() -> void {
    initialized = m_state.m_initialized;
  });
  waiter->wait();

  return initialized;
}

auto Gsn_Node::nodeId() -> std::string {
  std::string id{};

  auto waiter =
      this->addExecTaskWithWait([this, &id]() -> void { id = m_state.m_id; });
  waiter->wait();

  return id;
}

void Gsn_Node::handleLine(const std::string &line) {
  auto request = decodeMessagePb(line);
  if (!request) {
    GSN_DEBUG_PRINT(std::cerr << getName() << ": drop undecodable input: "
                              << line << "\n");

    return;
  }

  if (hasInexactInteger(line)) {
    replyError(*request, Gsn_ErrorCode::kMalformedRequest,
               "integer beyond 2^53 has no exact value");

    return;
  }

  handleMessage(*request);
}

void Gsn_Node::handleMessage(const gsn::MessagePb &request) {
  const auto &body = request.body();
  const auto &type = body.type();

  if (type.empty()) {
    replyError(request, Gsn_ErrorCode::kMalformedRequest,
               "message body has no type");

    return;
  }

  if ("error" == type) {
    GSN_DEBUG_PRINT(std::cerr << getName() << ": error " << body.code()
                              << " from " << request.src() << ": "
                              << body.text() << "\n");

    return;
  }

  if ("init" == type) {
    handleInit(request);

    return;
  }

  if (!m_state.m_initialized) {
    replyError(request, Gsn_ErrorCode::kTemporarilyUnavailable,
               "node is not initialized yet");

    return;
  }

  try {
    if ("topology" == type) {
      handleTopology(request);
    } else if ("broadcast" == type) {
      handleBroadcast(request);
    } else if ("read" == type) {
      handleRead(request);
    } else if ("gossip" == type) {
      handleGossip(request);
    } else if ("gossip_ok" == type) {
      handleGossipOk(request);
    } else if (body.has_in_reply_to()) {
      GSN_DEBUG_PRINT(std::cerr << getName() << ": drop unexpected " << type
                                << " from " << request.src() << "\n");
    } else {
      replyError(request, Gsn_ErrorCode::kNotSupported,
                 "unsupported message type: " + type);
    }
  } catch (const std::runtime_error &e) {
    replyError(request, Gsn_ErrorCode::kMalformedRequest, e.what());
  }
}

void Gsn_Node::handleInit(const gsn::MessagePb &request) {
  const auto &body = request.body();

  if (body.node_id().empty()) {
    replyError(request, Gsn_ErrorCode::kMalformedRequest,
               "init without node_id");

    return;
  }

  if (m_state.m_initialized) {
    if (body.node_id() != m_state.m_id) {
      replyError(request, Gsn_ErrorCode::kPreconditionFailed,
                 "node is already initialized as " + m_state.m_id);

      return;
    }
  } else {
    m_state.m_id = body.node_id();
    m_state.m_roster.assign(body.node_ids().begin(), body.node_ids().end());
    m_state.m_initialized = true;

    GSN_DEBUG_PRINT(std::cerr << getName() << ": initialized as "
                              << m_state.m_id << " in a roster of "
                              << m_state.m_roster.size() << "\n");

    if (Gsn_Topology_Mode::kTree == m_config.m_topology_mode) {
      applyNeighbors(Gsn_Topology::spanningTree(
          m_state.m_roster, m_state.m_id, m_config.m_tree_fanout));
    }
  }

  gsn::MessagePb response{};
  GSN_MESSAGE_PB_SET_TYPE(response, "init_ok");

  reply(request, response);
}

void Gsn_Node::handleTopology(const gsn::MessagePb &request) {
  const auto &body = request.body();

  if (Gsn_Topology_Mode::kTree == m_config.m_topology_mode) {
    applyNeighbors(Gsn_Topology::spanningTree(m_state.m_roster, m_state.m_id,
                                              m_config.m_tree_fanout));
  } else {
    std::vector<std::string> neighbors{};

    auto iter = body.topology().find(m_state.m_id);
    if (body.topology().end() != iter) {
      for (const auto &node_pb : iter->second.values()) {
        if (google::protobuf::Value::kStringValue == node_pb.kind_case() &&
            node_pb.string_value() != m_state.m_id) {
          neighbors.push_back(node_pb.string_value());
        }
      }
    }

    applyNeighbors(neighbors);
  }

  gsn::MessagePb response{};
  GSN_MESSAGE_PB_SET_TYPE(response, "topology_ok");

  reply(request, response);
}

void Gsn_Node::handleBroadcast(const gsn::MessagePb &request) {
  auto values = messageBodyValues(request.body());
  if (values.empty()) {
    replyError(request, Gsn_ErrorCode::kMalformedRequest,
               "broadcast without message");

    return;
  }

  const auto now = Gsn_Disseminator::Clock::now();

  for (const auto &value : values) {
    if (m_store.record(value)) {
      m_disseminator.onNewValue(value, now);
    }
  }

  gsn::MessagePb response{};
  GSN_MESSAGE_PB_SET_TYPE(response, "broadcast_ok");

  reply(request, response);
}

void Gsn_Node::handleRead(const gsn::MessagePb &request) {
  auto known = m_store.snapshot();

  gsn::MessagePb response{};
  GSN_MESSAGE_PB_SET_TYPE(response, "read_ok");
  setMessageBodyValues(response.mutable_body(),
                       std::vector<Gsn_Value>{known.begin(), known.end()},
                       true);

  reply(request, response);
}

void Gsn_Node::handleGossip(const gsn::MessagePb &request) {
  const auto &from = request.src();
  auto values = messageBodyValues(request.body());
  const auto now = Gsn_Disseminator::Clock::now();

  for (const auto &value : values) {
    // the sender holds the value, a pending send to it is moot
    if (m_disseminator.isPending(from, value)) {
      m_disseminator.onAck(from, value);
    }

    if (m_store.record(value)) {
      m_disseminator.onNewValue(value, now, from);
    }
  }

  gsn::MessagePb response{};
  GSN_MESSAGE_PB_SET_TYPE(response, "gossip_ok");
  setMessageBodyValues(response.mutable_body(), values, true);

  reply(request, response);
}

void Gsn_Node::handleGossipOk(const gsn::MessagePb &request) {
  for (const auto &value : messageBodyValues(request.body())) {
    m_disseminator.onAck(request.src(), value);
  }
}

void Gsn_Node::applyNeighbors(const std::vector<std::string> &neighbors) {
  auto added = m_topology.setNeighbors(neighbors);

  GSN_DEBUG_PRINT(std::cerr << getName() << ": " << m_state.m_id << " has "
                            << m_topology.neighbors().size()
                            << " neighbor(s), " << added.size() << " new\n");

  if (!added.empty()) {
    m_disseminator.onNeighborsAdded(added, m_store.snapshot(),
                                    Gsn_Disseminator::Clock::now());
  }
}

void Gsn_Node::tick() {
  if (!m_state.m_initialized) {
    return;
  }

  auto resent = m_disseminator.tick(Gsn_Disseminator::Clock::now());
  if (resent > 0) {
    GSN_DEBUG_PRINT(std::cerr << getName() << ": resent " << resent
                              << " value(s), "
                              << m_disseminator.pendingCount()
                              << " pending\n");
  }
}

void Gsn_Node::reply(const gsn::MessagePb &request, gsn::MessagePb &response) {
  GSN_MESSAGE_PB_SET_SRC(response, m_state.m_initialized ? m_state.m_id
                                                         : request.dest());
  GSN_MESSAGE_PB_SET_DEST(response, request.src());
  GSN_MESSAGE_PB_SET_MSG_ID(response, nextMsgId());

  if (request.body().has_msg_id()) {
    GSN_MESSAGE_PB_SET_IN_REPLY_TO(response, request.body().msg_id());
  }

  send(response);
}

void Gsn_Node::replyError(const gsn::MessagePb &request, Gsn_ErrorCode code,
                          const std::string &text) {
  if (!request.body().has_msg_id()) {
    GSN_DEBUG_PRINT(std::cerr << getName() << ": drop message from "
                              << request.src() << ": " << text << "\n");

    return;
  }

  gsn::MessagePb response{};
  GSN_MESSAGE_PB_SET_ERROR(response, code, text);

  reply(request, response);
}

void Gsn_Node::sendGossip(const std::string &neighbor,
                          const std::vector<Gsn_Value> &values) {
  gsn::MessagePb pb{};

  GSN_MESSAGE_PB_SET_SRC(pb, m_state.m_id);
  GSN_MESSAGE_PB_SET_DEST(pb, neighbor);
  GSN_MESSAGE_PB_SET_TYPE(pb, "gossip");
  GSN_MESSAGE_PB_SET_MSG_ID(pb, nextMsgId());
  setMessageBodyValues(pb.mutable_body(), values);

  send(pb);
}

/**
 * @brief Write pb to the output. A failed write is only logged, the
 *        retransmission of pending values repairs it.
 */
void Gsn_Node::send(gsn::MessagePb &pb) {
  try {
    m_output->write(encodeMessagePb(pb));
  } catch (const std::runtime_error &e) {
    GSN_DEBUG_PRINT(std::cerr << getName() << ": send to " << pb.dest()
                              << " failed: " << e.what() << "\n");
  }
}

auto Gsn_Node::nextMsgId() -> std::uint32_t {
  m_msg_id = incrementByOne(m_msg_id);

  return m_msg_id;
}

} // namespace gsn
