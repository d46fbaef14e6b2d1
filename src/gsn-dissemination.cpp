/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-dissemination.cpp
 * @brief Implementation of Gsn_Disseminator.
 */

#include "gsn-dissemination.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "gsn-config.hpp"
#include "gsn-debug.hpp"

namespace gsn {

namespace {

// 2^16 times the base delay is well past any sensible cap
constexpr long long kMaxBackoffExponent = 16;

// keeps now + delay far from the range of the clock
constexpr std::chrono::milliseconds kMaxRetryDelay{GSN_INTERVAL_MAX_IN_MS};

} // namespace

Gsn_Disseminator::Gsn_Disseminator(const Gsn_Topology &topology,
                                   SendTask send,
                                   std::chrono::milliseconds retry_base,
                                   std::chrono::milliseconds retry_max)
    : m_topology{topology}, m_send{std::move(send)},
      m_retry_base{std::clamp(retry_base, std::chrono::milliseconds{1},
                              kMaxRetryDelay)},
      m_retry_max{std::clamp(retry_max, m_retry_base, kMaxRetryDelay)} {}

auto Gsn_Disseminator::retryDelay(long long attempts) const
    -> std::chrono::milliseconds {
  const long long exponent =
      std::clamp<long long>(attempts, 0, kMaxBackoffExponent);
  const long long factor = 1LL << exponent;

  // base * factor would pass the cap, do not compute it
  if (m_retry_base.count() > m_retry_max.count() / factor) {
    return m_retry_max;
  }

  return std::min<std::chrono::milliseconds>(m_retry_base * factor, m_retry_max);
}

auto Gsn_Disseminator::schedule(const std::string &neighbor,
                                const Gsn_Value &value, TimePoint now)
    -> bool {
  auto [iter, inserted] = m_pending.try_emplace(Key{neighbor, value});
  if (inserted) {
    iter->second.m_attempts = 0;
    iter->second.m_deadline = now + retryDelay(0);
  }

  return inserted;
}

void Gsn_Disseminator::onNewValue(const Gsn_Value &value, TimePoint now,
                                  const std::string &from) {
  for (const auto &neighbor : m_topology.neighbors()) {
    if (neighbor == from) {
      continue;
    }

    if (schedule(neighbor, value, now)) {
      m_send(neighbor, {value});
    }
  }
}

auto Gsn_Disseminator::onAck(const std::string &neighbor,
                             const Gsn_Value &value) -> bool {
  auto erased = m_pending.erase(Key{neighbor, value});
  if (0 == erased) {
    GSN_DEBUG_PRINT(std::cerr << "ack of " << value << " from " << neighbor
                              << " has no pending entry\n");

    return false;
  }

  return true;
}

void Gsn_Disseminator::onNeighborsAdded(const std::vector<std::string> &added,
                                        const std::set<Gsn_Value> &values,
                                        TimePoint now) {
  for (const auto &neighbor : added) {
    std::vector<Gsn_Value> batch{};

    for (const auto &value : values) {
      if (schedule(neighbor, value, now)) {
        batch.push_back(value);
      }
    }

    if (!batch.empty()) {
      m_send(neighbor, batch);
    }
  }
}

auto Gsn_Disseminator::tick(TimePoint now) -> size_t {
  std::map<std::string, std::vector<Gsn_Value>> due{};
  size_t resent{};

  for (auto &[key, pending] : m_pending) {
    if (pending.m_deadline > now) {
      continue;
    }

    pending.m_attempts++;
    pending.m_deadline = now + retryDelay(pending.m_attempts);

    due[key.first].push_back(key.second);
    resent++;
  }

  for (const auto &[neighbor, batch] : due) {
    m_send(neighbor, batch);
  }

  return resent;
}

auto Gsn_Disseminator::pendingCount() const -> size_t {
  return m_pending.size();
}

auto Gsn_Disseminator::isPending(const std::string &neighbor,
                                 const Gsn_Value &value) const -> bool {
  return m_pending.contains(Key{neighbor, value});
}

auto Gsn_Disseminator::attempts(const std::string &neighbor,
                                const Gsn_Value &value) const
    -> std::optional<long long> {
  auto iter = m_pending.find(Key{neighbor, value});
  if (m_pending.end() == iter) {
    return {};
  }

  return iter->second.m_attempts;
}

} // namespace gsn
