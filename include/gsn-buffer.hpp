/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-buffer.hpp
 * @brief Thread-safe unbounded FIFO used to hand items between threads.
 *
 * Gsn_Buffer<T> is the queue under every event path of a gossip node: the
 * serialized executor (Gsn_Async) and the in-process transport used in tests
 * (Gsn_Pipe) both sit on top of it.
 *
 * - push() never blocks.
 * - pop() blocks until an item is available.
 * - pop(count, timeout) returns exactly count items, or, once timeout
 *   microseconds have elapsed with at least one item queued, whatever is
 *   queued (1..count). With an empty queue the deadline is re-armed, so the
 *   call never returns an empty vector. timeout 0 means wait forever.
 * - popNoWait() returns std::nullopt on an empty queue.
 * - waitForEmpty() blocks until every pushed item has been popped and returns
 *   the number of items that went through the buffer.
 *
 * All blocking calls are pthread cancellation points; the mutex is released by
 * a cleanup handler if the waiting thread is cancelled. pthread failures are
 * thrown as std::runtime_error.
 */

#ifndef GSN_BUFFER_HPP_
#define GSN_BUFFER_HPP_

#include <pthread.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <deque>
#include <optional>
#include <stdexcept>
#include <vector>

#include "gsn-proc.hpp"

namespace gsn {

template <typename T> class Gsn_Buffer {
public:
  Gsn_Buffer();
  virtual ~Gsn_Buffer() noexcept;

  Gsn_Buffer(const Gsn_Buffer<T> &obj) = delete;
  const Gsn_Buffer<T> &operator=(const Gsn_Buffer<T> &obj) = delete;
  Gsn_Buffer(Gsn_Buffer<T> &&obj) = delete;
  Gsn_Buffer<T> &operator=(Gsn_Buffer<T> &&obj) = delete;

  virtual auto pop() -> T;
  virtual auto pop(size_t count, long timeout = 0) -> std::vector<T>;
  virtual auto popNoWait() -> std::optional<T>;

  virtual void push(T &&item);

  /**
   * @brief Push an lvalue, moving from it when move is true (and T's move is
   *        noexcept), copying otherwise.
   */
  virtual void push(T &item, bool move = true);

  virtual auto waitForEmpty() -> size_t;

protected:
  virtual auto popOptional(bool wait) -> std::optional<T>;

private:
  void lock();
  void unlock();
  void signal(pthread_cond_t *cond);

  std::deque<T> m_queue{};
  pthread_mutex_t m_mutex{};
  pthread_cond_t m_cond{};       // single item pop waiters
  pthread_cond_t m_empty_cond{}; // waitForEmpty() waiters
  pthread_cond_t m_none_empty_cond{}; // pop(count, timeout) waiters
  size_t m_push_count{};
  size_t m_pop_count{};
}; // class Gsn_Buffer

template <typename T> Gsn_Buffer<T>::Gsn_Buffer() {
  int err{};

  err = pthread_mutex_init(&m_mutex, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }

  err = pthread_cond_init(&m_cond, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }

  err = pthread_cond_init(&m_empty_cond, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }

  err = pthread_cond_init(&m_none_empty_cond, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> Gsn_Buffer<T>::~Gsn_Buffer() noexcept try {
  pthread_cond_signal(&m_cond);
  pthread_cond_signal(&m_empty_cond);
  pthread_cond_signal(&m_none_empty_cond);

  pthread_cond_destroy(&m_none_empty_cond);
  pthread_cond_destroy(&m_empty_cond);
  pthread_cond_destroy(&m_cond);
  pthread_mutex_destroy(&m_mutex);
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

template <typename T> void Gsn_Buffer<T>::lock() {
  int err = pthread_mutex_lock(&m_mutex);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> void Gsn_Buffer<T>::unlock() {
  int err = pthread_mutex_unlock(&m_mutex);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

// called with m_mutex held inside a cleanup region, the cleanup handler
// releases m_mutex if the exception propagates
template <typename T> void Gsn_Buffer<T>::signal(pthread_cond_t *cond) {
  int err = pthread_cond_broadcast(cond);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> auto Gsn_Buffer<T>::pop() -> T {
  return *popOptional(true);
}

template <typename T> auto Gsn_Buffer<T>::popNoWait() -> std::optional<T> {
  return popOptional(false);
}

template <typename T> void Gsn_Buffer<T>::push(T &&item) {
  T moved_item = std::move_if_noexcept(item);

  push(moved_item, true);
}

template <typename T> void Gsn_Buffer<T>::push(T &item, bool move) {
  lock();

  GSN_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  pthread_testcancel();

  if (move) {
    m_queue.push_back(std::move_if_noexcept(item));
  } else {
    m_queue.push_back(item);
  }

  ++m_push_count;

  signal(&m_none_empty_cond);
  signal(&m_cond);

  GSN_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();
}

template <typename T> auto Gsn_Buffer<T>::waitForEmpty() -> size_t {
  int err{};
  size_t inbound_count{};

  lock();

  GSN_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  pthread_testcancel();

  while (!m_queue.empty()) {
    err = pthread_cond_wait(&m_empty_cond, &m_mutex);
    if (err) {
      throw std::runtime_error(strerror(err));
    }

    pthread_testcancel();
  }

  inbound_count = m_pop_count;

  GSN_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return inbound_count;
}

template <typename T>
auto Gsn_Buffer<T>::pop(size_t count, long timeout) -> std::vector<T> {
  struct timespec timeout_ts{};
  std::vector<T> ret{};
  int err{};

  if (0 == count) {
    throw std::invalid_argument("Gsn_Buffer::pop count must be positive");
  }

  lock();

  GSN_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  pthread_testcancel();

  while (m_queue.size() < count) {
    if (timeout > 0) {
      if (0 == timeout_ts.tv_sec) {
        clock_gettime(CLOCK_REALTIME, &timeout_ts);

        timeout_ts.tv_sec += (timeout / 1000000L);
        timeout_ts.tv_nsec += (timeout % 1000000L) * 1000L;

        if (timeout_ts.tv_nsec >= 1000000000L) {
          timeout_ts.tv_sec += 1;
          timeout_ts.tv_nsec -= 1000000000L;
        }
      }

      err = pthread_cond_timedwait(&m_none_empty_cond, &m_mutex, &timeout_ts);
    } else {
      err = pthread_cond_wait(&m_none_empty_cond, &m_mutex);
    }

    if (err) {
      if (err != ETIMEDOUT) {
        throw std::runtime_error(strerror(err));
      }

      if (!m_queue.empty()) {
        break;
      }

      // nothing arrived, re-arm the deadline
      timeout_ts.tv_sec = 0;
      timeout_ts.tv_nsec = 0;
    }

    pthread_testcancel();
  }

  do {
    ret.push_back(std::move_if_noexcept(m_queue.front()));
    m_queue.pop_front();
    ++m_pop_count;

    count--;
  } while (count > 0 && (!m_queue.empty()));

  if (m_queue.empty()) {
    signal(&m_empty_cond);
  }

  GSN_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return ret;
}

template <typename T>
auto Gsn_Buffer<T>::popOptional(bool wait) -> std::optional<T> {
  std::optional<T> val{};
  int err{};

  lock();

  GSN_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  pthread_testcancel();

  while (wait && m_queue.empty()) {
    err = pthread_cond_wait(&m_cond, &m_mutex);
    if (err) {
      throw std::runtime_error(strerror(err));
    }

    pthread_testcancel();
  }

  if (!m_queue.empty()) {
    val = std::move_if_noexcept(m_queue.front());
    m_queue.pop_front();

    ++m_pop_count;

    if (m_queue.empty()) {
      signal(&m_empty_cond);
    }
  }

  GSN_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return val;
} // method popOptional()

} // namespace gsn

#endif // GSN_BUFFER_HPP_
