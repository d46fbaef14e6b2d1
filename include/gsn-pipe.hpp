/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-pipe.hpp
 * @brief Gsn_Pipe: FIFO with non-blocking writers and an optional consumer
 *        thread.
 *
 * Gsn_Pipe<T> combines Gsn_Buffer<T> (storage), Gsn_Io<T> (interface) and
 * Gsn_Proc (consumer thread):
 * - Constructed with a task, it starts a thread that pops items and passes
 *   each one to the task, in FIFO order, one at a time. Gsn_Async is built on
 *   this mode.
 * - Constructed without a task, it is a passive queue read with read(); the
 *   node tests use it as an in-memory transport between nodes.
 *
 * waitForEmpty() blocks until every item written before the call has been
 * popped and fully processed by the consumer, which is what tests use to
 * reach a quiescent point.
 */

#ifndef GSN_PIPE_HPP_
#define GSN_PIPE_HPP_

#include <pthread.h>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "gsn-buffer.hpp"
#include "gsn-io.hpp"
#include "gsn-proc.hpp"

namespace gsn {

template <typename T>
class Gsn_Pipe : public Gsn_Buffer<T>, public Gsn_Io<T>, public Gsn_Proc {
  using Task = std::function<void(T &&)>;

public:
  explicit Gsn_Pipe(std::string_view name, Gsn_Pipe::Task fn = {},
                    size_t count = 1, long timeout = 0);

  virtual ~Gsn_Pipe() noexcept;

  Gsn_Pipe(const Gsn_Pipe<T> &obj) = delete;
  const Gsn_Pipe<T> &operator=(const Gsn_Pipe<T> &obj) = delete;
  Gsn_Pipe(Gsn_Pipe<T> &&obj) = delete;
  Gsn_Pipe<T> &operator=(Gsn_Pipe<T> &&obj) = delete;

  auto read() -> std::optional<T> override;

  /**
   * @brief Read count items, or 1..count items once timeout microseconds
   *        have elapsed (see Gsn_Buffer::pop(count, timeout)).
   */
  auto read(size_t count, long timeout = 0) -> std::vector<T> override;

  /**
   * @brief Pop the next item(s) and invoke fn with each one. Processing is
   *        accounted under m_mutex so that waitForEmpty() only returns once
   *        fn has finished with every popped item.
   */
  void readAndProcess(Gsn_Pipe::Task fn, size_t count = 1, long timeout = 0);

  void write(T &item) override;
  void write(T &&item) override;

  auto waitForEmpty() -> size_t override;

private:
  using Gsn_Buffer<T>::pop;
  using Gsn_Buffer<T>::popNoWait;
  using Gsn_Buffer<T>::push;

  std::mutex m_mutex{};
  std::condition_variable m_empty_cond{};
  size_t m_count{};
}; // class Gsn_Pipe

template <typename T>
Gsn_Pipe<T>::Gsn_Pipe(std::string_view name, Gsn_Pipe::Task fn, size_t count,
                      long timeout)
    : Gsn_Proc{name} {
  if (fn) {
    exec([this, fn, count, timeout]() {
      while (true) {
        readAndProcess(fn, count, timeout);
      }
    });
  }
}

template <typename T> Gsn_Pipe<T>::~Gsn_Pipe() noexcept try {
  Gsn_Proc::stopExec();

  m_empty_cond.notify_all();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

template <typename T> auto Gsn_Pipe<T>::read() -> std::optional<T> {
  std::optional<T> data{};

  readAndProcess([&data](T &&item) { data = std::move_if_noexcept(item); });

  return data;
}

template <typename T>
auto Gsn_Pipe<T>::read(size_t count, long timeout) -> std::vector<T> {
  std::vector<T> data_list{};

  readAndProcess(
      [&data_list](T &&item) {
        data_list.push_back(std::move_if_noexcept(item));
      },
      count, timeout);

  return data_list;
}

template <typename T>
void Gsn_Pipe<T>::readAndProcess(Gsn_Pipe::Task fn, size_t count,
                                 long timeout) {
  auto data_list = this->pop(count, timeout);

  pthread_testcancel();

  std::unique_lock lock{m_mutex};

  for (auto &item : data_list) {
    fn(std::move_if_noexcept(item));
    ++m_count;
  }

  lock.unlock();

  m_empty_cond.notify_all();

  pthread_testcancel();
}

template <typename T> void Gsn_Pipe<T>::write(T &item) {
  Gsn_Buffer<T>::push(item, false);
}

template <typename T> void Gsn_Pipe<T>::write(T &&item) {
  Gsn_Buffer<T>::push(item, true);
}

template <typename T> auto Gsn_Pipe<T>::waitForEmpty() -> size_t {
  size_t inbound_count = Gsn_Buffer<T>::waitForEmpty();

  std::unique_lock lock{m_mutex};

  pthread_testcancel();

  m_empty_cond.wait(lock,
                    [this, inbound_count] { return m_count >= inbound_count; });

  lock.unlock();

  pthread_testcancel();

  return inbound_count;
}

} // namespace gsn

#endif // GSN_PIPE_HPP_
